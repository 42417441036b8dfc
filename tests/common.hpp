#pragma once

#ifdef WIN32
#define _CRTDBG_MAP_ALLOC
#include <stdlib.h>
#include <crtdbg.h>
#define CATCH_CONFIG_WINDOWS_CRTDBG
#endif

#include <catch2/catch_all.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <FreeImagePlus.h>

#include "lib.hpp"
#include "tests/asset.h"

inline fs::path GetPath(const std::wstring& filename, const std::wstring& subdir = L"") {
    auto base = fs::path(TEST_ASSET_DIR) / subdir;
    return filename.empty() ? base : base / filename;
}

inline fs::path GetInputPath(const std::wstring& filename = L"") {
    return GetPath(filename);
}

inline fs::path GetOutputPath(const std::wstring& filename = L"") {
    return GetPath(filename, L"tmp");
}

// Empty scratch directory per test case
inline fs::path FreshDir(const std::wstring& name) {
    const auto dir = GetOutputPath(name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline void Setup()
{
#ifdef WIN32
    _CrtSetDbgFlag(_CRTDBG_ALLOC_MEM_DF | _CRTDBG_LEAK_CHECK_DF);
#endif

    if (const fs::path tmp = GetOutputPath(); !fs::exists(tmp))
    {
        fs::create_directories(tmp);
    }
}

inline void WriteText(const fs::path& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary);
    file << text;
}

inline size_t CountFiles(const fs::path& dir) {
    size_t n = 0;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            ++n;
        }
    }
    return n;
}

// Horizontal alpha ramp over a red/blue gradient; column 0 is fully transparent.
inline fipImage MakeRgbaImage(const unsigned width, const unsigned height) {
    fipImage img(FIT_BITMAP, width, height, 32);
    for (unsigned y = 0; y < height; ++y) {
        for (unsigned x = 0; x < width; ++x) {
            RGBQUAD c{};
            c.rgbRed = static_cast<BYTE>(x * 255 / (width > 1 ? width - 1 : 1));
            c.rgbGreen = 0x40;
            c.rgbBlue = static_cast<BYTE>(y * 255 / (height > 1 ? height - 1 : 1));
            c.rgbReserved = static_cast<BYTE>(x * 255 / (width > 1 ? width - 1 : 1));
            img.setPixelColor(x, y, &c);
        }
    }
    return img;
}

inline fipImage MakeSolidImage(const unsigned width, const unsigned height, const unsigned bpp, const RGBQUAD color) {
    fipImage img(FIT_BITMAP, width, height, bpp);
    RGBQUAD c = color;
    for (unsigned y = 0; y < height; ++y) {
        for (unsigned x = 0; x < width; ++x) {
            img.setPixelColor(x, y, &c);
        }
    }
    return img;
}

// Two-entry palette, index 0 transparent.
inline fipImage MakePalettedImage(const unsigned width, const unsigned height) {
    fipImage img(FIT_BITMAP, width, height, 8);
    RGBQUAD* palette = img.getPalette();
    palette[0] = RGBQUAD{0x00, 0x00, 0x00, 0};
    palette[1] = RGBQUAD{0x00, 0x00, 0xFF, 0};

    BYTE table[2] = {0x00, 0xFF};
    img.setTransparencyTable(table, 2);

    for (unsigned y = 0; y < height; ++y) {
        for (unsigned x = 0; x < width; ++x) {
            BYTE index = x < width / 2 ? 0 : 1;
            img.setPixelIndex(x, y, &index);
        }
    }
    return img;
}

// Decoded frames of an ICO file, in file order.
inline std::vector<fipImage> LoadIcoFrames(const fs::path& path) {
    std::vector<fipImage> frames;
    FIMULTIBITMAP* ico = FreeImage_OpenMultiBitmap(FIF_ICO, path.string().c_str(), FALSE, TRUE, TRUE, 0);
    if (ico == nullptr) {
        return frames;
    }
    for (int i = 0; i < FreeImage_GetPageCount(ico); ++i) {
        FIBITMAP* page = FreeImage_LockPage(ico, i);
        if (page == nullptr) {
            continue;
        }
        fipImage frame;
        frame = FreeImage_Clone(page);
        frames.push_back(frame);
        FreeImage_UnlockPage(ico, page, FALSE);
    }
    FreeImage_CloseMultiBitmap(ico, 0);
    return frames;
}
