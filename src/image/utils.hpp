#pragma once

#include "image.hpp"
#include "lib.hpp"

#include <cstdint>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <FreeImagePlus.h>
#include <spdlog/spdlog.h>

namespace Image {

// Narrow path for FreeImage entry points without a U variant (the multipage API).
// On Windows these pass the string to the ANSI file functions, so the path is
// converted to the active code page; names outside it are not supported there.
inline std::string str(const fs::path &path) {
    return path.string();
}

inline std::vector<uint8_t> ReadFileData(const fs::path &path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw icongen::FileError(path, "Failed to open file", icongen::ErrorKind::NotFound);
    }

    const std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(size);
    if (!file.read(reinterpret_cast<char *>(buffer.data()), size)) {
        throw icongen::FileError(path, "Failed to read file");
    }
    return buffer;
}

// Detected from the file signature; the extension is not trusted.
inline FREE_IMAGE_FORMAT GetFreeImageFormat(const fs::path &path) {
#ifdef _WIN32
    return FreeImage_GetFileTypeU(path.c_str());
#else
    return FreeImage_GetFileType(path.c_str());
#endif
}

inline FREE_IMAGE_FORMAT GetFreeImageFormat(const Format format) {
    switch (format) {
    case Format::Png:
        return FIF_PNG;
    case Format::Jpeg:
        return FIF_JPEG;
    case Format::Webp:
        return FIF_WEBP;
    case Format::Ico:
        return FIF_ICO;
    }
    return FIF_UNKNOWN;
}

inline int GetSaveFlags(const Format format) {
    switch (format) {
    case Format::Jpeg:
    case Format::Webp:
        return ENCODE_QUALITY;
    default:
        return 0;
    }
}

inline bool LoadFipImage(fipImage &img, const fs::path &path) {
#ifdef _WIN32
    return img.loadU(path.c_str());
#else
    return img.load(path.c_str());
#endif
}

inline bool SaveFipImage(fipImage &img, const FREE_IMAGE_FORMAT fif, const fs::path &path, const int flags) {
#ifdef _WIN32
    return FreeImage_SaveU(fif, img, path.c_str(), flags);
#else
    return FreeImage_Save(fif, img, path.c_str(), flags);
#endif
}

inline bool IsImageValid(const fs::path &srcPath) {
    const auto fif = GetFreeImageFormat(srcPath);
    return fif != FIF_UNKNOWN && FreeImage_FIFSupportsReading(fif);
}

inline bool IsConvertibleType(const FREE_IMAGE_TYPE type) {
    return type == FIT_BITMAP || type == FIT_UINT16 || type == FIT_RGB16 || type == FIT_RGBA16;
}

// Encodes into "<dst>.part" and renames it over dstPath, so a failed encode never
// clobbers a previously valid file.
template <typename Writer>
void WriteReplacing(const fs::path &dstPath, Writer &&write) {
    auto tmpPath = dstPath;
    tmpPath += ".part";

    const auto discard = [&tmpPath] {
        std::error_code ec;
        fs::remove(tmpPath, ec);
        if (ec) {
            spdlog::warn("Failed to remove temporary file {}: {}", tmpPath.string(), ec.message());
        }
    };

    if (!write(tmpPath)) {
        discard();
        throw icongen::FileError(dstPath, "Failed to encode image");
    }

    std::error_code ec;
    fs::rename(tmpPath, dstPath, ec);
    if (ec) {
        discard();
        throw icongen::FileError(dstPath, fmt::format("Failed to replace file ({})", ec.message()));
    }
}

} // namespace Image
