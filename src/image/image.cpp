#include "image.hpp"
#include "lib.hpp"
#include "utils.hpp"

#include <spdlog/spdlog.h>

void Image::Initialize() {
    FreeImage_Initialise();
    FreeImage_SetOutputMessage([](FREE_IMAGE_FORMAT fif, const char *msg) {
        spdlog::error("FreeImage ({}): {}", fif == FIF_UNKNOWN ? "unknown" : FreeImage_GetFormatFromFIF(fif), msg);
    });
}

void Image::EnsureValid(const fs::path &srcPath) {
    if (!fs::exists(srcPath)) {
        throw icongen::FileError(srcPath, "File not found", icongen::ErrorKind::NotFound);
    }
    if (!IsImageValid(srcPath)) {
        throw icongen::FileError(srcPath, "Invalid image format or unsupported file type",
                                 icongen::ErrorKind::UnsupportedFormat);
    }
}

fipImage Image::Load(const fs::path &srcPath) {
    EnsureValid(srcPath);

    fipImage img;
    if (!LoadFipImage(img, srcPath)) {
        throw icongen::FileError(srcPath, "Failed to load image");
    }
    spdlog::debug("Loaded {} ({}x{}, {}bpp)", srcPath.filename().string(), img.getWidth(), img.getHeight(),
                  img.getBitsPerPixel());
    return img;
}

bool Image::HasAlpha(const fipImage &img) {
    switch (img.getImageType()) {
    case FIT_BITMAP:
        if (img.getBitsPerPixel() == 32) {
            return true;
        }
        // palette or grayscale with a transparency table
        return img.getBitsPerPixel() <= 8 && img.isTransparent();
    case FIT_RGBA16:
        return true;
    default:
        return false;
    }
}

std::vector<std::pair<unsigned, unsigned> > Image::ReadIcoFrameSizes(const fs::path &srcPath) {
    if (!fs::exists(srcPath)) {
        throw icongen::FileError(srcPath, "File not found", icongen::ErrorKind::NotFound);
    }
    if (GetFreeImageFormat(srcPath) != FIF_ICO) {
        throw icongen::FileError(srcPath, "Not an ICO file", icongen::ErrorKind::UnsupportedFormat);
    }

    FIMULTIBITMAP *ico = FreeImage_OpenMultiBitmap(FIF_ICO, str(srcPath).c_str(), FALSE, TRUE, TRUE, 0);
    if (ico == nullptr) {
        throw icongen::FileError(srcPath, "Failed to open ICO file");
    }

    // sizes come from the decoded frames, so a directory entry of 0 reads back as 256
    std::vector<std::pair<unsigned, unsigned> > sizes;
    const int count = FreeImage_GetPageCount(ico);
    sizes.reserve(count > 0 ? count : 0);
    for (int i = 0; i < count; ++i) {
        FIBITMAP *frame = FreeImage_LockPage(ico, i);
        if (frame == nullptr) {
            FreeImage_CloseMultiBitmap(ico, 0);
            throw icongen::FileError(srcPath, fmt::format("Failed to decode ICO frame {}", i),
                                     icongen::ErrorKind::UnsupportedFormat);
        }
        sizes.emplace_back(FreeImage_GetWidth(frame), FreeImage_GetHeight(frame));
        FreeImage_UnlockPage(ico, frame, FALSE);
    }
    FreeImage_CloseMultiBitmap(ico, 0);
    return sizes;
}
