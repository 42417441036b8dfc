#include <fmt/format.h>
#include <stdexcept>
#include <vector>

#include "image.hpp"
#include "lib.hpp"
#include "utils.hpp"

#include <FreeImagePlus.h>
#include <spdlog/spdlog.h>

namespace Image {

fipImage NormalizeAlpha(fipImage img, const bool supportsAlpha) {
    if (!IsConvertibleType(img.getImageType())) {
        throw std::invalid_argument(
            fmt::format("Unsupported image type {} for color mode conversion", static_cast<int>(img.getImageType())));
    }

    // 16-bit types go through FreeImage's standard-type conversion first: UINT16 becomes
    // 8-bit grayscale, RGB16 24-bit and RGBA16 32-bit with its alpha kept
    if (img.getImageType() != FIT_BITMAP && !img.convertToType(FIT_BITMAP)) {
        throw std::runtime_error(
            fmt::format("Failed to convert image type {} to a standard bitmap", static_cast<int>(img.getImageType())));
    }

    if (supportsAlpha) {
        if (img.getBitsPerPixel() == 32) {
            return img;
        }
        // added alpha is opaque unless a transparency table says otherwise
        if (!img.convertTo32Bits()) {
            throw std::runtime_error("Failed to convert image to 32bpp");
        }
        return img;
    }

    if (img.getBitsPerPixel() == 24) {
        return img;
    }

    if (HasAlpha(img)) {
        if (img.getBitsPerPixel() != 32 && !img.convertTo32Bits()) {
            throw std::runtime_error("Failed to convert image to 32bpp before flattening");
        }
        RGBQUAD white{0xFF, 0xFF, 0xFF, 0};
        FIBITMAP *flat = FreeImage_Composite(img, FALSE, &white, nullptr);
        if (flat == nullptr) {
            throw std::runtime_error("Failed to composite image onto background");
        }
        img = flat;
        return img;
    }

    if (!img.convertTo24Bits()) {
        throw std::runtime_error("Failed to convert image to 24bpp");
    }
    return img;
}

fipImage Resize(const fipImage &img, const unsigned width, const unsigned height) {
    if (width == 0 || height == 0) {
        throw std::invalid_argument(fmt::format("Invalid target size {}x{}", width, height));
    }

    fipImage out(img);
    if (!out.rescale(width, height, FILTER_LANCZOS3)) {
        throw std::runtime_error(
            fmt::format("Failed to rescale image ({}x{} -> {}x{})", img.getWidth(), img.getHeight(), width, height));
    }
    return out;
}

void Save(fipImage &img, const fs::path &dstPath, const Format format) {
    if (format == Format::Ico) {
        SaveIco(img, dstPath, {img.getWidth()});
        return;
    }

    if (!SupportsAlpha(format) && HasAlpha(img)) {
        throw icongen::FileError(dstPath, fmt::format("{} cannot hold an alpha channel", Extension(format)),
                                 icongen::ErrorKind::UnsupportedFormat);
    }

    const auto fif = GetFreeImageFormat(format);
    if (!FreeImage_FIFSupportsWriting(fif) ||
        !FreeImage_FIFSupportsExportBPP(fif, static_cast<int>(img.getBitsPerPixel()))) {
        throw icongen::FileError(dstPath,
                                 fmt::format("Cannot encode {}bpp image as {}", img.getBitsPerPixel(),
                                             Extension(format)),
                                 icongen::ErrorKind::UnsupportedFormat);
    }

    const int flags = GetSaveFlags(format);
    WriteReplacing(dstPath, [&](const fs::path &tmpPath) {
        return SaveFipImage(img, fif, tmpPath, flags) == TRUE;
    });
}

void SaveIco(const fipImage &img, const fs::path &dstPath, const std::vector<unsigned> &sizes) {
    if (sizes.empty()) {
        throw icongen::FileError(dstPath, "ICO needs at least one frame size", icongen::ErrorKind::UnsupportedFormat);
    }
    for (const auto size: sizes) {
        if (size == 0 || size > ICO_MAX_SIDE) {
            throw icongen::FileError(dstPath, fmt::format("Invalid ICO frame size {}", size),
                                     icongen::ErrorKind::UnsupportedFormat);
        }
    }

    std::vector<fipImage> frames;
    frames.reserve(sizes.size());
    for (const auto size: sizes) {
        if (img.getWidth() == size && img.getHeight() == size) {
            frames.emplace_back(img);
        } else {
            frames.push_back(Resize(img, size, size));
        }
    }

    WriteReplacing(dstPath, [&](const fs::path &tmpPath) {
        // ".part" hides the extension, so the format is passed explicitly
        FIMULTIBITMAP *ico = FreeImage_OpenMultiBitmap(FIF_ICO, str(tmpPath).c_str(), TRUE, FALSE, TRUE, 0);
        if (ico == nullptr) {
            return false;
        }
        for (auto &frame: frames) {
            FreeImage_AppendPage(ico, frame);
        }
        return FreeImage_CloseMultiBitmap(ico, 0) == TRUE;
    });

    spdlog::debug("Wrote {} with {} frame(s)", dstPath.filename().string(), frames.size());
}

} // namespace Image
