#pragma once

#include "lib.hpp"

#include <string_view>
#include <utility>
#include <vector>

#include <FreeImagePlus.h>

namespace Image {

enum class Format {
    Png,
    Jpeg,
    Webp,
    Ico,
};

constexpr bool SupportsAlpha(const Format format) {
    return format != Format::Jpeg;
}

constexpr std::string_view Extension(const Format format) {
    switch (format) {
    case Format::Png:
        return ".png";
    case Format::Jpeg:
        return ".jpg";
    case Format::Webp:
        return ".webp";
    case Format::Ico:
        return ".ico";
    }
    return "";
}

// Lossy encoders use the same quality the favicon scripts always shipped with.
static constexpr int ENCODE_QUALITY = 95;

// Largest side an ICO directory entry can describe.
static constexpr unsigned ICO_MAX_SIDE = 256;

void Initialize();

void EnsureValid(const fs::path &srcPath);

fipImage Load(const fs::path &srcPath);

bool HasAlpha(const fipImage &img);

// Returns a 32bpp copy when the target keeps transparency, otherwise a 24bpp copy
// composited onto white.
fipImage NormalizeAlpha(fipImage img, bool supportsAlpha);

fipImage Resize(const fipImage &img, unsigned width, unsigned height);

void Save(fipImage &img, const fs::path &dstPath, Format format);

void SaveIco(const fipImage &img, const fs::path &dstPath, const std::vector<unsigned> &sizes);

std::vector<std::pair<unsigned, unsigned> > ReadIcoFrameSizes(const fs::path &srcPath);

} // namespace Image
