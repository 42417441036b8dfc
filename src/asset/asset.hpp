#pragma once

#include "image/image.hpp"
#include "lib.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Asset {

enum class OverwritePolicy {
    SkipIfExists,
    AlwaysOverwrite,
};

struct Size {
    unsigned Width;
    unsigned Height;
};

struct AssetSpec {
    std::string OutputName;
    Image::Format Format;
    std::optional<Size> Dimensions; // empty keeps the source size
    std::vector<unsigned> IcoSizes; // ICO frames, side lengths
    bool PreserveAlpha;
    OverwritePolicy Policy;
};

enum class Status {
    Generated,
    Skipped,
    Failed,
};

struct AssetResult {
    std::string Name;
    Status State = Status::Failed;
    std::optional<icongen::ErrorKind> Error;
    std::string Message;
};

struct RunReport {
    std::vector<AssetResult> Results;
    std::optional<icongen::ErrorKind> SourceError; // set when the shared source could not be loaded

    [[nodiscard]] size_t Count(Status state) const;
    [[nodiscard]] bool Ok() const;
};

static constexpr std::string_view LOGO_FILENAME = "logo.png";
static constexpr std::string_view SOURCE_EXTENSION = ".webp";
static constexpr unsigned WEBP_TO_ICO_SIZE = 64;

static constexpr std::string_view FAVICON_16 = "favicon-16x16.png";
static constexpr Size FAVICON_16_SIZE = {16, 16};

static constexpr std::string_view FAVICON_32 = "favicon-32x32.png";
static constexpr Size FAVICON_32_SIZE = {32, 32};

static constexpr std::string_view APPLE_TOUCH_ICON = "apple-touch-icon.png";
static constexpr Size APPLE_TOUCH_ICON_SIZE = {180, 180};

static constexpr std::string_view FAVICON_ICO = "favicon.ico";
static constexpr unsigned FAVICON_ICO_SIZES[] = {16, 32, 48, 64};

static constexpr std::string_view PREVIEW_PNG = "preview.png";
static constexpr std::string_view PREVIEW_JPG = "preview.jpg";
static constexpr std::string_view PREVIEW_WEBP = "preview.webp";

std::vector<AssetSpec> LogoAssets(OverwritePolicy policy, bool previews = true);

AssetSpec IcoAsset(std::string outputName, unsigned size, OverwritePolicy policy);

// Returns the skip result when the policy keeps an existing destination.
std::optional<AssetResult> SkipExisting(const AssetSpec &spec, const fs::path &dstFolder);

// Never throws: failures come back as a Failed result.
AssetResult Generate(const fipImage &source, const AssetSpec &spec, const fs::path &dstFolder);

using Task = std::function<AssetResult()>;

// Runs the tasks on at most `workers` threads (0: one per hardware thread), results in task order.
// Tasks report failures in their result and must not throw.
std::vector<AssetResult> RunAll(const std::vector<Task> &tasks, bool parallel, size_t workers = 0);

void LogSummary(const RunReport &report);

} // namespace Asset
