#include "asset.hpp"
#include "image/image.hpp"
#include "lib.hpp"

#include <algorithm>
#include <atomic>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace Asset {

size_t RunReport::Count(const Status state) const {
    return static_cast<size_t>(
        std::count_if(Results.begin(), Results.end(), [state](const AssetResult &r) { return r.State == state; }));
}

bool RunReport::Ok() const {
    return Count(Status::Failed) == 0 && (!SourceError || *SourceError == icongen::ErrorKind::NotFound);
}

std::vector<AssetSpec> LogoAssets(const OverwritePolicy policy, const bool previews) {
    using Image::Format;

    std::vector<AssetSpec> specs = {
        {std::string(FAVICON_16), Format::Png, FAVICON_16_SIZE, {}, true, policy},
        {std::string(FAVICON_32), Format::Png, FAVICON_32_SIZE, {}, true, policy},
        {std::string(APPLE_TOUCH_ICON), Format::Png, APPLE_TOUCH_ICON_SIZE, {}, true, policy},
        {std::string(FAVICON_ICO), Format::Ico, std::nullopt,
         std::vector<unsigned>(std::begin(FAVICON_ICO_SIZES), std::end(FAVICON_ICO_SIZES)), true, policy},
    };

    if (previews) {
        specs.push_back({std::string(PREVIEW_PNG), Format::Png, std::nullopt, {}, true, policy});
        specs.push_back({std::string(PREVIEW_JPG), Format::Jpeg, std::nullopt, {}, false, policy});
        specs.push_back({std::string(PREVIEW_WEBP), Format::Webp, std::nullopt, {}, true, policy});
    }
    return specs;
}

AssetSpec IcoAsset(std::string outputName, const unsigned size, const OverwritePolicy policy) {
    return {std::move(outputName), Image::Format::Ico, std::nullopt, {size}, true, policy};
}

std::optional<AssetResult> SkipExisting(const AssetSpec &spec, const fs::path &dstFolder) {
    if (spec.Policy != OverwritePolicy::SkipIfExists) {
        return std::nullopt;
    }

    if (!fs::exists(dstFolder / spec.OutputName)) {
        return std::nullopt;
    }

    spdlog::info("(SKIP) '{}' already exists.", spec.OutputName);
    return AssetResult{spec.OutputName, Status::Skipped, std::nullopt, "already exists"};
}

static AssetResult Failure(const std::string &name, const icongen::ErrorKind kind, const char *what) {
    spdlog::error("[{}] Failed to generate '{}': {}", icongen::ToString(kind), name, what);
    return {name, Status::Failed, kind, what};
}

AssetResult Generate(const fipImage &source, const AssetSpec &spec, const fs::path &dstFolder) {
    try {
        if (auto skipped = SkipExisting(spec, dstFolder)) {
            return *skipped;
        }

        const auto dstPath = dstFolder / spec.OutputName;
        if (spec.PreserveAlpha && !Image::SupportsAlpha(spec.Format)) {
            throw icongen::FileError(dstPath, "Format cannot preserve transparency",
                                     icongen::ErrorKind::UnsupportedFormat);
        }

        auto img = Image::NormalizeAlpha(source, spec.PreserveAlpha);

        std::string detail;
        if (spec.Format == Image::Format::Ico) {
            Image::SaveIco(img, dstPath, spec.IcoSizes);
            detail = fmt::format("{} frame(s)", spec.IcoSizes.size());
        } else {
            if (spec.Dimensions) {
                img = Image::Resize(img, spec.Dimensions->Width, spec.Dimensions->Height);
            }
            Image::Save(img, dstPath, spec.Format);
            detail = fmt::format("{}x{}", img.getWidth(), img.getHeight());
        }

        spdlog::info("Generated: {} ({})", spec.OutputName, detail);
        return {spec.OutputName, Status::Generated, std::nullopt, detail};
    } catch (const icongen::FileError &e) {
        return Failure(spec.OutputName, e.kind(), e.what());
    } catch (const std::invalid_argument &e) {
        return Failure(spec.OutputName, icongen::ErrorKind::UnsupportedFormat, e.what());
    } catch (const std::exception &e) {
        return Failure(spec.OutputName, icongen::ErrorKind::IoFailure, e.what());
    }
}

std::vector<AssetResult> RunAll(const std::vector<Task> &tasks, const bool parallel, size_t workers) {
    std::vector<AssetResult> results(tasks.size());
    std::atomic<size_t> next{0};
    const auto drain = [&] {
        for (size_t i = next++; i < tasks.size(); i = next++) {
            results[i] = tasks[i]();
        }
    };

    if (!parallel || tasks.size() < 2) {
        drain();
        return results;
    }

    if (workers == 0) {
        workers = std::max(1u, std::thread::hardware_concurrency());
    }
    workers = std::min(workers, tasks.size());

    // the calling thread is one of the workers
    std::vector<std::thread> pool;
    pool.reserve(workers - 1);
    for (size_t i = 1; i < workers; ++i) {
        try {
            pool.emplace_back(drain);
        } catch (const std::system_error &e) {
            spdlog::warn("Running with {} worker(s), failed to start another: {}", pool.size() + 1, e.what());
            break;
        }
    }
    drain();
    for (auto &thread: pool) {
        thread.join();
    }
    return results;
}

void LogSummary(const RunReport &report) {
    const auto failed = report.Count(Status::Failed);
    if (failed > 0) {
        for (const auto &r: report.Results) {
            if (r.State == Status::Failed) {
                spdlog::warn("Failed: {} ({})", r.Name, r.Error ? icongen::ToString(*r.Error) : "unknown");
            }
        }
    }
    spdlog::info("Done: {} generated, {} skipped, {} failed.", report.Count(Status::Generated),
                 report.Count(Status::Skipped), failed);
}

} // namespace Asset
