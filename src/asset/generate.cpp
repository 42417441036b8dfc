#include "generate.hpp"
#include "asset.hpp"
#include "image/image.hpp"
#include "lib.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include <spdlog/spdlog.h>

namespace Asset {

std::optional<Mode> ParseSelection(std::string_view input) {
    while (!input.empty() && std::isspace(static_cast<unsigned char>(input.front()))) {
        input.remove_prefix(1);
    }
    while (!input.empty() && std::isspace(static_cast<unsigned char>(input.back()))) {
        input.remove_suffix(1);
    }

    if (input == "1") {
        return Mode::ConvertFolder;
    }
    if (input == "2") {
        return Mode::DeriveFromLogo;
    }
    return std::nullopt;
}

static std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](const unsigned char c) { return std::tolower(c); });
    return s;
}

std::vector<fs::path> ListSources(const fs::path &folder, const std::string_view extension) {
    if (!fs::is_directory(folder)) {
        throw icongen::FileError(folder, "Directory not found", icongen::ErrorKind::NotFound);
    }

    const auto wanted = ToLower(std::string(extension));
    std::vector<fs::path> sources;
    for (const auto &entry: fs::directory_iterator(folder)) {
        if (entry.is_regular_file() && ToLower(entry.path().extension().string()) == wanted) {
            sources.push_back(entry.path());
        }
    }
    std::sort(sources.begin(), sources.end());
    return sources;
}

RunReport ConvertFolder(const fs::path &folder, const unsigned size, const OverwritePolicy policy,
                        const bool parallel) {
    RunReport report;

    const auto sources = ListSources(folder);
    if (sources.empty()) {
        spdlog::info("No {} files found in {}.", SOURCE_EXTENSION, folder.string());
        return report;
    }

    std::vector<Task> tasks;
    tasks.reserve(sources.size());
    for (const auto &srcPath: sources) {
        auto dstName = srcPath.stem();
        dstName += Image::Extension(Image::Format::Ico);

        tasks.emplace_back([srcPath, &folder, spec = IcoAsset(dstName.string(), size, policy)]() -> AssetResult {
            try {
                if (auto skipped = SkipExisting(spec, folder)) {
                    return *skipped;
                }
                const auto img = Image::Load(srcPath);
                return Generate(img, spec, folder);
            } catch (const icongen::FileError &e) {
                spdlog::error("[{}] Failed to convert '{}': {}", icongen::ToString(e.kind()),
                              srcPath.filename().string(), e.what());
                return {spec.OutputName, Status::Failed, e.kind(), e.what()};
            } catch (const std::exception &e) {
                spdlog::error("Failed to convert '{}': {}", srcPath.filename().string(), e.what());
                return {spec.OutputName, Status::Failed, icongen::ErrorKind::IoFailure, e.what()};
            }
        });
    }

    report.Results = RunAll(tasks, parallel);
    return report;
}

RunReport DeriveFromLogo(const fs::path &folder, const fs::path &logoName, const OverwritePolicy policy,
                         const bool previews, const bool parallel) {
    RunReport report;
    const auto logoPath = folder / logoName;

    if (!fs::exists(logoPath)) {
        spdlog::error("[{}] '{}' not found in {}.", icongen::ToString(icongen::ErrorKind::NotFound),
                      logoName.string(), folder.string());
        report.SourceError = icongen::ErrorKind::NotFound;
        return report;
    }

    fipImage source;
    try {
        source = Image::Load(logoPath);
    } catch (const icongen::FileError &e) {
        spdlog::error("[{}] Failed to open '{}': {}", icongen::ToString(e.kind()), logoName.string(), e.what());
        report.SourceError = e.kind();
        return report;
    }

    const auto specs = LogoAssets(policy, previews);
    std::vector<Task> tasks;
    tasks.reserve(specs.size());
    for (const auto &spec: specs) {
        tasks.emplace_back([&source, &folder, &spec] { return Generate(source, spec, folder); });
    }

    report.Results = RunAll(tasks, parallel);
    return report;
}

} // namespace Asset
