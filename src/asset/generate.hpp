#pragma once

#include "asset.hpp"
#include "lib.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace Asset {

enum class Mode {
    ConvertFolder,
    DeriveFromLogo,
};

std::optional<Mode> ParseSelection(std::string_view input);

std::vector<fs::path> ListSources(const fs::path &folder, std::string_view extension = SOURCE_EXTENSION);

RunReport ConvertFolder(const fs::path &folder, unsigned size = WEBP_TO_ICO_SIZE,
                        OverwritePolicy policy = OverwritePolicy::SkipIfExists, bool parallel = true);

RunReport DeriveFromLogo(const fs::path &folder, const fs::path &logoName = fs::path(LOGO_FILENAME),
                         OverwritePolicy policy = OverwritePolicy::AlwaysOverwrite, bool previews = true,
                         bool parallel = true);

} // namespace Asset
