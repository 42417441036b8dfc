#include "asset/asset.hpp"
#include "asset/generate.hpp"
#include "image/image.hpp"
#include "lib.hpp"

#include <CLI/CLI.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#define RET_OK 0
#define RET_ERROR 1

struct {
    fs::path dir = ".";
    bool sequential = false;
} global_opts;

struct {
    unsigned size = Asset::WEBP_TO_ICO_SIZE;
    bool overwrite = false;
} convert_webp_opts;

struct {
    fs::path logo = fs::path(Asset::LOGO_FILENAME);
    bool skip_existing = false;
    bool no_previews = false;
} derive_logo_opts;

struct {
    fs::path src;
} image_check_opts;

static spdlog::level::level_enum ParseLogLevel(const std::string &name) {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn")     return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    spdlog::warn("Unknown log level '{}', defaulting to 'info'.", name);
    return spdlog::level::info;
}

static int Finish(const Asset::RunReport &report) {
    Asset::LogSummary(report);
    return report.Ok() ? RET_OK : RET_ERROR;
}

static int RunConvertWebp() {
    const auto policy = convert_webp_opts.overwrite ? Asset::OverwritePolicy::AlwaysOverwrite
                                                    : Asset::OverwritePolicy::SkipIfExists;
    return Finish(Asset::ConvertFolder(global_opts.dir, convert_webp_opts.size, policy, !global_opts.sequential));
}

static int RunDeriveLogo() {
    const auto policy = derive_logo_opts.skip_existing ? Asset::OverwritePolicy::SkipIfExists
                                                       : Asset::OverwritePolicy::AlwaysOverwrite;
    return Finish(Asset::DeriveFromLogo(global_opts.dir, derive_logo_opts.logo, policy, !derive_logo_opts.no_previews,
                                        !global_opts.sequential));
}

static int RunMenu() {
    std::cout << "What would you like to do?" << std::endl;
    std::cout << "1) Convert ALL " << Asset::SOURCE_EXTENSION << " files to .ico (same base name)." << std::endl;
    std::cout << "2) Generate favicons, apple-touch-icon and previews from '" << derive_logo_opts.logo.string()
              << "'." << std::endl;
    std::cout << "Enter 1 or 2 and press [Enter]: " << std::flush;

    std::string input;
    std::getline(std::cin, input);

    const auto mode = Asset::ParseSelection(input);
    if (!mode) {
        spdlog::info("[{}] Invalid option '{}'. Exiting...", icongen::ToString(icongen::ErrorKind::InvalidSelection),
                     input);
        return RET_OK;
    }

    switch (*mode) {
    case Asset::Mode::ConvertFolder:
        return RunConvertWebp();
    case Asset::Mode::DeriveFromLogo:
        return RunDeriveLogo();
    }
    return RET_OK;
}

template <typename T>
int core(int argc, T **argv) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("icongen"));

    CLI::App app{"Generates favicons, touch icons and previews from a logo, or converts .webp files to .ico."};
    int ret = RET_OK;

    std::string log_level = "info";
    app.add_option("--loglevel", log_level, "(trace, debug, info, warn, error, critical, off)")
        ->default_val("info");
    app.add_option("--dir", global_opts.dir, "Directory holding the sources; outputs are written there too")
        ->default_val(".");
    app.add_flag("--sequential", global_opts.sequential, "Generate assets one after another");

    const auto subcmd_convert_webp =
        app.add_subcommand("convert_webp", "Convert every .webp in the directory to .ico")->fallthrough();
    subcmd_convert_webp->add_option("--size", convert_webp_opts.size, "ICO side length")
        ->default_val(Asset::WEBP_TO_ICO_SIZE)
        ->check(CLI::Range(1u, Image::ICO_MAX_SIDE));
    subcmd_convert_webp->add_flag("--overwrite", convert_webp_opts.overwrite, "Replace existing .ico files");

    const auto subcmd_derive_logo =
        app.add_subcommand("derive_logo", "Derive favicons and previews from the logo")->fallthrough();
    subcmd_derive_logo->add_option("-l,--logo", derive_logo_opts.logo, "Logo file name, relative to --dir");
    subcmd_derive_logo->add_flag("--skip-existing", derive_logo_opts.skip_existing, "Keep assets that already exist");
    subcmd_derive_logo->add_flag("--no-previews", derive_logo_opts.no_previews, "Only generate the icons");

    const auto subcmd_image_check = app.add_subcommand("image_check", "Image::EnsureValid")->fallthrough();
    subcmd_image_check->add_option("-s,--src", image_check_opts.src)->required();

    const auto subcmd_menu = app.add_subcommand("menu", "Ask which action to run (default)")->fallthrough();

    try {
        app.require_subcommand(0, 1);
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    spdlog::set_level(ParseLogLevel(log_level));

    Image::Initialize();
    try {
        if (subcmd_convert_webp->parsed()) {
            ret = RunConvertWebp();
        } else if (subcmd_derive_logo->parsed()) {
            ret = RunDeriveLogo();
        } else if (subcmd_image_check->parsed()) {
            Image::EnsureValid(image_check_opts.src);
            if (image_check_opts.src.extension().string() == Image::Extension(Image::Format::Ico)) {
                for (const auto &[w, h]: Image::ReadIcoFrameSizes(image_check_opts.src)) {
                    spdlog::info("ICO frame: {}x{}", w, h);
                }
            }
            spdlog::info("{} is a valid image.", image_check_opts.src.string());
        } else if (subcmd_menu->parsed() || app.get_subcommands().empty()) {
            ret = RunMenu();
        } else {
            throw std::runtime_error("No subcommand specified.");
        }
    } catch (const icongen::FileError &e) {
        spdlog::error("[{}] {}", icongen::ToString(e.kind()), e.what());
        ret = RET_ERROR;
    } catch (const std::exception &e) {
        spdlog::error("{}", e.what());
        ret = RET_ERROR;
    }
    FreeImage_DeInitialise();
    return ret;
}

#ifdef _WIN32
int wmain(const int argc, wchar_t **argv) {
    return core(argc, argv);
}
#else
int main(const int argc, char **argv) {
    return core(argc, argv);
}
#endif
