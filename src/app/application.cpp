/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/application.hpp"

#include <format>
#include <memory>
#include <print>
#include <string_view>

#include "include/color.hpp"
#include "include/config.hpp"
#include "include/file_signatures.hpp"
#include "include/file_validator.hpp"
#include "include/interrupts.hpp"
#include "include/malware_scanner.hpp"
#include "include/utils.hpp"

namespace fs = std::filesystem;
using namespace fileguard;

namespace {

std::vector<std::string> all_known_types() {
    std::vector<std::string> types;
    for (const auto& def : core::file_definitions()) {
        types.push_back(def.extension);
    }
    return types;
}

void report(const fs::path& path, const std::expected<void, core::ValidationError>& result) {
    if (result) {
        std::println("{}: {}", path.string(), Color::colorize("OK", Color::GREEN));
        return;
    }

    const auto& err = result.error();
    std::println("{}: {} {}: {}",
                 path.string(),
                 Color::colorize("REJECTED:", Color::RED),
                 core::error_string(err.kind),
                 err.message);
}

}  // namespace

std::expected<CliOptions, std::string> parse_arguments(int argc, char* argv[]) {
    CliOptions opts;

    auto value_of = [&](int& i, std::string_view flag) -> std::expected<std::string, std::string> {
        if (i + 1 >= argc) {
            return std::unexpected(std::format("Option '{}' requires a value", flag));
        }
        return std::string(argv[++i]);
    };

    bool only_files = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (only_files || !arg.starts_with('-') || arg == "-") {
            opts.files.emplace_back(arg);
            continue;
        }

        if (arg == "--") {
            only_files = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            opts.show_version = true;
        } else if (arg == "-c" || arg == "--config") {
            auto v = value_of(i, arg);
            if (!v)
                return std::unexpected(v.error());
            opts.config_path = *v;
        } else if (arg == "-t" || arg == "--types") {
            auto v = value_of(i, arg);
            if (!v)
                return std::unexpected(v.error());
            for (auto& type : split_list(*v)) {
                opts.file_types.push_back(type.starts_with('.') ? type : "." + type);
            }
        } else if (arg == "-s" || arg == "--max-size") {
            auto v = value_of(i, arg);
            if (!v)
                return std::unexpected(v.error());
            opts.max_size = *v;
        } else if (arg == "--no-preflight") {
            opts.no_preflight = true;
        } else if (arg == "--max-entries") {
            auto v = value_of(i, arg);
            if (!v)
                return std::unexpected(v.error());
            auto n = parse_number<std::int64_t>(*v);
            if (!n)
                return std::unexpected(std::format("Invalid entry count '{}'", *v));
            opts.max_entries = *n;
        } else if (arg == "--max-ratio") {
            auto v = value_of(i, arg);
            if (!v)
                return std::unexpected(v.error());
            auto r = parse_number<double>(*v);
            if (!r)
                return std::unexpected(std::format("Invalid compression ratio '{}'", *v));
            opts.max_ratio = *r;
        } else if (arg == "--allow-suspicious-paths") {
            opts.allow_suspicious_paths = true;
        } else if (arg == "--deny-hashes") {
            auto v = value_of(i, arg);
            if (!v)
                return std::unexpected(v.error());
            opts.deny_hashes = *v;
        } else if (arg == "--clamscan") {
            opts.clamscan = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--no-color") {
            opts.no_color = true;
        } else {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        }
    }

    if (opts.deny_hashes && opts.clamscan) {
        return std::unexpected("Options '--deny-hashes' and '--clamscan' are mutually exclusive");
    }
    return opts;
}

core::FileValidatorConfig make_config(const CliOptions& options) {
    core::FileValidatorConfig base;
    if (options.config_path) {
        auto loaded = core::load_config_file(*options.config_path);
        if (!loaded) {
            throw core::ConfigurationError(loaded.error());
        }
        base = std::move(*loaded);
    } else {
        base.supported_file_types = all_known_types();
    }

    if (!options.file_types.empty()) {
        base.supported_file_types = options.file_types;
    }

    core::PreflightConfig preflight = base.preflight;
    if (options.no_preflight)
        preflight.enabled = false;
    if (options.max_entries)
        preflight.max_entries = core::Limit<std::int64_t>::from_raw(*options.max_entries);
    if (options.max_ratio)
        preflight.compression_rate_limit = core::Limit<double>::from_raw(*options.max_ratio);
    if (options.allow_suspicious_paths)
        preflight.reject_suspicious_paths = false;

    core::ConfigBuilder builder;
    builder.allow_file_types(base.supported_file_types)
        .throw_on_invalid_files(false)
        .set_file_size_limit(base.file_size_limit)
        .set_preflight(preflight);

    if (options.max_size) {
        builder.set_file_size_limit(*options.max_size);
    }

    if (options.deny_hashes) {
        auto scanner = scan::HashDenyListScanner::load(*options.deny_hashes);
        if (!scanner) {
            throw core::ConfigurationError(
                core::ConfigError{core::ConfigErrorKind::InvalidFormat, scanner.error()});
        }
        builder.add_malware_scanner(std::make_shared<scan::HashDenyListScanner>(std::move(*scanner)));
    } else if (options.clamscan) {
        builder.add_malware_scanner(std::make_shared<scan::ClamScanScanner>());
    }

    return builder.build();
}

void Application::show_help(const std::string& app_name) const {
    std::println("Usage: {} [options] <file>...", app_name);
    std::println("");
    std::println("Options:");
    std::println("  -c, --config <file>         Load settings from a JSON configuration file");
    std::println("  -t, --types <list>          Allowed file types, e.g. .pdf,.docx");
    std::println("  -s, --max-size <size>       Maximum file size, e.g. \"25 MB\"");
    std::println("      --no-preflight          Skip ZIP preflight for archive-backed documents");
    std::println("      --max-entries <n|-1>    Maximum ZIP entries (-1 for no limit)");
    std::println("      --max-ratio <r|-1>      Maximum per-entry compression ratio (-1 for no limit)");
    std::println("      --allow-suspicious-paths  Accept absolute or traversing entry names");
    std::println("      --deny-hashes <file>    Reject files whose SHA-256 is listed in <file>");
    std::println("      --clamscan              Scan files with ClamAV's clamscan");
    std::println("      --verbose               Print every validation stage to stderr");
    std::println("      --no-color              Disable coloured output");
    std::println("  -h, --help                  Show this help message");
    std::println("  -v, --version               Show version information");
    std::println("");
    std::println("Exit status: 0 all files valid, 1 a file was rejected, 2 usage error.");
}

void Application::show_version() const {
    std::println("{} v{}", Config::APP_NAME, Config::APP_VERSION);
    std::println("Copyright (c) 2025 Alfie Ardinata");
    std::println("Licensed under the Mozilla Public License 2.0");
}

int Application::run(int argc, char* argv[]) {
    std::string app_name{Config::APP_NAME};
    if (argc > 0) {
        app_name = fs::path(argv[0]).filename().string();
        if (app_name.empty())
            app_name = Config::APP_NAME;
    }

    auto options = parse_arguments(argc, argv);
    if (!options) {
        std::println(stderr, "{} {}", Color::colorize("Error:", Color::RED), options.error());
        show_help(app_name);
        return ExitCode::USAGE;
    }

    if (options->no_color) {
        Color::set_enabled(false);
    }
    if (options->show_help) {
        show_help(app_name);
        return ExitCode::OK;
    }
    if (options->show_version) {
        show_version();
        return ExitCode::OK;
    }
    if (options->files.empty()) {
        std::println(stderr, "{} No files given", Color::colorize("Error:", Color::RED));
        show_help(app_name);
        return ExitCode::USAGE;
    }

    std::unique_ptr<core::FileValidator> validator;
    try {
        validator = std::make_unique<core::FileValidator>(make_config(*options));
    } catch (const core::ConfigurationError& e) {
        std::println(stderr,
                     "{}: {}",
                     Color::colorize("Configuration Error", Color::RED),
                     e.what());
        return ExitCode::USAGE;
    }

    if (options->verbose) {
        const auto& cfg = validator->config();
        std::println(stderr,
                     " {:<{}} : {}",
                     "Types",
                     Config::APP_INFO_LABEL_WIDTH,
                     cfg.supported_file_types.size());
        std::println(stderr,
                     " {:<{}} : {}",
                     "Size limit",
                     Config::APP_INFO_LABEL_WIDTH,
                     format_bytes(static_cast<std::uint64_t>(cfg.file_size_limit)));
        std::println(stderr,
                     " {:<{}} : {}",
                     "Preflight",
                     Config::APP_INFO_LABEL_WIDTH,
                     cfg.preflight.enabled ? "enabled" : "disabled");
        std::println(stderr,
                     " {:<{}} : {}",
                     "Scanner",
                     Config::APP_INFO_LABEL_WIDTH,
                     cfg.scanner ? cfg.scanner->name() : "none");

        validator->set_stage_observer(
            [](core::Stage stage, const std::expected<void, core::ValidationError>& result) {
                std::println(stderr,
                             "   {:<20} {}",
                             core::to_string(stage),
                             result ? Color::colorize("pass", Color::GREEN)
                                    : Color::colorize("fail", Color::RED));
            });
    }

    SignalGuard signal_guard;
    int exit_code = ExitCode::OK;

    try {
        for (const auto& file : options->files) {
            check_interrupted();

            if (options->verbose) {
                std::println(stderr, " -> {}", Color::colorize(file.string(), Color::BOLD));
            }

            auto result = validator->validate(file);
            report(file, result);
            if (!result) {
                exit_code = ExitCode::REJECTED;
            }
        }
    } catch (const InterruptedError& e) {
        std::println(stderr, "\n{}", Color::colorize(e.what(), Color::YELLOW));
        return ExitCode::INTERRUPTED;
    }

    return exit_code;
}
