/**
 * @file Cli.cpp
 * @brief Implementation of command-line parsing
 */

#include "dedupe/Cli.hpp"
#include "dedupe/Errors.hpp"

#include <cxxopts.hpp>
#include <exception>
#include <vector>

namespace dedupe {

namespace {
    cxxopts::Options make_options() {
        cxxopts::Options options("dedupe",
            "Extract common values from YAML/JSON/TOML files, or remove values found in reference files");
        options.positional_help("[FILE...]");

        options.add_options()
            ("f,files", "Files to process (e.g. values-dev.yml,values-prod.yml)",
                cxxopts::value<std::vector<std::string>>())
            ("c,common", "File to store common values. Mutually exclusive with --reference",
                cxxopts::value<std::string>())
            ("r,reference", "Reference file(s) whose keys are removed from the files. "
                            "Repeat the option or separate with commas. "
                            "Mutually exclusive with --common",
                cxxopts::value<std::vector<std::string>>())
            ("n,dry-run", "Show changes without modifying files")
            ("b,backup", "Create a .bak copy of each file before changing it")
            ("no-log", "Disable logging")
            ("h,help", "Show help");

        // Trailing arguments are more files
        options.add_options()
            ("positional", "Files", cxxopts::value<std::vector<std::string>>());
        options.parse_positional({"positional"});
        return options;
    }

    cxxopts::ParseResult parse_or_throw(cxxopts::Options& options, int argc,
                                        const char* const* argv) {
        try {
            return options.parse(argc, argv);
        } catch (const std::exception& e) {
            throw ConfigurationError(e.what());
        }
    }
} // namespace

CommandLine parse_command_line(int argc, const char* const* argv) {
    auto options = make_options();

    const auto result = parse_or_throw(options, argc, argv);

    CommandLine cli;
    if (result.count("help")) {
        cli.help = true;
        return cli;
    }

    ProcessorOptions& opts = cli.options;
    if (result.count("files")) {
        opts.files = result["files"].as<std::vector<std::string>>();
    }
    if (result.count("reference")) {
        opts.reference_files = result["reference"].as<std::vector<std::string>>();
    }
    if (result.count("positional")) {
        const auto extra = result["positional"].as<std::vector<std::string>>();
        if (opts.reference_files) {
            throw ConfigurationError(
                "unexpected argument '" + extra.front() + "' with --reference; "
                "repeat --reference for each file or separate them with commas");
        }
        opts.files.insert(opts.files.end(), extra.begin(), extra.end());
    }
    if (opts.files.empty()) {
        throw ConfigurationError("--files is required");
    }
    if (result.count("common")) {
        opts.common_file = result["common"].as<std::string>();
    }
    opts.dry_run = result.count("dry-run") > 0;
    opts.backup = result.count("backup") > 0;
    cli.quiet = result.count("no-log") > 0;
    return cli;
}

std::string usage() {
    return make_options().help({""});
}

} // namespace dedupe
