/**
 * @file Cli.hpp
 * @brief Command-line parsing for the dedupe tool
 *
 * Trailing arguments are extra target files in common mode. In reference
 * mode they are rejected: cxxopts binds one value per --reference, so
 * "--reference a.yaml b.yaml" would otherwise turn b.yaml into a target.
 */

#ifndef DEDUPE_CLI_HPP
#define DEDUPE_CLI_HPP

#include "dedupe/Processor.hpp"

#include <string>

namespace dedupe {

/**
 * @brief Parsed command line.
 */
struct CommandLine {
    ProcessorOptions options;
    bool help = false;   // --help given; options are left empty
    bool quiet = false;  // --no-log
};

/**
 * @brief Parse argv into processor options
 *
 * @throws ConfigurationError on unknown options, missing --files, or
 *         trailing arguments combined with --reference
 */
CommandLine parse_command_line(int argc, const char* const* argv);

/**
 * @brief Help text listing all options
 */
std::string usage();

} // namespace dedupe

#endif // DEDUPE_CLI_HPP
