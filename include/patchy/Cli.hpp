/**
 * @file Cli.hpp
 * @brief Command-line front end for computing and applying patches
 *
 * Commands:
 * - diff OLD NEW      Print the merge patch from OLD to NEW
 * - apply BASE PATCH  Print (or write with --out) BASE with PATCH applied
 * - check OLD NEW     Verify that applying diff(OLD, NEW) to OLD gives NEW
 *
 * Documents are .json or .toml files, or "-" for JSON on standard input.
 */

#ifndef PATCHY_CLI_HPP
#define PATCHY_CLI_HPP

#include <spdlog/spdlog.h>

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace patchy {

/// Environment variable consulted when --log-level is not given
inline constexpr const char* kLogLevelEnv = "PATCHY_LOG_LEVEL";

/**
 * @brief Parsed command line
 */
struct CliOptions {
    std::string command;
    std::vector<std::string> args;       // positional arguments after the command
    std::vector<std::string> include;    // forced dot-paths for diff/check
    std::optional<std::string> out;      // apply: output file
    int indent = -1;                     // -1 = compact
    std::string log_level = "warn";
    bool help = false;
    std::string help_text;
};

/**
 * @brief Parse argv into CliOptions
 *
 * The log level comes from --log-level, then PATCHY_LOG_LEVEL, then
 * defaults to "warn".
 *
 * @throws std::exception (cxxopts) on malformed options
 */
CliOptions parse_cli(int argc, char** argv);

/**
 * @brief Split a delimited list, dropping empty items and trimming spaces
 *
 * Example: split_list("id, profile.bio,", ',') → ["id", "profile.bio"]
 */
std::vector<std::string> split_list(const std::string& s, char delim);

/**
 * @brief Map a level name to an spdlog level
 *
 * Accepts trace, debug, info, warn, error, critical, off (any case).
 *
 * @throws PatchError on unknown names
 */
spdlog::level::level_enum parse_log_level(const std::string& name);

/**
 * @brief Execute a parsed command
 *
 * @param opts Parsed options (help must already be handled)
 * @param out Stream receiving the command's output
 * @return Process exit code (0 success, 1 check mismatch)
 * @throws PatchError and subclasses on bad arguments, missing files,
 *         parse errors
 */
int run_command(const CliOptions& opts, std::ostream& out);

} // namespace patchy

#endif // PATCHY_CLI_HPP
