/**
 * @file Cli.cpp
 * @brief Command implementations behind the patchy executable
 */

#include "patchy/Cli.hpp"
#include "patchy/Diff.hpp"
#include "patchy/DotPath.hpp"
#include "patchy/Errors.hpp"
#include "patchy/Loader.hpp"
#include "patchy/Merge.hpp"
#include "patchy/Parse.hpp"
#include "patchy/Patch.hpp"

#include <cxxopts.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace patchy {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

void expect_args(const CliOptions& opts, size_t want, const char* usage) {
    if (opts.args.size() < want) {
        throw PatchError("insufficient arguments for '" + opts.command + "': expected " + usage);
    }
}

// Forced paths that name nothing in the new document are legal but usually typos
void warn_unknown_paths(const Value& doc, const std::vector<std::string>& paths) {
    for (const auto& p : paths) {
        try {
            if (!contains_dot(doc, p)) {
                spdlog::warn("forced path '{}' is not present in the new document", p);
            }
        } catch (const TypeError& e) {
            spdlog::warn("forced path '{}' does not resolve: {}", p, e.what());
        }
    }
}

// TOML admits nan and inf; dump_patch would write them as null (a delete)
Value load_checked(const std::string& path) {
    Value doc = load_document(path);
    ensure_representable(doc);
    return doc;
}

int cmd_diff(const CliOptions& opts, std::ostream& out) {
    expect_args(opts, 2, "OLD NEW");
    const Value old_doc = load_checked(opts.args[0]);
    const Value new_doc = load_checked(opts.args[1]);

    warn_unknown_paths(new_doc, opts.include);
    const Value patch = diff_including(old_doc, new_doc, opts.include);
    out << dump_patch(patch, opts.indent) << "\n";
    return 0;
}

int cmd_apply(const CliOptions& opts, std::ostream& out) {
    expect_args(opts, 2, "BASE PATCH");
    Value doc = load_checked(opts.args[0]);
    const Value patch = load_checked(opts.args[1]);

    merge_patch(doc, patch);
    const std::string text = dump_patch(doc, opts.indent);

    if (opts.out) {
        std::ofstream ofs(*opts.out);
        if (!ofs) {
            throw PatchError("cannot write to " + *opts.out);
        }
        ofs << text << "\n";
        spdlog::info("wrote patched document to {}", *opts.out);
    } else {
        out << text << "\n";
    }
    return 0;
}

int cmd_check(const CliOptions& opts, std::ostream& out) {
    expect_args(opts, 2, "OLD NEW");
    const Value old_doc = load_checked(opts.args[0]);
    const Value new_doc = load_checked(opts.args[1]);

    const Value patch = diff_including(old_doc, new_doc, opts.include);
    const Value result = merged(old_doc, parse_patch(dump_patch(patch)));

    if (result == new_doc) {
        out << "ok: " << leaf_paths(patch).size() << " field(s) patched\n";
        return 0;
    }

    const Value residual = diff(result, new_doc);
    auto paths = leaf_paths(residual);
    if (paths.empty()) {
        paths.push_back("<root>");
    }
    out << "mismatch after applying patch:\n";
    for (const auto& p : paths) {
        out << "  " << p << "\n";
    }
    return 1;
}

} // namespace

std::vector<std::string> split_list(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string tok;
    std::istringstream iss(s);
    while (std::getline(iss, tok, delim)) {
        tok = trim(tok);
        if (!tok.empty()) parts.push_back(tok);
    }
    return parts;
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    const std::string lower = to_lower(trim(name));
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    throw PatchError("unknown log level: " + name);
}

CliOptions parse_cli(int argc, char** argv) {
    cxxopts::Options options("patchy", "Compute and apply JSON Merge Patches (RFC 7396)");
    options.positional_help("COMMAND [ARGS]");

    options.add_options()
        ("i,include", "Comma-separated dot-paths always included in a diff", cxxopts::value<std::string>()->default_value(""))
        ("o,out", "apply: write the result to FILE instead of stdout", cxxopts::value<std::string>())
        ("indent", "Spaces per indentation level (-1 = compact)", cxxopts::value<int>()->default_value("-1"))
        ("log-level", "trace|debug|info|warn|error|critical|off", cxxopts::value<std::string>())
        ("h,help", "Show help");

    options.add_options()
        ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

    options.parse_positional({"command"});

    auto result = options.parse(argc, argv);

    CliOptions opts;
    opts.help_text = options.help() +
        "\nCommands: diff OLD NEW | apply BASE PATCH | check OLD NEW\n";

    if (result.count("help") || !result.count("command")) {
        opts.help = true;
        return opts;
    }

    auto cmdv = result["command"].as<std::vector<std::string>>();
    opts.command = cmdv.front();
    opts.args.assign(cmdv.begin() + 1, cmdv.end());
    opts.include = split_list(result["include"].as<std::string>(), ',');
    opts.indent = result["indent"].as<int>();
    if (result.count("out")) {
        opts.out = result["out"].as<std::string>();
    }

    if (result.count("log-level")) {
        opts.log_level = result["log-level"].as<std::string>();
    } else if (const char* env = std::getenv(kLogLevelEnv)) {
        opts.log_level = env;
    }

    return opts;
}

int run_command(const CliOptions& opts, std::ostream& out) {
    if (opts.command == "diff") {
        return cmd_diff(opts, out);
    }
    if (opts.command == "apply") {
        return cmd_apply(opts, out);
    }
    if (opts.command == "check") {
        return cmd_check(opts, out);
    }
    throw PatchError("unknown command: " + opts.command);
}

} // namespace patchy
