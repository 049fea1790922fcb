/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "patchy/DotPath.hpp"
#include <sstream>
#include <utility>

namespace patchy {

std::vector<std::string> split_dot_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    if (segments.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

std::string append_path(const std::string& prefix, const std::string& key) {
    if (prefix.empty()) {
        return key;
    }
    return prefix + '.' + key;
}

PathSet make_path_set(const std::vector<std::string>& paths) {
    PathSet out;
    for (const auto& p : paths) {
        auto normalised = join_dot_path(split_dot_path(p));
        if (!normalised.empty()) {
            out.insert(std::move(normalised));
        }
    }
    return out;
}

bool contains_dot(const Value& data, const std::string& path) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        return true; // Root always exists
    }

    const Value* current = &data;

    for (const auto& seg : segments) {
        if (!current->is_object()) {
            throw TypeError(path, "object", type_name(*current));
        }

        auto it = current->find(seg);
        if (it == current->end()) {
            return false;
        }
        current = &(*it);
    }

    return true;
}

namespace {

void collect_leaves(const Value& node, const std::string& prefix,
                    std::vector<std::string>& out) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        const auto path = append_path(prefix, it.key());
        const auto& child = it.value();
        if (child.is_object() && !child.empty()) {
            collect_leaves(child, path, out);
        } else {
            out.push_back(path);
        }
    }
}

} // namespace

std::vector<std::string> leaf_paths(const Value& patch) {
    std::vector<std::string> out;
    if (patch.is_object()) {
        collect_leaves(patch, "", out);
    }
    return out;
}

} // namespace patchy
