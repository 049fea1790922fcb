/**
 * @file Patch.cpp
 * @brief Non-template part of the record layer
 */

#include "patchy/Patch.hpp"
#include "patchy/DotPath.hpp"

#include <cmath>
#include <limits>

namespace patchy {

namespace {

std::string display_path(const std::string& path) {
    return path.empty() ? std::string("<root>") : path;
}

void check_node(const Value& node, const std::string& path) {
    if (node.is_number_float()) {
        const double d = node.get<double>();
        if (!std::isfinite(d)) {
            throw ConversionError(
                ConversionError::Direction::ToTree,
                "non-finite number at '" + display_path(path) + "'");
        }
    } else if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            check_node(it.value(), append_path(path, it.key()));
        }
    } else if (node.is_array()) {
        // Arrays carry no path segment
        for (const auto& elem : node) {
            check_node(elem, path);
        }
    }
}

bool same_scalar(const Value& tree, const Value& back) {
    if (tree == back) {
        return true;
    }
    if (!tree.is_number() || !back.is_number_float()) {
        return false;
    }
    const double t = tree.get<double>();
    const double b = back.get<double>();
    const double float_max = std::numeric_limits<float>::max();
    if (!std::isfinite(b) || std::fabs(t) > float_max) {
        return false;
    }
    return static_cast<float>(t) == static_cast<float>(b);
}

void check_fit(const Value& tree, const Value& back, const std::string& path) {
    if (tree.is_object() && back.is_object()) {
        for (auto it = tree.begin(); it != tree.end(); ++it) {
            auto match = back.find(it.key());
            if (match != back.end()) {
                check_fit(it.value(), *match, append_path(path, it.key()));
            }
        }
        return;
    }

    if (tree.is_array() && back.is_array()) {
        if (tree.size() != back.size()) {
            throw ConversionError(
                ConversionError::Direction::FromTree,
                "array at '" + display_path(path) + "' has " + std::to_string(tree.size()) +
                " element(s) but the record kept " + std::to_string(back.size()));
        }
        for (std::size_t i = 0; i < tree.size(); ++i) {
            check_fit(tree[i], back[i], path);
        }
        return;
    }

    if (!same_scalar(tree, back)) {
        spdlog::debug("from_tree: {} at '{}' read back as {}", tree.dump(), display_path(path), back.dump());
        throw ConversionError(
            ConversionError::Direction::FromTree,
            "value " + tree.dump() + " at '" + display_path(path) +
            "' does not fit the record field (read back as " + back.dump() + ")");
    }
}

} // namespace

void ensure_round_trips(const Value& tree, const Value& back) {
    check_fit(tree, back, "");
}

void ensure_representable(const Value& tree) {
    check_node(tree, "");
}

} // namespace patchy
