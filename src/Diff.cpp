/**
 * @file Diff.cpp
 * @brief Implementation of merge-patch diff
 */

#include "patchy/Diff.hpp"

#include <spdlog/spdlog.h>

namespace patchy {

std::optional<Value> compute_diff(const Value* old_val, const Value& new_val,
                                  const PathSet& forced,
                                  const std::string& current_path) {
    if (old_val != nullptr && old_val->is_object() && new_val.is_object()) {
        Value result = Value::object();

        for (auto it = new_val.begin(); it != new_val.end(); ++it) {
            const auto& key = it.key();
            const auto full_path = append_path(current_path, key);

            auto old_it = old_val->find(key);
            const Value* old_child = old_it != old_val->end() ? &(*old_it) : nullptr;

            if (auto child = compute_diff(old_child, it.value(), forced, full_path)) {
                result[key] = std::move(*child);
            } else if (forced.count(full_path) > 0) {
                result[key] = it.value();
            }
        }

        // Keys dropped from the new tree become delete markers
        for (auto it = old_val->begin(); it != old_val->end(); ++it) {
            if (!new_val.contains(it.key())) {
                result[it.key()] = nullptr;
            }
        }

        if (result.empty()) {
            return std::nullopt;
        }
        return result;
    }

    const bool equal = old_val != nullptr && *old_val == new_val;
    if (equal && forced.count(current_path) == 0) {
        return std::nullopt;
    }
    return new_val;
}

Value diff(const Value& old_val, const Value& new_val) {
    return diff_including(old_val, new_val, {});
}

Value diff_including(const Value& old_val, const Value& new_val,
                     const std::vector<std::string>& forced_paths) {
    const auto forced = make_path_set(forced_paths);
    auto result = compute_diff(&old_val, new_val, forced, "");
    if (!result) {
        spdlog::debug("diff: no changes ({} forced paths)", forced.size());
        return Value::object();
    }
    spdlog::debug("diff: {} top-level entries ({} forced paths)",
                  result->is_object() ? result->size() : 1, forced.size());
    return std::move(*result);
}

} // namespace patchy
