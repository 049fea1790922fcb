/**
 * @file Merge.cpp
 * @brief Implementation of merge-patch application
 */

#include "patchy/Merge.hpp"

namespace patchy {

void merge_patch(Value& target, const Value& patch) {
    if (!patch.is_object()) {
        // Scalars, arrays and a top-level null replace the target
        target = patch;
        return;
    }

    if (!target.is_object()) {
        target = Value::object();
    }

    for (auto it = patch.begin(); it != patch.end(); ++it) {
        const auto& key = it.key();
        const auto& patch_value = it.value();

        if (patch_value.is_null()) {
            target.erase(key);
        } else {
            // operator[] inserts null for a missing key
            merge_patch(target[key], patch_value);
        }
    }
}

Value merged(Value base, const Value& patch) {
    merge_patch(base, patch);
    return base;
}

} // namespace patchy
