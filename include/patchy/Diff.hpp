/**
 * @file Diff.hpp
 * @brief Merge-patch diff between two tree values
 *
 * Produces a JSON Merge Patch (RFC 7396) that turns `old` into `new`:
 * - Objects are compared key by key, recursively
 * - Anything else (scalars, null, arrays) is compared as a whole
 * - Keys present only in `old` are emitted as null (delete markers)
 * - Forced paths are emitted with their full new value even if unchanged
 */

#ifndef PATCHY_DIFF_HPP
#define PATCHY_DIFF_HPP

#include "patchy/Value.hpp"
#include "patchy/DotPath.hpp"
#include <optional>
#include <string>
#include <vector>

namespace patchy {

/**
 * @brief Recursive diff step
 *
 * @param old_val Value at this position in the old tree, or nullptr if
 *                the key does not exist there
 * @param new_val Value at this position in the new tree
 * @param forced Paths that must appear in the output even when unchanged
 * @param current_path Dot-path of this position ("" at the root)
 * @return The patch for this position, or std::nullopt when nothing
 *         changed and the position is not forced
 *
 * When both sides are objects, a forced key whose children are all
 * unchanged is emitted with its complete new value, not an empty object.
 */
std::optional<Value> compute_diff(const Value* old_val, const Value& new_val,
                                  const PathSet& forced,
                                  const std::string& current_path);

/**
 * @brief Compute the merge patch from old to new
 *
 * @return Patch document; `{}` when the trees are equal
 *
 * Example:
 * ```cpp
 * Value old_doc = {{"id", 1}, {"name", "old"}};
 * Value new_doc = {{"id", 1}, {"name", "new"}};
 * auto patch = diff(old_doc, new_doc);
 * // Result: {"name": "new"}
 * ```
 */
Value diff(const Value& old_val, const Value& new_val);

/**
 * @brief Compute the merge patch, always including the given paths
 *
 * @param forced_paths Dot-paths (e.g. "id", "profile.bio") to include
 *                     with their new value even when unchanged. They are
 *                     normalised by make_path_set: empty segments collapse,
 *                     so members keyed by "" cannot be forced.
 * @return Patch document; `{}` when nothing changed and nothing forced
 *
 * Example:
 * ```cpp
 * auto patch = diff_including(old_doc, new_doc, {"id"});
 * // Result: {"id": 1, "name": "new"}
 * ```
 */
Value diff_including(const Value& old_val, const Value& new_val,
                     const std::vector<std::string>& forced_paths);

} // namespace patchy

#endif // PATCHY_DIFF_HPP
