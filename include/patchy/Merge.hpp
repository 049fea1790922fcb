/**
 * @file Merge.hpp
 * @brief JSON Merge Patch (RFC 7396) application
 *
 * Merging rules:
 * - Object patch: merged key by key; a non-object target becomes {} first
 * - Null entry inside an object patch: deletes the key from the target
 * - Any other patch (scalar, array, top-level null): replaces the target
 */

#ifndef PATCHY_MERGE_HPP
#define PATCHY_MERGE_HPP

#include "patchy/Value.hpp"

namespace patchy {

/**
 * @brief Apply a merge patch to a value in place
 *
 * @param target Value to update
 * @param patch Merge patch document
 *
 * Examples:
 * ```cpp
 * Value doc = {{"age", 30}, {"id", 1}};
 * merge_patch(doc, {{"age", 31}});
 * // Result: {"age": 31, "id": 1}
 *
 * merge_patch(doc, {{"age", nullptr}});
 * // Result: {"id": 1}
 *
 * Value scalar = "text";
 * merge_patch(scalar, {{"a", 1}});
 * // Result: {"a": 1}
 * ```
 */
void merge_patch(Value& target, const Value& patch);

/**
 * @brief Apply a merge patch and return the result
 *
 * @param base Value to start from (taken by value; the caller's copy is
 *             untouched)
 * @param patch Merge patch document
 * @return Updated value
 */
Value merged(Value base, const Value& patch);

} // namespace patchy

#endif // PATCHY_MERGE_HPP
