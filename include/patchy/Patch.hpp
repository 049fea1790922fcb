/**
 * @file Patch.hpp
 * @brief Diff and merge-patch operations on typed records
 *
 * A record type T takes part when nlohmann::json can convert it, i.e.
 * it has to_json/from_json overloads (or NLOHMANN_DEFINE_TYPE_* macros).
 * Records are converted to the tree value, the tree-level algorithm
 * runs, and the result is converted back.
 *
 * Example:
 * ```cpp
 * struct User { std::uint32_t id; std::string name; };
 * NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(User, id, name)
 *
 * User old_user{1, "old"};
 * User new_user{1, "new"};
 *
 * auto patch = patchy::diff(old_user, new_user);          // {"name":"new"}
 * auto text = patchy::dump_patch(patch);
 * User updated = patchy::apply_patch(old_user, text);     // == new_user
 * patchy::apply_patch_in_place(old_user, text);           // old_user == new_user
 * ```
 */

#ifndef PATCHY_PATCH_HPP
#define PATCHY_PATCH_HPP

#include "patchy/Value.hpp"
#include "patchy/Errors.hpp"
#include "patchy/Diff.hpp"
#include "patchy/Merge.hpp"
#include "patchy/Optional.hpp"
#include "patchy/Parse.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace patchy {

/**
 * @brief Reject trees the wire format cannot carry
 *
 * @throws ConversionError naming the dot-path of the first non-finite
 *         floating point number
 */
void ensure_representable(const Value& tree);

/**
 * @brief Check that a record converted from `tree` carries the same values
 *
 * nlohmann::json converts numbers with static_cast, so 300 lands in a
 * uint8_t as 44, -1 as 255, true as 1 and 31.9 as 31. Converting the
 * record back and comparing exposes those.
 *
 * @param tree The tree the record was read from
 * @param back The same record converted to a tree again
 *
 * Members present on one side only are not compared: a member the record
 * has no field for is ignored, and a null member matches a missing one.
 * A float field matches when both sides round to the same float.
 *
 * @throws ConversionError naming the dot-path of the first mismatch
 */
void ensure_round_trips(const Value& tree, const Value& back);

/**
 * @brief Convert a typed record to a tree value
 *
 * @throws ConversionError if the serializer fails or the record holds a
 *         NaN or infinite number
 */
template <typename T>
Value to_tree(const T& record) {
    Value tree;
    try {
        tree = record;
    } catch (const nlohmann::json::exception& e) {
        throw ConversionError(ConversionError::Direction::ToTree, e.what());
    }
    ensure_representable(tree);
    return tree;
}

/**
 * @brief Convert a tree value back to a typed record
 *
 * @throws ConversionError on wrong scalar types, numbers the field cannot
 *         hold, or missing required fields
 */
template <typename T>
T from_tree(const Value& tree) {
    try {
        T out = tree.get<T>();
        const Value back = out;
        ensure_round_trips(tree, back);
        return out;
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("from_tree rejected {} value: {}", type_name(tree), e.what());
        throw ConversionError(ConversionError::Direction::FromTree, e.what());
    }
}

/**
 * @brief Merge patch turning one record into another
 *
 * @return Changed fields only; `{}` when the records are equal
 * @throws ConversionError if either record cannot be converted
 */
template <typename T>
Value diff(const T& old_record, const T& new_record) {
    return diff(to_tree(old_record), to_tree(new_record));
}

/**
 * @brief Merge patch that also carries the given fields unconditionally
 *
 * @param forced_paths Dot-paths such as "id" or "profile.bio"
 * @throws ConversionError if either record cannot be converted
 */
template <typename T>
Value diff_including(const T& old_record, const T& new_record,
                     const std::vector<std::string>& forced_paths) {
    return diff_including(to_tree(old_record), to_tree(new_record), forced_paths);
}

/**
 * @brief Apply an already-parsed patch, returning a new record
 *
 * @throws ConversionError if the merged tree no longer fits T
 */
template <typename T>
T apply_patch_tree(const T& base, const Value& patch) {
    Value tree = to_tree(base);
    merge_patch(tree, patch);
    return from_tree<T>(tree);
}

/**
 * @brief Apply patch text, returning a new record
 *
 * The caller's record is never modified.
 *
 * @throws ParseError if the patch is not well-formed
 * @throws ConversionError if the merged tree no longer fits T
 */
template <typename T>
T apply_patch(const T& base, std::string_view patch_text) {
    return apply_patch_tree(base, parse_patch(patch_text));
}

template <typename T>
T apply_patch(const T& base, const std::vector<std::uint8_t>& patch_bytes) {
    return apply_patch_tree(base, parse_patch(patch_bytes));
}

/**
 * @brief Apply an already-parsed patch to a record in place
 *
 * All-or-nothing: `base` is assigned only after the merged tree has been
 * converted back successfully. On any exception `base` is unchanged.
 */
template <typename T>
void apply_patch_tree_in_place(T& base, const Value& patch) {
    T updated = apply_patch_tree(base, patch);
    base = std::move(updated);
}

/**
 * @brief Apply patch text to a record in place
 *
 * @throws ParseError if the patch is not well-formed
 * @throws ConversionError if the merged tree no longer fits T
 */
template <typename T>
void apply_patch_in_place(T& base, std::string_view patch_text) {
    apply_patch_tree_in_place(base, parse_patch(patch_text));
}

template <typename T>
void apply_patch_in_place(T& base, const std::vector<std::uint8_t>& patch_bytes) {
    apply_patch_tree_in_place(base, parse_patch(patch_bytes));
}

} // namespace patchy

#endif // PATCHY_PATCH_HPP
