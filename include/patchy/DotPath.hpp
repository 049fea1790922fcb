/**
 * @file DotPath.hpp
 * @brief Dot-notation paths used to name fields of a tree value
 *
 * A path is the dot-joined sequence of object keys from the root to a
 * node, e.g. "profile.bio". Arrays are atomic and never contribute a
 * segment.
 */

#ifndef PATCHY_DOTPATH_HPP
#define PATCHY_DOTPATH_HPP

#include "Value.hpp"
#include "Errors.hpp"
#include <set>
#include <string>
#include <vector>

namespace patchy {

/**
 * @brief Set of dot-paths forced into a diff
 */
using PathSet = std::set<std::string>;

/**
 * @brief Split a dot-path into segments
 *
 * @param path Dot-separated path like "a.b.c"
 * @return Vector of segments ["a", "b", "c"]
 *
 * Examples:
 * - "profile.bio" → ["profile", "bio"]
 * - "" → []
 * - "a..b" → ["a", "b"]
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Extend a path by one object key
 *
 * @param prefix Path of the enclosing object ("" at the root)
 * @param key Key being descended into
 * @return key when prefix is empty, otherwise "prefix.key"
 */
std::string append_path(const std::string& prefix, const std::string& key);

/**
 * @brief Build a forced-field set from caller-supplied paths
 *
 * Paths are normalised through split/join, so "a..b" and "a.b." both
 * name "a.b". Empty paths are dropped.
 *
 * An empty segment never survives normalisation, so a member whose key
 * is the empty string (or any path through one) cannot be forced.
 */
PathSet make_path_set(const std::vector<std::string>& paths);

/**
 * @brief Check if dot-path exists in nested objects
 *
 * @param data Source value
 * @param path Dot-separated path
 * @return true if path fully resolves, false if any key is missing
 * @throws TypeError if traversal hits a non-object before the final segment
 *
 * Examples:
 * ```cpp
 * Value doc = {{"profile", {{"bio", "x"}}}};
 * contains_dot(doc, "profile.bio");    // true
 * contains_dot(doc, "profile.name");   // false
 * contains_dot(doc, "profile.bio.x");  // throws TypeError
 * ```
 */
bool contains_dot(const Value& data, const std::string& path);

/**
 * @brief List the dot-paths of every leaf of a patch
 *
 * Objects are descended; any other value (including null and arrays)
 * is a leaf. An empty object nested under a key is reported as a leaf
 * too. Paths come out in key order.
 */
std::vector<std::string> leaf_paths(const Value& patch);

} // namespace patchy

#endif // PATCHY_DOTPATH_HPP
