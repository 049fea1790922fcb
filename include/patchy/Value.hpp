/**
 * @file Value.hpp
 * @brief Tree value type shared by the differ and the merger
 *
 * Uses nlohmann::json as the underlying value model:
 * - Null
 * - Bool (true | false)
 * - Number (int64_t, uint64_t, double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 */

#ifndef PATCHY_VALUE_HPP
#define PATCHY_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace patchy {

/**
 * @brief Generic tree value that typed records are converted to and from
 *
 * Alias for nlohmann::json. Deep structural equality is operator==,
 * which compares numbers by value across integer/unsigned/float storage.
 * Object keys are kept in lexicographic order, so a dumped patch is
 * deterministic.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace patchy

#endif // PATCHY_VALUE_HPP
