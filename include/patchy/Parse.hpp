/**
 * @file Parse.hpp
 * @brief Patch document text <-> tree value
 *
 * Patch bytes may be supplied as text (std::string_view, std::string,
 * string literals) or as raw bytes (std::vector<std::uint8_t>). Any JSON
 * value is accepted at the top level: a non-object patch replaces the
 * target wholesale.
 */

#ifndef PATCHY_PARSE_HPP
#define PATCHY_PARSE_HPP

#include "patchy/Value.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace patchy {

/**
 * @brief Parse patch text into a tree value
 *
 * @param text JSON text
 * @param source Name used in error messages
 * @return Parsed patch
 * @throws ParseError if text is not well-formed JSON
 *
 * Examples:
 * ```cpp
 * parse_patch(R"({"age": 31})")    // → {"age": 31}
 * parse_patch("null")              // → null (replace with null)
 * parse_patch("{\"age\":")         // throws ParseError
 * ```
 */
Value parse_patch(std::string_view text, const std::string& source = "<patch>");

/**
 * @brief Parse raw patch bytes into a tree value
 *
 * @throws ParseError if bytes are not well-formed UTF-8 JSON
 */
Value parse_patch(const std::vector<std::uint8_t>& bytes,
                  const std::string& source = "<patch>");

/**
 * @brief Serialize a patch for transport or storage
 *
 * @param patch Patch tree
 * @param indent -1 for compact output, otherwise spaces per level
 * @return JSON text; object keys in lexicographic order
 */
std::string dump_patch(const Value& patch, int indent = -1);

} // namespace patchy

#endif // PATCHY_PARSE_HPP
