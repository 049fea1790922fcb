/**
 * @file Loader.hpp
 * @brief Loading documents and patches from files
 *
 * Implements loading from:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 * - Standard input ("-", JSON only)
 */

#ifndef PATCHY_LOADER_HPP
#define PATCHY_LOADER_HPP

#include "patchy/Value.hpp"
#include <istream>
#include <string>

namespace patchy {

/**
 * @brief Load a document from a JSON file.
 *
 * @param path Path to the JSON file
 * @return Parsed Value (any JSON value, not only objects)
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a document from a TOML file.
 *
 * TOML tables map to objects; dates, times and date-times map to their
 * TOML string form.
 *
 * @param path Path to the TOML file
 * @return Parsed Value (always an object)
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a JSON document from a stream.
 *
 * @param in Input stream, read to end
 * @param source Name used in error messages
 * @throws ParseError if JSON syntax is invalid
 */
Value load_json_stream(std::istream& in, const std::string& source);

/**
 * @brief Load a document, detecting the format by extension.
 *
 * - "-" reads JSON from standard input
 * - ".json" → JSON, ".toml" → TOML (case-insensitive)
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the file has syntax errors
 * @throws PatchError if the extension is not .json or .toml
 */
Value load_document(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

} // namespace patchy

#endif // PATCHY_LOADER_HPP
