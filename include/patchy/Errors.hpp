/**
 * @file Errors.hpp
 * @brief Exception types for patch computation and application
 *
 * Error taxonomy:
 * - PatchError: Base class
 * - ConversionError: Typed record cannot be turned into/from a tree value
 * - ParseError: Patch or document text is not well-formed
 * - FileNotFoundError: Document file not found
 * - TypeError: Traversal into non-container
 */

#ifndef PATCHY_ERRORS_HPP
#define PATCHY_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace patchy {

/**
 * @brief Base class for all patchy exceptions
 */
class PatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Conversion between a typed record and the tree value failed
 *
 * Raised on the way in for values the tree cannot represent (non-finite
 * floats), and on the way out for shape mismatches (wrong scalar type,
 * missing required field).
 */
class ConversionError : public PatchError {
public:
    enum class Direction { ToTree, FromTree };

    /**
     * @brief Construct with conversion direction and serializer message
     * @param direction Which way the conversion was going
     * @param details Message from the serializer
     */
    ConversionError(Direction direction, std::string details)
        : PatchError(format_message(direction, details))
        , direction_(direction)
        , details_(std::move(details))
    {}

    Direction direction() const noexcept {
        return direction_;
    }

    /**
     * @brief Get the serializer's message without the prefix
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    Direction direction_;
    std::string details_;

    static std::string format_message(Direction direction, const std::string& details) {
        return std::string(direction == Direction::ToTree
                               ? "Cannot convert record to tree value: "
                               : "Cannot convert tree value to record: ") +
               details;
    }
};

/**
 * @brief Patch or document text is not well-formed
 */
class ParseError : public PatchError {
public:
    /**
     * @brief Construct with source name, byte offset and parser message
     * @param source Where the text came from ("<patch>" or a file path)
     * @param offset Byte offset of the error (0 when unknown)
     * @param details Detailed error message from parser
     */
    ParseError(std::string source, std::size_t offset, std::string details)
        : PatchError("Parse error in '" + source + "' at byte " +
                     std::to_string(offset) + ": " + details)
        , source_(std::move(source))
        , offset_(offset)
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept {
        return source_;
    }

    std::size_t offset() const noexcept {
        return offset_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string source_;
    std::size_t offset_;
    std::string details_;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public PatchError {
public:
    explicit FileNotFoundError(std::string path)
        : PatchError("Document file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Type mismatch during dot-path traversal
 *
 * Raised when attempting to traverse into a non-object
 * (e.g., "age.years" where age is an integer).
 */
class TypeError : public PatchError {
public:
    TypeError(std::string path, std::string expected, std::string actual)
        : PatchError("Cannot traverse into " + actual +
                     " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

} // namespace patchy

#endif // PATCHY_ERRORS_HPP
