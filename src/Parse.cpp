/**
 * @file Parse.cpp
 * @brief Implementation of patch parsing and serialization
 */

#include "patchy/Parse.hpp"
#include "patchy/Errors.hpp"

#include <spdlog/spdlog.h>

namespace patchy {

namespace {

template <typename Input>
Value parse_or_throw(const Input& input, const std::string& source) {
    try {
        return Value::parse(input.begin(), input.end());
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::debug("rejecting {}: {}", source, e.what());
        throw ParseError(source, e.byte, e.what());
    }
}

} // namespace

Value parse_patch(std::string_view text, const std::string& source) {
    return parse_or_throw(text, source);
}

Value parse_patch(const std::vector<std::uint8_t>& bytes, const std::string& source) {
    return parse_or_throw(bytes, source);
}

std::string dump_patch(const Value& patch, int indent) {
    // Invalid UTF-8 in strings is written as U+FFFD
    return patch.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace patchy
