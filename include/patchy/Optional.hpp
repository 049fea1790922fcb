/**
 * @file Optional.hpp
 * @brief std::optional <-> tree value mapping
 *
 * std::nullopt serializes as null and null deserializes as std::nullopt,
 * so an optional field is what a null merge-patch entry can delete.
 */

#ifndef PATCHY_OPTIONAL_HPP
#define PATCHY_OPTIONAL_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace nlohmann {

template <typename T>
struct adl_serializer<std::optional<T>> {
    template <typename BasicJsonType>
    static void to_json(BasicJsonType& j, const std::optional<T>& opt) {
        if (opt) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    template <typename BasicJsonType>
    static void from_json(const BasicJsonType& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.template get<T>();
        }
    }
};

} // namespace nlohmann

namespace patchy {

/**
 * @brief Read an optional object member
 *
 * A missing key and a null value both yield std::nullopt. Intended for
 * use inside from_json of records with optional fields.
 */
template <typename T>
void get_optional_to(const nlohmann::json& j, const std::string& key,
                     std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        out = std::nullopt;
    } else {
        it->get_to(out);
    }
}

} // namespace patchy

#endif // PATCHY_OPTIONAL_HPP
