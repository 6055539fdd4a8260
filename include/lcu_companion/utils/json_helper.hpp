#pragma once

#include <nlohmann/json.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <type_traits>

namespace lcu_companion::utils {

// Non-throwing access to documents that come off the wire. A field that is
// null counts as missing.
class JsonHelper {
public:
    // Rejects empty bodies and HTML error pages with a readable message
    static std::expected<nlohmann::json, std::string> safe_parse(std::string_view text);

    // Serializes without throwing; invalid UTF-8 in strings becomes U+FFFD
    static std::string dump(const nlohmann::json& json);

    static bool is_valid_utf8(std::string_view text);

    template<typename T>
    static std::expected<T, std::string> get_required(const nlohmann::json& json, const std::string& field);

    // Missing or mistyped values yield the fallback
    template<typename T>
    static T get_optional(const nlohmann::json& json, const std::string& field, const T& fallback);

    static bool has_field(const nlohmann::json& json, const std::string& field);

    // Calls visit for each element when the field is an array
    template<typename Visit>
    static void for_each_in_array(const nlohmann::json& json, const std::string& field, Visit&& visit);

private:
    static const nlohmann::json* find(const nlohmann::json& json, const std::string& field);
};

template<typename T>
std::expected<T, std::string> JsonHelper::get_required(const nlohmann::json& json, const std::string& field) {
    const auto* value = find(json, field);
    if (!value) {
        return std::unexpected("missing field '" + field + "'");
    }
    // get<int>() would truncate a float, or overflow on one out of range
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        if (!value->is_number_integer()) {
            return std::unexpected("field '" + field + "' is not an integer");
        }
    }
    try {
        return value->get<T>();
    } catch (const nlohmann::json::exception&) {
        return std::unexpected("field '" + field + "' has type " + value->type_name());
    }
}

template<typename T>
T JsonHelper::get_optional(const nlohmann::json& json, const std::string& field, const T& fallback) {
    const auto* value = find(json, field);
    if (!value) {
        return fallback;
    }
    try {
        return value->get<T>();
    } catch (const nlohmann::json::exception&) {
        return fallback;
    }
}

template<typename Visit>
void JsonHelper::for_each_in_array(const nlohmann::json& json, const std::string& field, Visit&& visit) {
    const auto* value = find(json, field);
    if (!value || !value->is_array()) {
        return;
    }
    for (const auto& element : *value) {
        visit(element);
    }
}

} // namespace lcu_companion::utils
