#include "lcu_companion/utils/json_helper.hpp"

#include <cstdint>

namespace lcu_companion::utils {

std::expected<nlohmann::json, std::string> JsonHelper::safe_parse(std::string_view text) {
    const auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return std::unexpected("empty document");
    }
    if (text[start] == '<') {
        return std::unexpected("got markup instead of JSON");
    }

    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return std::unexpected("malformed JSON");
    }
    return parsed;
}

std::string JsonHelper::dump(const nlohmann::json& json) {
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool JsonHelper::is_valid_utf8(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t length = 0;
        std::uint32_t code_point = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;
        }

        if (i + length > text.size()) {
            return false;
        }
        for (std::size_t k = 1; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        static constexpr std::uint32_t MIN_FOR_LENGTH[] = {0, 0, 0x80, 0x800, 0x10000};
        if (code_point < MIN_FOR_LENGTH[length] || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += length;
    }
    return true;
}

bool JsonHelper::has_field(const nlohmann::json& json, const std::string& field) {
    return find(json, field) != nullptr;
}

const nlohmann::json* JsonHelper::find(const nlohmann::json& json, const std::string& field) {
    if (!json.is_object()) {
        return nullptr;
    }
    const auto it = json.find(field);
    if (it == json.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

} // namespace lcu_companion::utils
