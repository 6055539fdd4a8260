#include "lcu_companion/utils/url_utils.hpp"

#include <charconv>

namespace lcu_companion {
namespace utils {

namespace {

bool is_unreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

} // namespace

std::string UrlUtils::encode(std::string_view text) {
    static constexpr char HEX[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(text.size());
    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out.push_back(ch);
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

std::string UrlUtils::join_path(const std::string& base, const std::string& path) {
    if (base.empty() || path.empty()) {
        return base + path;
    }

    const bool trailing = base.back() == '/';
    const bool leading = path.front() == '/';
    if (trailing && leading) {
        return base + path.substr(1);
    }
    return trailing || leading ? base + path : base + '/' + path;
}

std::string UrlUtils::build_query_string(const QueryParams& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += encode(key);
        query += '=';
        query += encode(value);
    }
    return query;
}

std::optional<UrlParts> UrlUtils::parse(std::string_view url) {
    const auto separator = url.find("://");
    if (separator == std::string_view::npos || separator == 0) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = std::string(url.substr(0, separator));

    auto authority = url.substr(separator + 3);
    authority = authority.substr(0, authority.find_first_of("/?#"));

    const auto colon = authority.find(':');
    parts.host = std::string(authority.substr(0, colon));
    if (parts.host.empty()) {
        return std::nullopt;
    }

    if (colon != std::string_view::npos) {
        const auto digits = authority.substr(colon + 1);
        std::uint16_t port = 0;
        const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), port);
        if (ec != std::errc() || end != digits.data() + digits.size()) {
            return std::nullopt;
        }
        parts.port = port;
    }
    return parts;
}

bool UrlUtils::is_valid_url(std::string_view url) {
    const auto parts = parse(url);
    return parts && (parts->scheme == "http" || parts->scheme == "https");
}

} // namespace utils
} // namespace lcu_companion
