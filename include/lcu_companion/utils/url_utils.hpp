#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lcu_companion {
namespace utils {

struct UrlParts {
    std::string scheme;
    std::string host;
    std::optional<std::uint16_t> port;
};

class UrlUtils {
public:
    using QueryParams = std::vector<std::pair<std::string, std::string>>;

    // RFC 3986 percent-encoding; only unreserved characters pass through
    static std::string encode(std::string_view text);
    static std::string join_path(const std::string& base, const std::string& path);
    // Keeps parameter order, the game client is sensitive to it for invoke calls
    static std::string build_query_string(const QueryParams& params);

    // scheme://host[:port][/...]; no user info, IPv6 literals are not handled
    static std::optional<UrlParts> parse(std::string_view url);
    // http or https with a host
    static bool is_valid_url(std::string_view url);
};

} // namespace utils
} // namespace lcu_companion
