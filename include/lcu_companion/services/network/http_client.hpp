#pragma once

#include "lcu_companion/services/network/http_types.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <string>

namespace lcu_companion {
namespace services {

using HttpResult = std::expected<HttpResponse, NetworkError>;

// Blocking HTTP transport shared by the gateway and the stats client. Safe to
// call from several threads at once. Tests substitute a scripted one.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResult execute(const HttpRequest& request) = 0;
};

struct HttpClientConfig {
    std::chrono::milliseconds default_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(3)};
    std::string user_agent = "lcu-companion";
};

// libcurl-backed client
std::unique_ptr<HttpClient> create_http_client(const HttpClientConfig& config = {});

} // namespace services
} // namespace lcu_companion
