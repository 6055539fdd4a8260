#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace lcu_companion {
namespace services {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    PATCH,
    DELETE_
};

enum class NetworkError {
    ConnectionFailed,
    Timeout,
    TlsFailure,
    MalformedUrl,
    Transfer
};

std::string to_string(HttpMethod method);
std::string to_string(NetworkError error);

// Header names are stored as given; lookups on responses use lowercase keys
using HttpHeaders = std::map<std::string, std::string>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::string body;
    // Zero means the client's default
    std::chrono::milliseconds timeout{0};
    std::optional<std::string> basic_auth; // "user:password"
    bool verify_tls = true;
    bool follow_redirects = true;
};

struct HttpResponse {
    long status = 0;
    HttpHeaders headers; // lowercase names
    std::string body;
    std::chrono::milliseconds elapsed{0};

    bool ok() const { return status >= 200 && status < 300; }
};

} // namespace services
} // namespace lcu_companion
