#include "lcu_companion/services/network/http_client.hpp"
#include "lcu_companion/services/network/request_builder.hpp"
#include "lcu_companion/utils/json_helper.hpp"

namespace lcu_companion {
namespace services {

std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::DELETE_: return "DELETE";
    }
    return "GET";
}

std::string to_string(NetworkError error) {
    switch (error) {
        case NetworkError::ConnectionFailed: return "connection failed";
        case NetworkError::Timeout: return "timed out";
        case NetworkError::TlsFailure: return "TLS handshake failed";
        case NetworkError::MalformedUrl: return "malformed URL";
        case NetworkError::Transfer: return "transfer error";
    }
    return "transfer error";
}

RequestBuilder::RequestBuilder(HttpMethod method, std::string url) {
    m_request.method = method;
    m_request.url = std::move(url);
}

RequestBuilder& RequestBuilder::header(const std::string& name, std::string value) {
    m_request.headers[name] = std::move(value);
    return *this;
}

RequestBuilder& RequestBuilder::json(const nlohmann::json& body) {
    m_request.body = utils::JsonHelper::dump(body);
    m_request.headers["Content-Type"] = "application/json";
    return accept_json();
}

RequestBuilder& RequestBuilder::accept_json() {
    m_request.headers["Accept"] = "application/json";
    return *this;
}

RequestBuilder& RequestBuilder::timeout(std::chrono::milliseconds timeout) {
    m_request.timeout = timeout;
    return *this;
}

RequestBuilder& RequestBuilder::basic_auth(const std::string& user, const std::string& password) {
    m_request.basic_auth = user + ":" + password;
    return *this;
}

RequestBuilder& RequestBuilder::loopback() {
    m_request.verify_tls = false;
    m_request.follow_redirects = false;
    return *this;
}

} // namespace services
} // namespace lcu_companion
