#pragma once

#include "lcu_companion/services/network/http_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace lcu_companion {
namespace services {

// Fluent construction of an HttpRequest.
//
//   auto request = RequestBuilder(HttpMethod::POST, url)
//       .json(payload)
//       .timeout(std::chrono::seconds(4))
//       .build();
class RequestBuilder {
public:
    RequestBuilder(HttpMethod method, std::string url);

    RequestBuilder& header(const std::string& name, std::string value);
    // Sends the document as the body and asks for JSON back
    RequestBuilder& json(const nlohmann::json& body);
    RequestBuilder& accept_json();
    RequestBuilder& timeout(std::chrono::milliseconds timeout);
    RequestBuilder& basic_auth(const std::string& user, const std::string& password);
    // For the game client's loopback API: self-signed certificate, no redirects
    RequestBuilder& loopback();

    HttpRequest build() const { return m_request; }

private:
    HttpRequest m_request;
};

} // namespace services
} // namespace lcu_companion
