#pragma once

#include "lcu_companion/core/connection_state.hpp"
#include "lcu_companion/services/gateway/client_gateway.hpp"
#include "lcu_companion/services/network/http_client.hpp"

#include <chrono>
#include <memory>

namespace lcu_companion::services {

// ClientGateway over HTTPS to 127.0.0.1, authenticated as riot:<token>.
// Credentials are read from the connection state on every call.
class LcuGateway : public ClientGateway {
public:
    LcuGateway(const core::ConnectionStateStore& connection_state,
               std::shared_ptr<HttpClient> http_client,
               std::chrono::seconds request_timeout);

    std::expected<nlohmann::json, core::GatewayError> request(
        core::ApiTarget target,
        HttpMethod method,
        const std::string& path,
        const std::optional<nlohmann::json>& body = std::nullopt) override;

    [[nodiscard]] bool is_available() const override;

    static std::string base_url(std::uint16_t port);

private:
    const core::ConnectionStateStore& m_connection_state;
    std::shared_ptr<HttpClient> m_http_client;
    std::chrono::seconds m_request_timeout;
};

} // namespace lcu_companion::services
