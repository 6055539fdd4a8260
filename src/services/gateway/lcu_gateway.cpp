#include "lcu_companion/services/gateway/lcu_gateway.hpp"
#include "lcu_companion/services/network/request_builder.hpp"
#include "lcu_companion/utils/json_helper.hpp"
#include "lcu_companion/utils/logger.hpp"
#include "lcu_companion/utils/url_utils.hpp"

namespace lcu_companion::services {

namespace {
constexpr const char* AUTH_USER = "riot";
}

LcuGateway::LcuGateway(const core::ConnectionStateStore& connection_state,
                       std::shared_ptr<HttpClient> http_client,
                       std::chrono::seconds request_timeout)
    : m_connection_state(connection_state)
    , m_http_client(std::move(http_client))
    , m_request_timeout(request_timeout) {}

std::string LcuGateway::base_url(std::uint16_t port) {
    return "https://127.0.0.1:" + std::to_string(port);
}

bool LcuGateway::is_available() const {
    return m_connection_state.is_connected();
}

std::expected<nlohmann::json, core::GatewayError> LcuGateway::request(
    core::ApiTarget target,
    HttpMethod method,
    const std::string& path,
    const std::optional<nlohmann::json>& body) {

    const auto endpoint = m_connection_state.endpoint();
    if (!endpoint) {
        return std::unexpected(core::GatewayError::Unavailable);
    }

    const bool league = target == core::ApiTarget::LeagueClient;
    const auto port = league ? endpoint->remoting_port : endpoint->app_port;
    const auto& token = league ? endpoint->remoting_token : endpoint->app_token;
    if (port == 0 || token.empty()) {
        LCU_LOG_WARNING("LcuGateway", "No credentials for " +
                        std::string(league ? "League" : "Riot") + " client API");
        return std::unexpected(core::GatewayError::Unavailable);
    }

    RequestBuilder builder(method, utils::UrlUtils::join_path(base_url(port), path));
    builder.basic_auth(AUTH_USER, token)
           .timeout(m_request_timeout)
           .loopback();
    if (body) {
        builder.json(*body);
    } else {
        builder.accept_json();
    }

    auto response = m_http_client->execute(builder.build());
    if (!response) {
        LCU_LOG_WARNING("LcuGateway", to_string(method) + " " + path + " failed: " +
                        to_string(response.error()));
        return std::unexpected(core::GatewayError::Transport);
    }

    if (!response->ok()) {
        LCU_LOG_DEBUG("LcuGateway", to_string(method) + " " + path + " returned HTTP " +
                      std::to_string(response->status));
        return std::unexpected(core::GatewayError::Transport);
    }

    if (response->body.empty()) {
        return nlohmann::json(nullptr);
    }

    auto parsed = utils::JsonHelper::safe_parse(response->body);
    if (!parsed) {
        LCU_LOG_WARNING("LcuGateway", "Unparseable response from " + path + ": " + parsed.error());
        return std::unexpected(core::GatewayError::Parse);
    }
    return std::move(*parsed);
}

} // namespace lcu_companion::services
