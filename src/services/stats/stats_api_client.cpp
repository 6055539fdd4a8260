#include "lcu_companion/services/stats/stats_api_client.hpp"
#include "lcu_companion/services/network/request_builder.hpp"
#include "lcu_companion/utils/json_helper.hpp"
#include "lcu_companion/utils/logger.hpp"

#include <algorithm>
#include <thread>

namespace lcu_companion::services {

StatsApiClient::StatsApiClient(std::shared_ptr<HttpClient> http_client, core::StatsApiSettings settings)
    : m_http_client(std::move(http_client))
    , m_settings(std::move(settings)) {
    LCU_LOG_DEBUG("StatsApi", "Using endpoint " + m_settings.endpoint);
}

std::expected<nlohmann::json, StatsApiFailure> StatsApiClient::call(const std::string& function_name,
                                                                   const nlohmann::json& arguments) {
    const auto key = cache_key(function_name, arguments);
    if (auto cached = cached_result(key)) {
        LCU_LOG_DEBUG("StatsApi", "Cache hit for " + function_name);
        return std::move(*cached);
    }

    wait_for_slot();

    const auto payload = build_request(function_name, arguments, next_request_id());
    LCU_LOG_INFO("StatsApi", "Calling " + function_name + " with " + utils::JsonHelper::dump(arguments));

    auto request = RequestBuilder(HttpMethod::POST, m_settings.endpoint)
        .json(payload)
        .timeout(m_settings.timeout)
        .build();

    auto response = m_http_client->execute(request);
    if (!response) {
        LCU_LOG_ERROR("StatsApi", "Request failed: " + to_string(response.error()));
        return std::unexpected(StatsApiFailure{
            core::StatsApiError::Transport,
            "Network error: " + to_string(response.error()),
            nullptr
        });
    }

    if (!response->ok()) {
        LCU_LOG_ERROR("StatsApi", "Service returned HTTP " + std::to_string(response->status));
        return std::unexpected(StatsApiFailure{
            core::StatsApiError::Transport,
            "HTTP " + std::to_string(response->status),
            nullptr
        });
    }

    auto result = interpret_response(response->body);
    if (!result) {
        LCU_LOG_WARNING("StatsApi", function_name + " failed: " + result.error().message);
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(m_cache_mutex);
        m_cache[key] = CacheEntry<nlohmann::json>{*result, std::chrono::steady_clock::now(), m_settings.cache_ttl};
    }
    return result;
}

void StatsApiClient::clear_cache() {
    std::lock_guard<std::mutex> lock(m_cache_mutex);
    m_cache.clear();
}

size_t StatsApiClient::cache_size() const {
    std::lock_guard<std::mutex> lock(m_cache_mutex);
    return m_cache.size();
}

nlohmann::json StatsApiClient::build_request(const std::string& function_name,
                                             const nlohmann::json& arguments,
                                             std::uint64_t request_id) {
    return {
        {"jsonrpc", "2.0"},
        {"id", request_id},
        {"method", "tools/call"},
        {"params", {
            {"name", function_name},
            {"arguments", arguments}
        }}
    };
}

std::expected<nlohmann::json, StatsApiFailure> StatsApiClient::interpret_response(std::string_view body) {
    auto parsed = utils::JsonHelper::safe_parse(body);
    if (!parsed || !parsed->is_object()) {
        return std::unexpected(StatsApiFailure{
            core::StatsApiError::NoResponse,
            "Failed to parse response",
            nullptr
        });
    }

    if (utils::JsonHelper::has_field(*parsed, "error")) {
        const auto& error = parsed->at("error");
        return std::unexpected(StatsApiFailure{
            core::StatsApiError::Remote,
            "Stats API error: " + utils::JsonHelper::dump(error),
            error
        });
    }

    if (utils::JsonHelper::has_field(*parsed, "result")) {
        return parsed->at("result");
    }

    return std::unexpected(StatsApiFailure{
        core::StatsApiError::NoResponse,
        "No result or error from stats API",
        nullptr
    });
}

std::string StatsApiClient::cache_key(const std::string& function_name, const nlohmann::json& arguments) {
    return function_name + "-" + utils::JsonHelper::dump(arguments);
}

std::uint64_t StatsApiClient::next_request_id() {
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

std::optional<nlohmann::json> StatsApiClient::cached_result(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_cache_mutex);
    auto it = m_cache.find(key);
    if (it != m_cache.end() && it->second.is_valid()) {
        return it->second.data;
    }
    return std::nullopt;
}

void StatsApiClient::wait_for_slot() {
    std::chrono::steady_clock::time_point slot;
    {
        // Reserve the next slot so concurrent callers queue up behind each other
        std::lock_guard<std::mutex> lock(m_throttle_mutex);
        const auto now = std::chrono::steady_clock::now();
        slot = std::max(now, m_next_slot);
        m_next_slot = slot + m_settings.min_interval;
    }
    std::this_thread::sleep_until(slot);
}

} // namespace lcu_companion::services
