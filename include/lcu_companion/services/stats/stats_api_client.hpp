#pragma once

#include "lcu_companion/core/models.hpp"
#include "lcu_companion/services/network/http_client.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace lcu_companion::services {

struct StatsApiFailure {
    core::StatsApiError error = core::StatsApiError::NoResponse;
    std::string message;
    // The service's error object, verbatim, when error == Remote
    nlohmann::json remote_error;
};

template<typename T>
struct CacheEntry {
    T data;
    std::chrono::steady_clock::time_point timestamp;
    std::chrono::seconds ttl;

    bool is_valid() const {
        return std::chrono::steady_clock::now() - timestamp < ttl;
    }
};

// JSON-RPC "tools/call" client for the third-party stats service.
// Requests are spaced by at least min_interval; successful results are
// cached per (function, arguments) for cache_ttl.
class StatsApiClient {
public:
    StatsApiClient(std::shared_ptr<HttpClient> http_client, core::StatsApiSettings settings);

    std::expected<nlohmann::json, StatsApiFailure> call(const std::string& function_name,
                                                        const nlohmann::json& arguments);

    void clear_cache();
    size_t cache_size() const;

    static nlohmann::json build_request(const std::string& function_name,
                                        const nlohmann::json& arguments,
                                        std::uint64_t request_id);

    // Maps a JSON-RPC response body to a result. A non-null "error" wins
    // over "result".
    static std::expected<nlohmann::json, StatsApiFailure> interpret_response(std::string_view body);

private:
    static std::string cache_key(const std::string& function_name, const nlohmann::json& arguments);
    static std::uint64_t next_request_id();

    std::optional<nlohmann::json> cached_result(const std::string& key) const;
    void wait_for_slot();

    std::shared_ptr<HttpClient> m_http_client;
    core::StatsApiSettings m_settings;

    mutable std::mutex m_cache_mutex;
    std::map<std::string, CacheEntry<nlohmann::json>> m_cache;

    std::mutex m_throttle_mutex;
    std::chrono::steady_clock::time_point m_next_slot{};
};

} // namespace lcu_companion::services
