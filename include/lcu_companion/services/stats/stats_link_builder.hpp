#pragma once

#include "lcu_companion/core/models.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace lcu_companion::services {

enum class StatsProvider {
    OpGg,
    DeepLol,
    UGg
};

std::string to_string(StatsProvider provider);
std::optional<StatsProvider> stats_provider_from_string(std::string_view name);

class StatsLinkBuilder {
public:
    // "SG2" becomes "SG"; every other web region is already a short code
    static std::string region_short_code(std::string_view web_region);

    // "name#tag" for each participant, comma separated, in lobby order
    static std::string summoner_list(const core::Lobby& lobby);

    static std::string build_multisearch_url(StatsProvider provider,
                                             std::string_view region,
                                             const core::Lobby& lobby);

    // Unknown provider names fall back to op.gg
    static std::string build_multisearch_url(std::string_view provider_name,
                                             std::string_view region,
                                             const core::Lobby& lobby);
};

} // namespace lcu_companion::services
