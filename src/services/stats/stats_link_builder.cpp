#include "lcu_companion/services/stats/stats_link_builder.hpp"
#include "lcu_companion/utils/logger.hpp"
#include "lcu_companion/utils/url_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace lcu_companion::services {

namespace {

std::string to_lower(std::string_view value) {
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// u.gg addresses regions by platform id
std::string ugg_platform_id(std::string_view region) {
    static constexpr std::array<std::pair<std::string_view, std::string_view>, 11> platforms{{
        {"NA", "na1"}, {"EUW", "euw1"}, {"EUNE", "eun1"}, {"KR", "kr"},
        {"BR", "br1"}, {"JP", "jp1"}, {"LAN", "la1"}, {"LAS", "la2"},
        {"OCE", "oc1"}, {"TR", "tr1"}, {"SG", "sg2"}
    }};

    for (const auto& [name, platform] : platforms) {
        if (name == region) {
            return std::string(platform);
        }
    }
    return to_lower(region);
}

} // namespace

std::string to_string(StatsProvider provider) {
    switch (provider) {
        case StatsProvider::OpGg: return "opgg";
        case StatsProvider::DeepLol: return "deeplol";
        case StatsProvider::UGg: return "ugg";
    }
    return "opgg";
}

std::optional<StatsProvider> stats_provider_from_string(std::string_view name) {
    const auto lowered = to_lower(name);
    if (lowered == "opgg") return StatsProvider::OpGg;
    if (lowered == "deeplol") return StatsProvider::DeepLol;
    if (lowered == "ugg") return StatsProvider::UGg;
    return std::nullopt;
}

std::string StatsLinkBuilder::region_short_code(std::string_view web_region) {
    if (web_region == "SG2") {
        return "SG";
    }
    return std::string(web_region);
}

std::string StatsLinkBuilder::summoner_list(const core::Lobby& lobby) {
    std::string list;
    for (const auto& participant : lobby.participants) {
        if (!list.empty()) {
            list += ',';
        }
        list += participant.display_name + "#" + participant.name_tag;
    }
    return list;
}

std::string StatsLinkBuilder::build_multisearch_url(StatsProvider provider,
                                                    std::string_view region,
                                                    const core::Lobby& lobby) {
    const auto summoners = utils::UrlUtils::encode(summoner_list(lobby));

    switch (provider) {
        case StatsProvider::DeepLol:
            return "https://www.deeplol.gg/multi/" + std::string(region) + "/" + summoners;
        case StatsProvider::UGg:
            return "https://u.gg/multisearch?summoners=" + summoners + "&region=" + ugg_platform_id(region);
        case StatsProvider::OpGg:
            break;
    }
    return "https://www.op.gg/multisearch/" + to_lower(region) + "?summoners=" + summoners;
}

std::string StatsLinkBuilder::build_multisearch_url(std::string_view provider_name,
                                                    std::string_view region,
                                                    const core::Lobby& lobby) {
    auto provider = stats_provider_from_string(provider_name);
    if (!provider) {
        LCU_LOG_WARNING("StatsLink", "Unknown provider '" + std::string(provider_name) + "', using opgg");
        provider = StatsProvider::OpGg;
    }
    return build_multisearch_url(*provider, region, lobby);
}

} // namespace lcu_companion::services
