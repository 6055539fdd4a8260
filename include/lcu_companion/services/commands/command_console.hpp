#pragma once

#include "lcu_companion/services/commands/command_service.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace lcu_companion::services {

// Line protocol for driving CommandService from a terminal or a parent
// process. A line is "<command> [arguments]"; every reply is one JSON object,
// either {"ok":true,"result":...} or {"ok":false,"error":...,"message":...}.
// set_config takes a partial object; missing keys keep their current value.
//
//   set_config {"autoOpen":true}
//   call_stats_api lol_get_summoner_profile {"game_name":"x","tag_line":"y"}
class CommandConsole {
public:
    explicit CommandConsole(CommandService& commands);

    nlohmann::json execute(std::string_view line);

    static std::string help_text();

private:
    CommandService& m_commands;
};

} // namespace lcu_companion::services
