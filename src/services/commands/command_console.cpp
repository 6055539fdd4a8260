#include "lcu_companion/services/commands/command_console.hpp"
#include "lcu_companion/core/model_json.hpp"
#include "lcu_companion/utils/json_helper.hpp"
#include "lcu_companion/utils/logger.hpp"

#include <cctype>
#include <utility>

namespace lcu_companion::services {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

// Splits off the first whitespace separated word
std::pair<std::string_view, std::string_view> next_word(std::string_view text) {
    text = trim(text);
    const auto end = text.find_first_of(" \t");
    if (end == std::string_view::npos) {
        return {text, {}};
    }
    return {text.substr(0, end), trim(text.substr(end))};
}

nlohmann::json success(nlohmann::json result = nullptr) {
    return {{"ok", true}, {"result", std::move(result)}};
}

nlohmann::json failure(const std::string& error, const std::string& message,
                       nlohmann::json detail = nullptr) {
    nlohmann::json reply{{"ok", false}, {"error", error}, {"message", message}};
    if (!detail.is_null()) {
        reply["detail"] = std::move(detail);
    }
    return reply;
}

nlohmann::json failure(const CommandFailure& failure_info) {
    return failure(core::to_string(failure_info.error), failure_info.message, failure_info.detail);
}

template<typename T, typename Convert>
nlohmann::json reply(const CommandResult<T>& result, Convert&& convert) {
    if (!result) {
        return failure(result.error());
    }
    return success(convert(*result));
}

nlohmann::json reply(const CommandResult<void>& result) {
    if (!result) {
        return failure(result.error());
    }
    return success();
}

std::expected<nlohmann::json, std::string> parse_arguments(std::string_view text) {
    if (text.empty()) {
        return nlohmann::json::object();
    }
    return utils::JsonHelper::safe_parse(text);
}

} // namespace

CommandConsole::CommandConsole(CommandService& commands)
    : m_commands(commands) {}

nlohmann::json CommandConsole::execute(std::string_view line) {
    // Replies echo parts of the line and must stay serializable
    if (!utils::JsonHelper::is_valid_utf8(line)) {
        return failure("InvalidArguments", "Command line is not valid UTF-8");
    }

    const auto [command, rest] = next_word(line);
    const auto as_json = [](const auto& value) { return core::to_json(value); };
    const auto identity = [](const auto& value) { return nlohmann::json(value); };

    LCU_LOG_DEBUG("Console", "Command: " + std::string(command));

    if (command == "app_ready") {
        return reply(m_commands.app_ready(), as_json);
    }
    if (command == "get_connection_status") {
        return reply(m_commands.get_connection_status(), identity);
    }
    if (command == "get_config") {
        return reply(m_commands.get_config(), as_json);
    }
    if (command == "set_config") {
        auto arguments = parse_arguments(rest);
        if (!arguments) {
            return failure("InvalidArguments", arguments.error());
        }
        if (!arguments->is_object()) {
            return failure("InvalidArguments", "set_config expects a JSON object");
        }
        // Keys not given keep their current value
        auto merged = core::to_json(m_commands.get_config().value_or(core::UserConfig{}));
        merged.update(*arguments);
        auto config = core::parse_user_config(merged);
        if (!config) {
            return failure("InvalidArguments", config.error());
        }
        return reply(m_commands.set_config(*config));
    }
    if (command == "open_stats_link") {
        return reply(m_commands.open_stats_link(), identity);
    }
    if (command == "get_client_info") {
        return reply(m_commands.get_client_info(), as_json);
    }
    if (command == "dodge") {
        return reply(m_commands.dodge());
    }
    if (command == "toggle_dodge_watch") {
        return reply(m_commands.toggle_dodge_watch(), as_json);
    }
    if (command == "get_dodge_watch_state") {
        return reply(m_commands.get_dodge_watch_state(), as_json);
    }
    if (command == "call_stats_api") {
        const auto [function_name, raw_arguments] = next_word(rest);
        if (function_name.empty()) {
            return failure("InvalidArguments", "Usage: call_stats_api <function> [json arguments]");
        }
        auto arguments = parse_arguments(raw_arguments);
        if (!arguments) {
            return failure("InvalidArguments", arguments.error());
        }
        return reply(m_commands.call_stats_api(std::string(function_name), *arguments), identity);
    }
    if (command == "help") {
        return success(help_text());
    }

    return failure("UnknownCommand", "Unknown command '" + std::string(command) + "', try 'help'");
}

std::string CommandConsole::help_text() {
    return "app_ready | get_connection_status | get_config | set_config <json> | "
           "open_stats_link | get_client_info | dodge | toggle_dodge_watch | "
           "get_dodge_watch_state | call_stats_api <function> [json] | quit";
}

} // namespace lcu_companion::services
