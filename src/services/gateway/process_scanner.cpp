#include "lcu_companion/services/gateway/process_scanner.hpp"
#include "lcu_companion/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>
#include <system_error>

namespace lcu_companion::services {

namespace {

std::optional<std::string_view> argument_value(std::string_view arg, std::string_view key) {
    if (arg.size() <= key.size() + 1 || arg.substr(0, key.size()) != key || arg[key.size()] != '=') {
        return std::nullopt;
    }
    return arg.substr(key.size() + 1);
}

std::optional<std::uint16_t> parse_port(std::string_view value) {
    std::uint16_t port = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
    if (ec != std::errc{} || ptr != value.data() + value.size() || port == 0) {
        return std::nullopt;
    }
    return port;
}

bool iequals(std::string_view a, std::string_view b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

} // namespace

std::vector<std::string> split_command_line(std::string_view raw) {
    std::vector<std::string> args;
    std::size_t start = 0;
    while (start < raw.size()) {
        auto end = raw.find('\0', start);
        if (end == std::string_view::npos) end = raw.size();
        if (end > start) {
            args.emplace_back(raw.substr(start, end - start));
        }
        start = end + 1;
    }
    return args;
}

std::optional<core::GatewayEndpointInfo> parse_client_arguments(
    const std::vector<std::string>& args, std::uint32_t pid) {
    core::GatewayEndpointInfo info;
    info.pid = pid;

    for (const auto& arg : args) {
        if (auto v = argument_value(arg, "--app-port")) {
            if (auto port = parse_port(*v)) info.remoting_port = *port;
        } else if (auto v = argument_value(arg, "--remoting-auth-token")) {
            info.remoting_token = std::string(*v);
        } else if (auto v = argument_value(arg, "--riotclient-app-port")) {
            if (auto port = parse_port(*v)) info.app_port = *port;
        } else if (auto v = argument_value(arg, "--riotclient-auth-token")) {
            info.app_token = std::string(*v);
        } else if (auto v = argument_value(arg, "--region")) {
            info.region = std::string(*v);
        }
    }

    if (info.remoting_port == 0 || info.remoting_token.empty()) {
        return std::nullopt;
    }
    return info;
}

ProcClientProcessScanner::ProcClientProcessScanner(std::string process_name,
                                                   std::filesystem::path proc_root)
    : m_process_name(std::move(process_name)), m_proc_root(std::move(proc_root)) {}

std::optional<core::GatewayEndpointInfo> ProcClientProcessScanner::find_client() {
    for (const auto pid : enumerate_processes()) {
        auto args = read_command_line(pid);
        if (!args || args->empty() || !matches_process_name(args->front())) {
            continue;
        }

        if (auto info = parse_client_arguments(*args, pid)) {
            return info;
        }
        LCU_LOG_DEBUG("ProcessScanner", "Process " + std::to_string(pid) +
                      " matched but has no usable connection arguments yet");
    }
    return std::nullopt;
}

std::vector<std::uint32_t> ProcClientProcessScanner::enumerate_processes() const {
    std::vector<std::uint32_t> pids;

    std::error_code ec;
    std::filesystem::directory_iterator it(m_proc_root, ec);
    if (ec) {
        LCU_LOG_WARNING("ProcessScanner", "Cannot read " + m_proc_root.string() + ": " + ec.message());
        return pids;
    }

    const auto end = std::filesystem::end(it);
    for (; it != end; it.increment(ec)) {
        if (ec) break;
        const auto name = it->path().filename().string();
        std::uint32_t pid = 0;
        const auto [ptr, parse_ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
        if (parse_ec == std::errc{} && ptr == name.data() + name.size()) {
            pids.push_back(pid);
        }
    }
    return pids;
}

std::optional<std::vector<std::string>> ProcClientProcessScanner::read_command_line(std::uint32_t pid) const {
    // Processes routinely vanish between listing and reading
    std::ifstream file(m_proc_root / std::to_string(pid) / "cmdline", std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    const std::string raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return split_command_line(raw);
}

bool ProcClientProcessScanner::matches_process_name(std::string_view argv0) const {
    const auto slash = argv0.find_last_of("/\\");
    auto base = slash == std::string_view::npos ? argv0 : argv0.substr(slash + 1);

    const auto dot = base.rfind('.');
    if (dot != std::string_view::npos && iequals(base.substr(dot), ".exe")) {
        base = base.substr(0, dot);
    }
    return iequals(base, m_process_name);
}

} // namespace lcu_companion::services
