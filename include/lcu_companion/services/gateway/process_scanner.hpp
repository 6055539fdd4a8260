#pragma once

#include "lcu_companion/core/models.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lcu_companion::services {

// Locates a running game client and reads its connection parameters
class ProcessScanner {
public:
    virtual ~ProcessScanner() = default;
    virtual std::optional<core::GatewayEndpointInfo> find_client() = 0;
};

// Walks /proc looking for a process whose argv[0] names the client executable.
// Under Wine argv[0] is a Windows path, so matching is on the file stem.
class ProcClientProcessScanner : public ProcessScanner {
public:
    explicit ProcClientProcessScanner(std::string process_name,
                                      std::filesystem::path proc_root = "/proc");

    std::optional<core::GatewayEndpointInfo> find_client() override;

private:
    std::vector<std::uint32_t> enumerate_processes() const;
    std::optional<std::vector<std::string>> read_command_line(std::uint32_t pid) const;
    bool matches_process_name(std::string_view argv0) const;

    std::string m_process_name;
    std::filesystem::path m_proc_root;
};

// Splits a NUL-separated /proc/<pid>/cmdline blob
std::vector<std::string> split_command_line(std::string_view raw);

// Reads --app-port, --remoting-auth-token, --riotclient-app-port,
// --riotclient-auth-token and --region. The League client pair is mandatory.
std::optional<core::GatewayEndpointInfo> parse_client_arguments(
    const std::vector<std::string>& args, std::uint32_t pid);

} // namespace lcu_companion::services
