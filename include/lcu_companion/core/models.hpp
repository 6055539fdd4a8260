#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lcu_companion {
namespace core {

// ============================================================================
// Application-wide types
// ============================================================================

enum class ApplicationState {
    NotInitialized,
    Initializing,
    Running,
    Stopping,
    Stopped,
    Error
};

enum class ApplicationError {
    InitializationFailed,
    ConfigurationError,
    AlreadyRunning,
    ServiceUnavailable
};

enum class ConfigError {
    FileNotFound,
    InvalidFormat,
    ValidationError,
    PermissionDenied
};

// ============================================================================
// Domain errors
// ============================================================================

enum class GatewayError {
    Unavailable,  // no client process connected
    Transport,    // request failed, timed out or returned non-2xx
    Parse         // body was not the expected shape
};

enum class StatsApiError {
    NoResponse,   // neither result nor error, or unreadable body
    Transport,
    Remote        // service returned a JSON-RPC error object
};

// Errors surfaced at the command boundary
enum class CommandError {
    GatewayUnavailable,
    TransportError,
    ParseError,
    PersistenceError,
    RemoteApiError,
    NoResponse,
    LaunchFailed
};

std::string to_string(ApplicationState state);
std::string to_string(ApplicationError error);
std::string to_string(ConfigError error);
std::string to_string(GatewayError error);
std::string to_string(StatsApiError error);
std::string to_string(CommandError error);

// ============================================================================
// Gateway types
// ============================================================================

// The game client serves two APIs from one process, each on its own port
enum class ApiTarget {
    RiotClient,    // chat, region/locale
    LeagueClient   // champ select, login, gameflow, matchmaking
};

struct GatewayEndpointInfo {
    std::uint32_t pid = 0;
    std::uint16_t remoting_port = 0;
    std::string remoting_token;
    std::uint16_t app_port = 0;
    std::string app_token;
    std::string region;

    bool operator==(const GatewayEndpointInfo&) const = default;
};

// endpoint_info is present iff connected
struct ConnectionState {
    bool connected = false;
    std::optional<GatewayEndpointInfo> endpoint_info;
};

// ============================================================================
// User configuration (config.json)
// ============================================================================

struct UserConfig {
    bool auto_open = false;
    bool auto_accept = false;
    std::chrono::milliseconds accept_delay{2000};
    std::string multi_provider = "opgg";
    std::optional<std::string> region_override;
    bool auto_select_ivern = false;
    bool auto_lock_ivern = false;  // hover only when false

    // Keys this build does not know about, written back untouched
    nlohmann::json extra = nlohmann::json::object();

    bool operator==(const UserConfig&) const = default;
};

// ============================================================================
// Lobby and champion select
// ============================================================================

struct Participant {
    std::string id;            // wire "cid"
    std::string display_name;  // wire "game_name"
    std::string name_tag;      // wire "game_tag"
    std::string name;
    std::string pid;
    std::string puuid;
    std::string region;
    bool muted = false;
};

struct Lobby {
    std::vector<Participant> participants;

    [[nodiscard]] bool empty() const { return participants.empty(); }
    [[nodiscard]] std::size_t size() const { return participants.size(); }
};

struct ChampSelectTimer {
    std::string phase;
    std::int64_t adjusted_time_left_ms = 0;
    std::int64_t total_time_in_phase_ms = 0;
    bool is_infinite = false;
};

struct ChampSelectTeamMember {
    std::int64_t cell_id = 0;
    std::int64_t summoner_id = 0;
    std::int64_t champion_id = 0;
    std::string assigned_position;
};

// One entry of the session's "actions" turns, flattened
struct ChampSelectAction {
    std::int64_t id = 0;
    std::int64_t actor_cell_id = -1;
    std::int64_t champion_id = 0;
    std::string type;  // "pick", "ban", ...
    bool completed = false;
    bool is_in_progress = false;
};

struct ChampSelectSession {
    std::int64_t game_id = 0;
    std::int64_t local_player_cell_id = -1;
    ChampSelectTimer timer;
    std::vector<ChampSelectTeamMember> my_team;
    std::vector<ChampSelectAction> actions;
};

struct RegionInfo {
    std::string locale;
    std::string region;
    std::string web_language;
    std::string web_region;
};

enum class DodgeWatchPhase {
    Disarmed,
    Arming,   // session fetch in flight
    Armed
};

// game_id is set only while Armed
struct DodgeWatchStatus {
    DodgeWatchPhase phase = DodgeWatchPhase::Disarmed;
    std::optional<std::int64_t> game_id;

    bool operator==(const DodgeWatchStatus&) const = default;
};

std::string to_string(DodgeWatchPhase phase);

enum class GameflowPhase {
    None,
    Lobby,
    Matchmaking,
    ReadyCheck,
    ChampSelect,
    InProgress,
    Other
};

GameflowPhase gameflow_phase_from_string(const std::string& phase);
std::string to_string(GameflowPhase phase);

// ============================================================================
// Operator settings (settings.yaml)
// ============================================================================

struct ConfigLimits {
    static constexpr auto MIN_POLL_INTERVAL = std::chrono::milliseconds(100);
    static constexpr auto MAX_POLL_INTERVAL = std::chrono::milliseconds(60000);
    static constexpr auto MIN_REQUEST_TIMEOUT = std::chrono::seconds(1);
    static constexpr auto MAX_REQUEST_TIMEOUT = std::chrono::seconds(120);
    static constexpr auto MAX_TRIGGER_THRESHOLD = std::chrono::milliseconds(30000);
    static constexpr auto MAX_MIN_INTERVAL = std::chrono::milliseconds(60000);
    static constexpr auto MAX_CACHE_TTL = std::chrono::seconds(86400);
    static constexpr auto MAX_ACCEPT_DELAY = std::chrono::milliseconds(12000);
};

struct GatewaySettings {
    std::string process_name = "LeagueClientUx";
    std::chrono::milliseconds poll_interval{2000};
    std::chrono::seconds request_timeout{10};
};

struct LobbySettings {
    std::string champ_select_marker = "champ-select";
};

struct DodgeSettings {
    std::chrono::milliseconds poll_interval{500};
    std::chrono::milliseconds trigger_threshold{1000};
};

struct StatsApiSettings {
    std::string endpoint = "https://mcp-api.op.gg/mcp";
    std::chrono::seconds timeout{15};
    std::chrono::milliseconds min_interval{1000};
    std::chrono::seconds cache_ttl{300};
};

struct AppSettings {
    std::string log_level = "info";
    GatewaySettings gateway;
    LobbySettings lobby;
    DodgeSettings dodge;
    StatsApiSettings stats_api;
};

} // namespace core
} // namespace lcu_companion
