#ifndef AGENTLINK_TYPES_HPP
#define AGENTLINK_TYPES_HPP

#include <agentlink/hooks.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentlink
{

using json = nlohmann::json;

namespace mcp
{
class McpServer;
} // namespace mcp

// ============================================================================
// Permission Update Types
// ============================================================================

/// Permission update destination options
namespace PermissionUpdateDestination
{
constexpr const char* UserSettings = "userSettings";
constexpr const char* ProjectSettings = "projectSettings";
constexpr const char* LocalSettings = "localSettings";
constexpr const char* Session = "session";
} // namespace PermissionUpdateDestination

/// Permission behavior options
namespace PermissionBehavior
{
constexpr const char* Allow = "allow";
constexpr const char* Deny = "deny";
constexpr const char* Ask = "ask";
} // namespace PermissionBehavior

/// Permission rule value
struct PermissionRuleValue
{
    std::string tool_name;
    std::optional<std::string> rule_content = std::nullopt;
};

/// Permission update, as suggested by the agent or returned by the permission callback
struct PermissionUpdate
{
    std::string type; // "addRules", "replaceRules", "removeRules", "setMode", "addDirectories",
                      // "removeDirectories"
    std::optional<std::vector<PermissionRuleValue>> rules = std::nullopt;
    std::optional<std::string> behavior = std::nullopt; // PermissionBehavior value
    std::optional<std::string> mode = std::nullopt;
    std::optional<std::vector<std::string>> directories = std::nullopt;
    std::optional<std::string> destination = std::nullopt; // PermissionUpdateDestination value

    /// Wire form; only the fields relevant to `type` are written
    json to_json() const;

    /// Lenient parse: unknown fields are ignored and mistyped fields are left unset
    static PermissionUpdate from_json(const json& j);
};

// ============================================================================
// Tool Permission Context and Result Types
// ============================================================================

/// Context information for tool permission callbacks
struct ToolPermissionContext
{
    std::vector<PermissionUpdate> suggestions;
    std::optional<std::string> blocked_path;
};

/// Permission result: Allow
struct PermissionResultAllow
{
    std::optional<json> updated_input = std::nullopt;
    std::optional<std::vector<PermissionUpdate>> updated_permissions = std::nullopt;
};

/// Permission result: Deny
struct PermissionResultDeny
{
    std::string message = "";
    bool interrupt = false;
};

using PermissionResult = std::variant<PermissionResultAllow, PermissionResultDeny>;

/// Callback invoked when the agent asks whether a tool may run.
/// @param tool_name Tool name (e.g., "Read", "Write", "Bash")
/// @param input Tool-specific arguments (always an object)
/// @param context Suggestions and blocked path from the agent
using ToolPermissionCallback = std::function<PermissionResult(
    const std::string& tool_name, const json& input, const ToolPermissionContext& context)>;

// ============================================================================
// Handshake result
// ============================================================================

/// Parsed reply to the initialize handshake
struct InitializeResult
{
    /// Command names; object entries contribute their "name" field
    std::vector<std::string> commands;
    std::string output_style;
    json raw = json::object();

    /// Reads "commands" (or the older "supported_commands") and "output_style"
    static InitializeResult from_json(const json& j);
};

// ============================================================================
// Session configuration
// ============================================================================

/// Where reverse requests run
enum class DispatchMode
{
    Inline,  // on the reader thread, in arrival order
    Detached // one thread per request, joined at close
};

/// What to do with reverse requests whose subtype is not recognized
enum class UnknownRequestPolicy
{
    Ignore,
    ReplyWithError
};

/// Environment variable that may raise the initialize timeout (milliseconds)
constexpr const char* INIT_TIMEOUT_ENV = "AGENTLINK_INIT_TIMEOUT_MS";

struct SessionOptions
{
    /// Handshake timeout. AGENTLINK_INIT_TIMEOUT_MS can only raise it.
    std::chrono::milliseconds initialize_timeout{60000};

    /// Timeout for every other outbound control request
    std::chrono::milliseconds control_timeout{5000};

    /// Buffered application messages before the reader blocks
    size_t message_queue_capacity = 1024;

    /// Hook configurations organized by event type
    /// Example:
    /// ```cpp
    /// opts.hooks[HookEvent::PreToolUse] = {
    ///     HookMatcher{"Bash", {my_hook_callback}}
    /// };
    /// ```
    std::map<HookEvent, std::vector<HookMatcher>> hooks;

    /// Callback invoked when tool permission is requested.
    /// If not set, every tool is denied.
    /// Note: runs on the reader thread in Inline mode; blocking delays message processing.
    std::optional<ToolPermissionCallback> tool_permission_callback;

    /// In-process MCP servers keyed by the name the agent uses to address them
    std::map<std::string, std::shared_ptr<mcp::McpServer>> mcp_servers;

    DispatchMode dispatch_mode = DispatchMode::Inline;
    UnknownRequestPolicy unknown_request_policy = UnknownRequestPolicy::Ignore;

    /// Logger level ("trace", "debug", "info", "warn", "error", "off").
    /// Overrides AGENTLINK_LOG_LEVEL when set.
    std::optional<std::string> log_level;
};

} // namespace agentlink

#endif // AGENTLINK_TYPES_HPP
