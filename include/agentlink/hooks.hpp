#ifndef AGENTLINK_HOOKS_HPP
#define AGENTLINK_HOOKS_HPP

#include <agentlink/cancellation.hpp>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentlink
{

using json = nlohmann::json;

// ============================================================================
// Hook Events
// ============================================================================

/// Lifecycle events the agent process can raise hooks for.
/// Declaration order is the order in which hook callback IDs are assigned.
enum class HookEvent
{
    PreToolUse,
    PostToolUse,
    UserPromptSubmit,
    Stop,
    SubagentStop,
    PreCompact
};

/// Wire name of an event (e.g. "PreToolUse")
const char* to_string(HookEvent event);

/// Parse a wire name; nullopt for events this library does not know
std::optional<HookEvent> parse_hook_event(const std::string& name);

// ============================================================================
// Hook Input Types
// ============================================================================

/// Fields common to every hook event
struct BaseHookInput
{
    std::string session_id;
    std::string transcript_path;
    std::string cwd;
    std::optional<std::string> permission_mode;
};

struct PreToolUseHookInput : BaseHookInput
{
    std::string tool_name;
    json tool_input = json::object();
};

struct PostToolUseHookInput : BaseHookInput
{
    std::string tool_name;
    json tool_input = json::object();
    json tool_response; // whatever the tool produced; may be any JSON value
};

struct UserPromptSubmitHookInput : BaseHookInput
{
    std::string prompt;
};

struct StopHookInput : BaseHookInput
{
    bool stop_hook_active = false;
};

struct SubagentStopHookInput : BaseHookInput
{
    bool stop_hook_active = false;
};

struct PreCompactHookInput : BaseHookInput
{
    std::string trigger; // "manual" or "auto"
    std::optional<std::string> custom_instructions;
};

/// Input for an event name this library does not recognize (forward compatibility)
struct UnknownHookInput
{
    std::string hook_event_name;
    json raw;
};

using HookInput =
    std::variant<PreToolUseHookInput, PostToolUseHookInput, UserPromptSubmitHookInput,
                 StopHookInput, SubagentStopHookInput, PreCompactHookInput, UnknownHookInput>;

/// Build the typed input selected by input["hook_event_name"].
/// Missing or mistyped fields take their defaults; never throws for object input.
HookInput parse_hook_input(const json& input);

/// Event of a parsed input; nullopt for UnknownHookInput
std::optional<HookEvent> hook_event_of(const HookInput& input);

// ============================================================================
// Hook Output Types
// ============================================================================

struct PreToolUseHookSpecificOutput
{
    std::optional<std::string> permission_decision; // "allow", "deny" or "ask"
    std::optional<std::string> permission_decision_reason;
    std::optional<json> updated_input;

    json to_json() const;
};

struct PostToolUseHookSpecificOutput
{
    std::optional<std::string> additional_context;

    json to_json() const;
};

struct UserPromptSubmitHookSpecificOutput
{
    std::optional<std::string> additional_context;

    json to_json() const;
};

/// Structured hook result. Unset fields are omitted from the reply.
struct HookOutput
{
    /// Whether the agent should proceed (wire: "continue")
    std::optional<bool> continue_;
    /// Hide stdout from transcript mode
    std::optional<bool> suppress_output;
    /// Message shown when continue_ is false
    std::optional<std::string> stop_reason;

    /// "approve" or "block"
    std::optional<std::string> decision;
    /// Warning shown to the user
    std::optional<std::string> system_message;
    /// Feedback for the model about the decision
    std::optional<std::string> reason;

    /// Event-specific output, usually built with one of the *HookSpecificOutput helpers
    std::optional<json> hook_specific_output;

    /// Defer the hook result (wire: "async")
    bool async_ = false;
    std::optional<int> async_timeout_ms;

    json to_json() const;
};

// ============================================================================
// Hook Callbacks and Registration
// ============================================================================

/// Context handed to every hook invocation
struct HookContext
{
    /// Fires when the session closes
    CancellationToken signal;
};

/// Callback invoked when a registered hook is triggered.
/// Throwing is allowed: the exception becomes an error reply for that request.
using HookCallback = std::function<HookOutput(
    const HookInput& input, const std::optional<std::string>& tool_use_id,
    const HookContext& context)>;

/// Hook matcher configuration
struct HookMatcher
{
    /// Tool name pattern (e.g. "Bash", "Write|Edit"); nullopt matches everything
    std::optional<std::string> matcher;

    /// Callbacks to invoke when the pattern matches
    std::vector<HookCallback> hooks;

    /// Timeout in seconds for the callbacks of this matcher. Accepts fractional seconds.
    std::optional<double> timeout;

    HookMatcher() = default;
    HookMatcher(std::optional<std::string> m, std::vector<HookCallback> h,
                std::optional<double> t = std::nullopt)
        : matcher(std::move(m)), hooks(std::move(h)), timeout(t)
    {
    }
};

} // namespace agentlink

#endif // AGENTLINK_HOOKS_HPP
