#include "internal/json_util.hpp"

#include <agentlink/hooks.hpp>

namespace agentlink
{

using internal::get_bool;
using internal::get_object;
using internal::get_optional_string;
using internal::get_string;

const char* to_string(HookEvent event)
{
    switch (event)
    {
    case HookEvent::PreToolUse:
        return "PreToolUse";
    case HookEvent::PostToolUse:
        return "PostToolUse";
    case HookEvent::UserPromptSubmit:
        return "UserPromptSubmit";
    case HookEvent::Stop:
        return "Stop";
    case HookEvent::SubagentStop:
        return "SubagentStop";
    case HookEvent::PreCompact:
        return "PreCompact";
    }
    return "";
}

std::optional<HookEvent> parse_hook_event(const std::string& name)
{
    if (name == "PreToolUse")
        return HookEvent::PreToolUse;
    if (name == "PostToolUse")
        return HookEvent::PostToolUse;
    if (name == "UserPromptSubmit")
        return HookEvent::UserPromptSubmit;
    if (name == "Stop")
        return HookEvent::Stop;
    if (name == "SubagentStop")
        return HookEvent::SubagentStop;
    if (name == "PreCompact")
        return HookEvent::PreCompact;
    return std::nullopt;
}

namespace
{
void fill_base(BaseHookInput& base, const json& input)
{
    base.session_id = get_string(input, "session_id");
    base.transcript_path = get_string(input, "transcript_path");
    base.cwd = get_string(input, "cwd");
    base.permission_mode = get_optional_string(input, "permission_mode");
}
} // namespace

HookInput parse_hook_input(const json& input)
{
    const std::string event_name = get_string(input, "hook_event_name");
    auto event = parse_hook_event(event_name);
    if (!event)
        return UnknownHookInput{event_name, input.is_object() ? input : json::object()};

    switch (*event)
    {
    case HookEvent::PreToolUse:
    {
        PreToolUseHookInput typed;
        fill_base(typed, input);
        typed.tool_name = get_string(input, "tool_name");
        typed.tool_input = get_object(input, "tool_input");
        return typed;
    }
    case HookEvent::PostToolUse:
    {
        PostToolUseHookInput typed;
        fill_base(typed, input);
        typed.tool_name = get_string(input, "tool_name");
        typed.tool_input = get_object(input, "tool_input");
        if (input.contains("tool_response"))
            typed.tool_response = input.at("tool_response");
        return typed;
    }
    case HookEvent::UserPromptSubmit:
    {
        UserPromptSubmitHookInput typed;
        fill_base(typed, input);
        typed.prompt = get_string(input, "prompt");
        return typed;
    }
    case HookEvent::Stop:
    {
        StopHookInput typed;
        fill_base(typed, input);
        typed.stop_hook_active = get_bool(input, "stop_hook_active");
        return typed;
    }
    case HookEvent::SubagentStop:
    {
        SubagentStopHookInput typed;
        fill_base(typed, input);
        typed.stop_hook_active = get_bool(input, "stop_hook_active");
        return typed;
    }
    case HookEvent::PreCompact:
    {
        PreCompactHookInput typed;
        fill_base(typed, input);
        typed.trigger = get_string(input, "trigger");
        typed.custom_instructions = get_optional_string(input, "custom_instructions");
        return typed;
    }
    }

    return UnknownHookInput{event_name, input};
}

std::optional<HookEvent> hook_event_of(const HookInput& input)
{
    if (std::holds_alternative<PreToolUseHookInput>(input))
        return HookEvent::PreToolUse;
    if (std::holds_alternative<PostToolUseHookInput>(input))
        return HookEvent::PostToolUse;
    if (std::holds_alternative<UserPromptSubmitHookInput>(input))
        return HookEvent::UserPromptSubmit;
    if (std::holds_alternative<StopHookInput>(input))
        return HookEvent::Stop;
    if (std::holds_alternative<SubagentStopHookInput>(input))
        return HookEvent::SubagentStop;
    if (std::holds_alternative<PreCompactHookInput>(input))
        return HookEvent::PreCompact;
    return std::nullopt;
}

json PreToolUseHookSpecificOutput::to_json() const
{
    json out = {{"hookEventName", "PreToolUse"}};
    if (permission_decision.has_value())
        out["permissionDecision"] = *permission_decision;
    if (permission_decision_reason.has_value())
        out["permissionDecisionReason"] = *permission_decision_reason;
    if (updated_input.has_value())
        out["updatedInput"] = *updated_input;
    return out;
}

json PostToolUseHookSpecificOutput::to_json() const
{
    json out = {{"hookEventName", "PostToolUse"}};
    if (additional_context.has_value())
        out["additionalContext"] = *additional_context;
    return out;
}

json UserPromptSubmitHookSpecificOutput::to_json() const
{
    json out = {{"hookEventName", "UserPromptSubmit"}};
    if (additional_context.has_value())
        out["additionalContext"] = *additional_context;
    return out;
}

json HookOutput::to_json() const
{
    json out = json::object();

    if (continue_.has_value())
        out["continue"] = *continue_;
    if (suppress_output.has_value())
        out["suppressOutput"] = *suppress_output;
    if (stop_reason.has_value())
        out["stopReason"] = *stop_reason;
    if (decision.has_value())
        out["decision"] = *decision;
    if (system_message.has_value())
        out["systemMessage"] = *system_message;
    if (reason.has_value())
        out["reason"] = *reason;
    if (hook_specific_output.has_value() && !hook_specific_output->is_null())
        out["hookSpecificOutput"] = *hook_specific_output;

    if (async_)
    {
        out["async"] = true;
        if (async_timeout_ms.has_value())
            out["asyncTimeout"] = *async_timeout_ms;
    }

    return out;
}

} // namespace agentlink
