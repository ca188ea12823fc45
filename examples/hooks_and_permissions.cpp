/**
 * @file hooks_and_permissions.cpp
 * @brief Example: hooks and tool permission decisions over stdin/stdout
 *
 * Run this program as the child of an agent process that speaks the NDJSON
 * control protocol on the child's stdin/stdout. stdout carries protocol
 * frames only, so everything human-readable goes to stderr.
 */

#include <agentlink/agentlink.hpp>
#include <iostream>
#include <unistd.h>

int main()
{
    agentlink::SessionOptions opts;

    // Block destructive shell commands before they run
    auto guard_bash = [](const agentlink::HookInput& input,
                         const std::optional<std::string>& tool_use_id,
                         const agentlink::HookContext&) -> agentlink::HookOutput
    {
        agentlink::HookOutput out;
        const auto* pre = std::get_if<agentlink::PreToolUseHookInput>(&input);
        if (!pre)
            return out;

        std::string command = pre->tool_input.value("command", "");
        std::cerr << "[HOOK] PreToolUse " << pre->tool_name;
        if (tool_use_id)
            std::cerr << " (ID: " << *tool_use_id << ")";
        std::cerr << ": " << command << "\n";

        agentlink::PreToolUseHookSpecificOutput specific;
        if (command.find("rm -rf") != std::string::npos)
        {
            specific.permission_decision = "deny";
            specific.permission_decision_reason = "recursive delete is not allowed";
            out.system_message = "Blocked: " + command;
        }
        else
        {
            specific.permission_decision = "allow";
        }
        out.hook_specific_output = specific.to_json();
        return out;
    };

    opts.hooks[agentlink::HookEvent::PreToolUse] = {agentlink::HookMatcher{"Bash", {guard_bash}}};

    // Read-only tools are approved; writes outside /tmp are refused
    opts.tool_permission_callback =
        [](const std::string& tool_name, const agentlink::json& input,
           const agentlink::ToolPermissionContext&) -> agentlink::PermissionResult
    {
        if (tool_name == "Read" || tool_name == "Glob" || tool_name == "Grep")
        {
            std::cerr << "[TOOL PERMISSION] " << tool_name << " [APPROVED]\n";
            return agentlink::PermissionResultAllow{};
        }

        std::string path = input.value("file_path", "");
        if ((tool_name == "Write" || tool_name == "Edit") && path.rfind("/tmp/", 0) != 0)
        {
            std::cerr << "[TOOL PERMISSION] " << tool_name << " " << path << " [DENIED]\n";
            return agentlink::PermissionResultDeny{"writes are limited to /tmp", false};
        }

        std::cerr << "[TOOL PERMISSION] " << tool_name << " [APPROVED]\n";
        return agentlink::PermissionResultAllow{};
    };

    try
    {
        // stdin/stdout belong to the process, not the transport
        agentlink::PipeTransportOptions pipe_opts;
        pipe_opts.owns_fds = false;

        agentlink::ControlSession session(
            agentlink::create_pipe_transport(STDIN_FILENO, STDOUT_FILENO, pipe_opts), opts);
        session.start();

        agentlink::InitializeResult info = session.initialize();
        std::cerr << "Connected. " << info.commands.size() << " commands available\n";

        for (const auto& msg : session.receive_messages())
        {
            std::string type = msg.value("type", "");
            std::cerr << "<<< " << type << "\n";
            if (type == "result")
                break;
        }

        session.close();
    }
    catch (const agentlink::AgentLinkError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
