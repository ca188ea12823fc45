#include "permission_handler.hpp"

#include "json_util.hpp"

#include <agentlink/errors.hpp>

namespace agentlink
{
namespace internal
{

using json = nlohmann::json;

// Message sent back when no callback is configured
constexpr const char* NO_CALLBACK_MESSAGE = "no permission callback registered";

PermissionHandler::PermissionHandler(std::optional<ToolPermissionCallback> callback)
    : callback_(std::move(callback))
{
}

ToolPermissionContext PermissionHandler::parse_context(const json& request)
{
    ToolPermissionContext context;

    auto it = request.find("permission_suggestions");
    if (it != request.end() && it->is_array())
    {
        for (const auto& suggestion : *it)
        {
            if (suggestion.is_object())
                context.suggestions.push_back(PermissionUpdate::from_json(suggestion));
        }
    }

    context.blocked_path = get_optional_string(request, "blocked_path");
    return context;
}

json PermissionHandler::result_to_json(const PermissionResult& result)
{
    json data;

    if (const auto* allow = std::get_if<PermissionResultAllow>(&result))
    {
        data["behavior"] = PermissionBehavior::Allow;
        if (allow->updated_input.has_value())
            data["updatedInput"] = *allow->updated_input;
        if (allow->updated_permissions.has_value() && !allow->updated_permissions->empty())
        {
            json permissions = json::array();
            for (const auto& perm : *allow->updated_permissions)
                permissions.push_back(perm.to_json());
            data["updatedPermissions"] = permissions;
        }
    }
    else
    {
        const auto& deny = std::get<PermissionResultDeny>(result);
        data["behavior"] = PermissionBehavior::Deny;
        if (!deny.message.empty())
            data["message"] = deny.message;
        if (deny.interrupt)
            data["interrupt"] = true;
    }

    return data;
}

json PermissionHandler::handle(const json& request) const
{
    std::string tool_name = get_string(request, "tool_name");
    if (tool_name.empty())
        throw HandlerError("missing tool_name");

    if (!has_callback())
        return result_to_json(PermissionResultDeny{NO_CALLBACK_MESSAGE, false});

    json input = get_object(request, "input");
    ToolPermissionContext context = parse_context(request);

    PermissionResult result;
    try
    {
        result = (*callback_)(tool_name, input, context);
    }
    catch (const std::exception& e)
    {
        throw HandlerError(std::string("callback error: ") + e.what());
    }

    return result_to_json(result);
}

} // namespace internal
} // namespace agentlink
