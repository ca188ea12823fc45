#include "hook_handler.hpp"

#include "json_util.hpp"

#include <agentlink/errors.hpp>

namespace agentlink
{
namespace internal
{

using json = nlohmann::json;

void HookHandler::register_callback(const std::string& callback_id, HookCallback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_[callback_id] = std::move(callback);
}

std::string HookHandler::next_callback_id()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return "hook_" + std::to_string(next_id_);
}

std::optional<json>
HookHandler::register_matchers(const std::map<HookEvent, std::vector<HookMatcher>>& hooks)
{
    std::lock_guard<std::mutex> lock(mutex_);

    json hooks_config = json::object();

    // std::map iterates events in declaration order
    for (const auto& [event, matchers] : hooks)
    {
        if (matchers.empty())
            continue;

        json matchers_array = json::array();

        for (const auto& matcher : matchers)
        {
            json callback_ids = json::array();

            for (const auto& callback : matcher.hooks)
            {
                std::string callback_id = "hook_" + std::to_string(next_id_++);
                callbacks_[callback_id] = callback;
                callback_ids.push_back(callback_id);
            }

            json matcher_entry = {{"hookCallbackIds", callback_ids}};

            if (matcher.matcher.has_value())
                matcher_entry["matcher"] = *matcher.matcher;
            else
                matcher_entry["matcher"] = nullptr;

            if (matcher.timeout.has_value())
                matcher_entry["timeout"] = *matcher.timeout;

            matchers_array.push_back(matcher_entry);
        }

        hooks_config[to_string(event)] = matchers_array;
    }

    if (hooks_config.empty())
        return std::nullopt;
    return hooks_config;
}

bool HookHandler::has_callback(const std::string& callback_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return callbacks_.find(callback_id) != callbacks_.end();
}

size_t HookHandler::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return callbacks_.size();
}

json HookHandler::handle(const json& request, const CancellationToken& signal) const
{
    std::string callback_id = get_string(request, "callback_id");
    if (callback_id.empty())
        throw HandlerError("missing callback_id");

    HookCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = callbacks_.find(callback_id);
        if (it == callbacks_.end())
            throw HandlerError("callback not found: " + callback_id);
        callback = it->second;
    }

    HookInput input = parse_hook_input(get_object(request, "input"));
    std::optional<std::string> tool_use_id = get_optional_string(request, "tool_use_id");
    HookContext context{signal};

    // Invoked outside the lock so a callback may register further callbacks
    HookOutput output;
    try
    {
        output = callback(input, tool_use_id, context);
    }
    catch (const std::exception& e)
    {
        throw HandlerError(std::string("callback error: ") + e.what());
    }

    return output.to_json();
}

} // namespace internal
} // namespace agentlink
