#ifndef AGENTLINK_INTERNAL_PERMISSION_HANDLER_HPP
#define AGENTLINK_INTERNAL_PERMISSION_HANDLER_HPP

#include <agentlink/types.hpp>
#include <nlohmann/json.hpp>
#include <optional>

namespace agentlink
{
namespace internal
{

// Serves can_use_tool reverse requests with the session's permission callback
class PermissionHandler
{
  public:
    explicit PermissionHandler(std::optional<ToolPermissionCallback> callback);

    // Returns the success payload ({"behavior": ...}).
    // Throws HandlerError for a missing tool_name or a failing callback.
    nlohmann::json handle(const nlohmann::json& request) const;

    bool has_callback() const
    {
        return callback_.has_value() && static_cast<bool>(*callback_);
    }

    static ToolPermissionContext parse_context(const nlohmann::json& request);
    static nlohmann::json result_to_json(const PermissionResult& result);

  private:
    std::optional<ToolPermissionCallback> callback_;
};

} // namespace internal
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_PERMISSION_HANDLER_HPP
