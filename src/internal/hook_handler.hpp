#ifndef AGENTLINK_INTERNAL_HOOK_HANDLER_HPP
#define AGENTLINK_INTERNAL_HOOK_HANDLER_HPP

#include <agentlink/hooks.hpp>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace agentlink
{
namespace internal
{

// Registry of hook callbacks keyed by callback ID, and the hook_callback server
class HookHandler
{
  public:
    // Add or replace a callback
    void register_callback(const std::string& callback_id, HookCallback callback);

    // Assign hook_<n> IDs to every callback of every matcher and return the
    // "hooks" field of the initialize request, or nullopt when there is nothing
    // to register
    std::optional<nlohmann::json>
    register_matchers(const std::map<HookEvent, std::vector<HookMatcher>>& hooks);

    // Next ID register_matchers() would assign
    std::string next_callback_id();

    bool has_callback(const std::string& callback_id) const;
    size_t size() const;

    // Returns the hook output as a success payload.
    // Throws HandlerError for a missing or unknown callback_id or a failing callback.
    nlohmann::json handle(const nlohmann::json& request, const CancellationToken& signal) const;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, HookCallback> callbacks_;
    int next_id_ = 0;
};

} // namespace internal
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_HOOK_HANDLER_HPP
