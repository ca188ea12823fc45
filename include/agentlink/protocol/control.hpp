#ifndef AGENTLINK_PROTOCOL_CONTROL_HPP
#define AGENTLINK_PROTOCOL_CONTROL_HPP

#include <agentlink/cancellation.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <random>
#include <string>
#include <variant>

namespace agentlink
{

// JSON type alias (also defined in types.hpp)
// Duplicate declaration needed here since control.hpp can't include types.hpp (circular dependency)
using json = nlohmann::json;

namespace protocol
{

constexpr const char* TYPE_CONTROL_REQUEST = "control_request";
constexpr const char* TYPE_CONTROL_RESPONSE = "control_response";
constexpr const char* RESPONSE_SUBTYPE_SUCCESS = "success";
constexpr const char* RESPONSE_SUBTYPE_ERROR = "error";

// Control request - outbound (SDK to remote) or reverse (remote to SDK)
struct ControlRequest
{
    std::string type = TYPE_CONTROL_REQUEST;
    std::string request_id;
    json request; // Subtype-specific data, always carries "subtype"

    std::string subtype() const
    {
        if (request.is_object())
        {
            auto it = request.find("subtype");
            if (it != request.end() && it->is_string())
                return it->get<std::string>();
        }
        return "";
    }
};

// Control response - replies travel in both directions with this shape
struct ControlResponse
{
    std::string type = TYPE_CONTROL_RESPONSE;
    struct Response
    {
        std::string subtype; // "success" or "error"
        std::string request_id;
        json response;     // Response data
        std::string error; // Error message if failed
    } response;

    bool is_error() const
    {
        return response.subtype == RESPONSE_SUBTYPE_ERROR;
    }

    json to_json() const;

    static ControlResponse success(const std::string& request_id, json data);
    static ControlResponse failure(const std::string& request_id, const std::string& error);
};

// ============================================================================
// Outbound request payloads (closed set)
// ============================================================================

struct InterruptRequest
{
    static constexpr const char* SUBTYPE = "interrupt";
    json to_json() const;
};

struct InitializeRequest
{
    static constexpr const char* SUBTYPE = "initialize";
    // event name -> [{matcher, hookCallbackIds, timeout}]; omitted when no hooks
    std::optional<json> hooks;
    json to_json() const;
};

struct SetPermissionModeRequest
{
    static constexpr const char* SUBTYPE = "set_permission_mode";
    std::string mode;
    json to_json() const;
};

struct SetModelRequest
{
    static constexpr const char* SUBTYPE = "set_model";
    std::optional<std::string> model; // nullopt resets to the default model
    json to_json() const;
};

struct RewindFilesRequest
{
    static constexpr const char* SUBTYPE = "rewind_files";
    std::string user_message_id;
    json to_json() const;
};

struct McpStatusRequest
{
    static constexpr const char* SUBTYPE = "mcp_status";
    json to_json() const;
};

using OutboundRequest = std::variant<InterruptRequest, InitializeRequest, SetPermissionModeRequest,
                                     SetModelRequest, RewindFilesRequest, McpStatusRequest>;

json to_json(const OutboundRequest& request);
std::string subtype_of(const OutboundRequest& request);

// ============================================================================
// Reverse (remote-initiated) request subtypes
// ============================================================================

enum class ReverseSubtype
{
    CanUseTool,
    HookCallback,
    McpMessage,
    Unknown
};

ReverseSubtype parse_reverse_subtype(const std::string& subtype);
const char* to_string(ReverseSubtype subtype);

// Control protocol manager - handles async request/response correlation
class ControlProtocol
{
  public:
    using WriteFunc = std::function<void(const std::string&)>;

    // Granularity at which waits observe cancellation
    static constexpr std::chrono::milliseconds POLL_INTERVAL{10};

    ControlProtocol();
    ~ControlProtocol();

    // No copy
    ControlProtocol(const ControlProtocol&) = delete;
    ControlProtocol& operator=(const ControlProtocol&) = delete;

    // Send control request and wait for response.
    // Returns the response payload on success. Throws TransportError, ControlTimeoutError,
    // ControlCancelledError, SessionClosedError or ControlRequestError.
    // A non-positive timeout waits without a deadline.
    json send_request(const WriteFunc& write_func, const OutboundRequest& request,
                      std::chrono::milliseconds timeout,
                      const CancellationToken& cancel = CancellationToken{});

    // Handle incoming control response. Returns false if no live request matched.
    bool handle_response(const ControlResponse& response);

    // Generate unique request ID: req_{counter}_{8 hex chars}
    std::string generate_request_id();

    // Build control request message JSON string (newline terminated)
    std::string build_request_message(const std::string& request_id,
                                      const OutboundRequest& request) const;

    // Fail every pending request with SessionClosedError and refuse new ones.
    // Idempotent.
    void shutdown(const std::string& reason);

    bool is_shut_down() const;

    size_t pending_count() const;

  private:
    std::atomic<std::uint64_t> request_counter_{0};

    std::mutex rng_mutex_;
    std::mt19937 rng_;

    // Pending requests - maps request_id to promise
    std::map<std::string, std::promise<ControlResponse>> pending_requests_;
    mutable std::mutex requests_mutex_;
    bool shut_down_ = false;
    std::string shutdown_reason_;

    // Register a pending request and return future
    std::future<ControlResponse> register_request(const std::string& request_id);

    void unregister_request(const std::string& request_id);
};

} // namespace protocol
} // namespace agentlink

#endif // AGENTLINK_PROTOCOL_CONTROL_HPP
