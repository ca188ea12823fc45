#include "../internal/logging.hpp"

#include <agentlink/errors.hpp>
#include <agentlink/protocol/control.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace agentlink
{
namespace protocol
{

// ============================================================================
// Envelopes
// ============================================================================

json ControlResponse::to_json() const
{
    json inner = {{"subtype", response.subtype}, {"request_id", response.request_id}};
    if (is_error())
        inner["error"] = response.error;
    else
        inner["response"] = response.response.is_null() ? json::object() : response.response;

    return json{{"type", type}, {"response", inner}};
}

ControlResponse ControlResponse::success(const std::string& request_id, json data)
{
    ControlResponse resp;
    resp.response.subtype = RESPONSE_SUBTYPE_SUCCESS;
    resp.response.request_id = request_id;
    resp.response.response = std::move(data);
    return resp;
}

ControlResponse ControlResponse::failure(const std::string& request_id, const std::string& error)
{
    ControlResponse resp;
    resp.response.subtype = RESPONSE_SUBTYPE_ERROR;
    resp.response.request_id = request_id;
    resp.response.error = error;
    return resp;
}

json InterruptRequest::to_json() const
{
    return json{{"subtype", SUBTYPE}};
}

json InitializeRequest::to_json() const
{
    json out = {{"subtype", SUBTYPE}};
    if (hooks.has_value() && !hooks->empty())
        out["hooks"] = *hooks;
    return out;
}

json SetPermissionModeRequest::to_json() const
{
    return json{{"subtype", SUBTYPE}, {"mode", mode}};
}

json SetModelRequest::to_json() const
{
    json out = {{"subtype", SUBTYPE}};
    if (model.has_value())
        out["model"] = *model;
    return out;
}

json RewindFilesRequest::to_json() const
{
    return json{{"subtype", SUBTYPE}, {"user_message_id", user_message_id}};
}

json McpStatusRequest::to_json() const
{
    return json{{"subtype", SUBTYPE}};
}

json to_json(const OutboundRequest& request)
{
    return std::visit([](const auto& r) { return r.to_json(); }, request);
}

std::string subtype_of(const OutboundRequest& request)
{
    return std::visit([](const auto& r) { return std::string(r.SUBTYPE); }, request);
}

ReverseSubtype parse_reverse_subtype(const std::string& subtype)
{
    if (subtype == "can_use_tool")
        return ReverseSubtype::CanUseTool;
    if (subtype == "hook_callback")
        return ReverseSubtype::HookCallback;
    if (subtype == "mcp_message")
        return ReverseSubtype::McpMessage;
    return ReverseSubtype::Unknown;
}

const char* to_string(ReverseSubtype subtype)
{
    switch (subtype)
    {
    case ReverseSubtype::CanUseTool:
        return "can_use_tool";
    case ReverseSubtype::HookCallback:
        return "hook_callback";
    case ReverseSubtype::McpMessage:
        return "mcp_message";
    case ReverseSubtype::Unknown:
        break;
    }
    return "unknown";
}

// ============================================================================
// ControlProtocol
// ============================================================================

ControlProtocol::ControlProtocol() : rng_(std::random_device{}()) {}

ControlProtocol::~ControlProtocol()
{
    shutdown("Control protocol shutting down");
}

std::string ControlProtocol::generate_request_id()
{
    // Counter starts at 1 and alone guarantees uniqueness within this instance
    std::uint64_t counter = ++request_counter_;

    std::uint32_t random_bits;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        random_bits = static_cast<std::uint32_t>(rng_());
    }

    std::ostringstream oss;
    oss << "req_" << counter << "_" << std::hex << std::setfill('0') << std::setw(8)
        << random_bits;
    return oss.str();
}

std::string ControlProtocol::build_request_message(const std::string& request_id,
                                                   const OutboundRequest& request) const
{
    json msg = {{"type", TYPE_CONTROL_REQUEST},
                {"request_id", request_id},
                {"request", protocol::to_json(request)}};

    return msg.dump() + "\n";
}

std::future<ControlResponse> ControlProtocol::register_request(const std::string& request_id)
{
    std::lock_guard<std::mutex> lock(requests_mutex_);

    // Checked under the same lock shutdown() takes, so a request can never slip
    // into the table after the final sweep
    if (shut_down_)
        throw SessionClosedError("Session closed: " + shutdown_reason_);

    std::promise<ControlResponse> promise;
    auto future = promise.get_future();

    pending_requests_[request_id] = std::move(promise);

    return future;
}

void ControlProtocol::unregister_request(const std::string& request_id)
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    pending_requests_.erase(request_id);
}

json ControlProtocol::send_request(const WriteFunc& write_func, const OutboundRequest& request,
                                   std::chrono::milliseconds timeout,
                                   const CancellationToken& cancel)
{
    const std::string subtype = subtype_of(request);
    const std::string request_id = generate_request_id();

    // Register pending request BEFORE sending so a fast reply is never missed
    auto future = register_request(request_id);

    try
    {
        std::string line = build_request_message(request_id, request);
        write_func(line);
    }
    catch (const TransportError&)
    {
        unregister_request(request_id);
        throw;
    }
    catch (const json::exception& e)
    {
        unregister_request(request_id);
        throw TransportError(std::string("Failed to serialize control request: ") + e.what());
    }
    catch (const std::exception& e)
    {
        unregister_request(request_id);
        throw TransportError(std::string("Failed to send control request: ") + e.what());
    }

    log::logger()->debug("control request {} ({}) sent", request_id, subtype);

    const bool has_deadline = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true)
    {
        auto slice = std::chrono::steady_clock::duration(POLL_INTERVAL);
        if (has_deadline)
        {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                unregister_request(request_id);
                log::logger()->debug("control request {} ({}) timed out", request_id, subtype);
                throw ControlTimeoutError(subtype, timeout);
            }
            slice = std::min<std::chrono::steady_clock::duration>(slice, deadline - now);
        }

        if (future.wait_for(slice) == std::future_status::ready)
            break;

        if (cancel.is_cancelled())
        {
            unregister_request(request_id);
            throw ControlCancelledError("Control request cancelled: " + subtype);
        }
    }

    unregister_request(request_id);

    // Rethrows SessionClosedError set by shutdown()
    ControlResponse response = future.get();

    if (response.is_error())
        throw ControlRequestError(response.response.error, request_id);

    if (response.response.response.is_null())
        return json::object();
    return response.response.response;
}

bool ControlProtocol::handle_response(const ControlResponse& response)
{
    const auto& request_id = response.response.request_id;

    std::lock_guard<std::mutex> lock(requests_mutex_);

    auto it = pending_requests_.find(request_id);
    if (it == pending_requests_.end())
    {
        // Stale or duplicate reply, or one for a request that already timed out
        log::logger()->trace("dropping control response for unknown request {}", request_id);
        return false;
    }

    try
    {
        it->second.set_value(response);
    }
    catch (const std::future_error&)
    {
        // Slot already filled; single-slot semantics drop the second reply
        log::logger()->trace("dropping duplicate control response for {}", request_id);
        return false;
    }
    pending_requests_.erase(it);
    return true;
}

void ControlProtocol::shutdown(const std::string& reason)
{
    std::lock_guard<std::mutex> lock(requests_mutex_);

    if (!shut_down_)
    {
        shut_down_ = true;
        shutdown_reason_ = reason;
    }

    for (auto& [id, promise] : pending_requests_)
    {
        try
        {
            promise.set_exception(
                std::make_exception_ptr(SessionClosedError("Session closed: " + reason)));
        }
        catch (const std::future_error&)
        {
            // Promise already satisfied by a reply that raced the shutdown
        }
    }
    pending_requests_.clear();
}

bool ControlProtocol::is_shut_down() const
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return shut_down_;
}

size_t ControlProtocol::pending_count() const
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return pending_requests_.size();
}

} // namespace protocol
} // namespace agentlink
