#ifndef AGENTLINK_SESSION_HPP
#define AGENTLINK_SESSION_HPP

#include <agentlink/cancellation.hpp>
#include <agentlink/hooks.hpp>
#include <agentlink/message_stream.hpp>
#include <agentlink/transport.hpp>
#include <agentlink/types.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace agentlink
{

/**
 * Control session over one connected Transport.
 *
 * Owns the correlation table, the hook registry and the reader thread. The
 * reader routes replies to waiting callers, serves reverse requests (tool
 * permission, hook callbacks, MCP messages) and forwards every other frame to
 * receive_messages().
 *
 * Outbound operations may be called concurrently from any thread once start()
 * has returned.
 */
class ControlSession
{
  public:
    explicit ControlSession(std::unique_ptr<Transport> transport,
                            const SessionOptions& options = SessionOptions{});
    ~ControlSession();

    // No copy, move only
    ControlSession(const ControlSession&) = delete;
    ControlSession& operator=(const ControlSession&) = delete;
    ControlSession(ControlSession&&) noexcept;
    ControlSession& operator=(ControlSession&&) noexcept;

    // Lifecycle
    void start();
    void close();
    bool is_started() const;
    bool is_closed() const;

    // Handshake. Sends initialize at most once per success; concurrent callers share
    // one attempt and a failed attempt may be retried.
    InitializeResult initialize(const CancellationToken& cancel = CancellationToken{});
    bool is_initialized() const;

    // Raw initialize reply, if the handshake has completed
    std::optional<json> server_info() const;

    // Control operations
    void interrupt(const CancellationToken& cancel = CancellationToken{});
    void set_permission_mode(const std::string& mode,
                             const CancellationToken& cancel = CancellationToken{});
    // nullopt resets the agent to its default model
    void set_model(const std::optional<std::string>& model,
                   const CancellationToken& cancel = CancellationToken{});
    void rewind_files(const std::string& user_message_id,
                      const CancellationToken& cancel = CancellationToken{});
    /// Status of the agent's MCP servers as reported by the agent
    json mcp_status(const CancellationToken& cancel = CancellationToken{});

    // Hook registry
    void register_hook_callback(const std::string& callback_id, HookCallback callback);
    std::string next_callback_id();

    // Application messages (everything that is not control traffic)
    MessageStream receive_messages();

    // Fires when the session closes; handed to hook callbacks as HookContext::signal
    CancellationToken cancellation_token() const;

    /// Detached dispatch threads not yet reclaimed (always 0 in Inline mode)
    size_t dispatch_thread_count() const;

  private:
    class Impl;
    // Shared with the reader and dispatch threads, which may outlive this object
    // when close() is called from a callback
    std::shared_ptr<Impl> impl_;
};

// Handshake timeout after applying AGENTLINK_INIT_TIMEOUT_MS, which may only raise it
std::chrono::milliseconds resolve_initialize_timeout(std::chrono::milliseconds configured);

} // namespace agentlink

#endif // AGENTLINK_SESSION_HPP
