#include "internal/frame_parser.hpp"
#include "internal/hook_handler.hpp"
#include "internal/logging.hpp"
#include "internal/mcp_handler.hpp"
#include "internal/message_queue.hpp"
#include "internal/permission_handler.hpp"

#include <agentlink/errors.hpp>
#include <agentlink/protocol/control.hpp>
#include <agentlink/session.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace agentlink
{

std::chrono::milliseconds resolve_initialize_timeout(std::chrono::milliseconds configured)
{
    std::chrono::milliseconds timeout = configured;
    if (const char* env = std::getenv(INIT_TIMEOUT_ENV))
    {
        try
        {
            long long parsed = std::stoll(env);
            if (parsed > timeout.count())
                timeout = std::chrono::milliseconds(parsed);
        }
        catch (const std::exception&)
        {
            log::logger()->debug("ignoring invalid {}='{}'", INIT_TIMEOUT_ENV, env);
        }
    }
    return timeout;
}

// ControlSession::Impl - reader thread, dispatcher and handshake state.
// Threads it starts hold a reference, so it lives until the last of them exits.
class ControlSession::Impl : public std::enable_shared_from_this<ControlSession::Impl>
{
  public:
    enum class HandshakeState
    {
        NotStarted,
        Pending,
        Done
    };

    SessionOptions options_;
    std::unique_ptr<Transport> transport_;
    std::unique_ptr<protocol::ControlProtocol> control_protocol_;
    std::shared_ptr<internal::MessageQueue> message_queue_;

    internal::PermissionHandler permission_handler_;
    internal::HookHandler hook_handler_;
    internal::McpHandler mcp_handler_;

    // "hooks" field of the initialize request, fixed at construction
    std::optional<json> hooks_config_;

    CancellationSource session_cancel_;

    mutable std::mutex lifecycle_mutex_;
    bool started_ = false;
    bool closed_ = false;

    std::thread reader_thread_;
    std::atomic<bool> stop_reader_{false};

    // Serializes every write to the transport
    std::mutex write_mutex_;

    struct DispatchWorker
    {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    mutable std::mutex dispatch_mutex_;
    std::vector<DispatchWorker> dispatch_workers_;

    mutable std::mutex handshake_mutex_;
    std::condition_variable handshake_cv_;
    HandshakeState handshake_state_ = HandshakeState::NotStarted;
    std::optional<InitializeResult> init_result_;

    Impl(std::unique_ptr<Transport> transport, const SessionOptions& options)
        : options_(options), transport_(std::move(transport)),
          control_protocol_(std::make_unique<protocol::ControlProtocol>()),
          message_queue_(std::make_shared<internal::MessageQueue>(options.message_queue_capacity)),
          permission_handler_(options.tool_permission_callback),
          mcp_handler_(options.mcp_servers)
    {
        if (!transport_)
            throw std::invalid_argument("ControlSession requires a transport");

        // Expanded once so retried handshakes reuse the same callback IDs
        hooks_config_ = hook_handler_.register_matchers(options_.hooks);
    }

    ~Impl()
    {
        close();
    }

    // ------------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------------

    void start()
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (closed_)
            throw SessionStateError("Session is closed");
        if (started_)
            return;

        if (!transport_->is_open())
            throw TransportError("Transport is not open");

        if (options_.log_level.has_value() && !log::set_level(*options_.log_level))
            log::logger()->warn("unknown log level '{}'", *options_.log_level);

        started_ = true;
        reader_thread_ = std::thread([self = shared_from_this()]() { self->reader_loop(); });
        log::logger()->debug("control session started");
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            if (closed_)
                return;
            closed_ = true;
        }

        session_cancel_.cancel();
        control_protocol_->shutdown("session closed");

        stop_reader_ = true;
        if (reader_thread_.joinable())
        {
            // close() from a callback running on the reader itself cannot join
            if (reader_thread_.get_id() == std::this_thread::get_id())
                reader_thread_.detach();
            else
                reader_thread_.join();
        }

        std::vector<DispatchWorker> workers;
        {
            std::lock_guard<std::mutex> lock(dispatch_mutex_);
            workers.swap(dispatch_workers_);
        }
        for (auto& worker : workers)
        {
            if (worker.thread.get_id() == std::this_thread::get_id())
                worker.thread.detach();
            else if (worker.thread.joinable())
                worker.thread.join();
        }

        message_queue_->close();

        {
            std::lock_guard<std::mutex> lock(write_mutex_);
            transport_->close();
        }

        handshake_cv_.notify_all();
        log::logger()->debug("control session closed");
    }

    bool is_started() const
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        return started_;
    }

    bool is_closed() const
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        return closed_;
    }

    void ensure_running() const
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (closed_)
            throw SessionStateError("Session is closed");
        if (!started_)
            throw SessionStateError("Session not started; call start() first");
    }

    // ------------------------------------------------------------------------
    // Outbound requests
    // ------------------------------------------------------------------------

    void write_frame(const std::string& data)
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        transport_->write(data);
    }

    json send(const protocol::OutboundRequest& request, std::chrono::milliseconds timeout,
              const CancellationToken& cancel)
    {
        ensure_running();
        auto write_func = [this](const std::string& data) { write_frame(data); };
        return control_protocol_->send_request(write_func, request, timeout, cancel);
    }

    InitializeResult initialize(const CancellationToken& cancel)
    {
        ensure_running();

        std::unique_lock<std::mutex> lock(handshake_mutex_);
        while (handshake_state_ != HandshakeState::NotStarted)
        {
            if (handshake_state_ == HandshakeState::Done)
                return *init_result_;

            // Another caller owns the in-flight attempt
            if (cancel.is_cancelled())
                throw ControlCancelledError("Control request cancelled: initialize");
            if (is_closed())
                throw SessionClosedError("Session closed while waiting for initialize");
            handshake_cv_.wait_for(lock, protocol::ControlProtocol::POLL_INTERVAL);
        }
        handshake_state_ = HandshakeState::Pending;
        lock.unlock();

        try
        {
            protocol::InitializeRequest request;
            request.hooks = hooks_config_;

            json reply = send(request, resolve_initialize_timeout(options_.initialize_timeout),
                              cancel);
            InitializeResult result = InitializeResult::from_json(reply);

            lock.lock();
            init_result_ = result;
            handshake_state_ = HandshakeState::Done;
            lock.unlock();
            handshake_cv_.notify_all();

            log::logger()->debug("initialize complete ({} commands)", result.commands.size());
            return result;
        }
        catch (const std::exception& e)
        {
            log::logger()->debug("initialize failed: {}", e.what());
            {
                std::lock_guard<std::mutex> relock(handshake_mutex_);
                handshake_state_ = HandshakeState::NotStarted;
            }
            handshake_cv_.notify_all();
            throw;
        }
    }

    std::optional<json> server_info() const
    {
        std::lock_guard<std::mutex> lock(handshake_mutex_);
        if (handshake_state_ != HandshakeState::Done || !init_result_)
            return std::nullopt;
        return init_result_->raw;
    }

    bool is_initialized() const
    {
        std::lock_guard<std::mutex> lock(handshake_mutex_);
        return handshake_state_ == HandshakeState::Done;
    }

    // ------------------------------------------------------------------------
    // Reader
    // ------------------------------------------------------------------------

    void reader_loop()
    {
        try
        {
            while (!stop_reader_ && transport_->is_open())
            {
                auto frames = transport_->read_frames();
                for (const auto& line : frames)
                {
                    if (stop_reader_)
                        break;
                    route_frame(line);
                }
            }
        }
        catch (const std::exception& e)
        {
            log::logger()->error("reader stopped: {}", e.what());
        }

        if (!stop_reader_)
            log::logger()->debug("transport closed by remote end");

        // Nothing can answer pending requests any more
        control_protocol_->shutdown("transport closed");
        message_queue_->close();
    }

    void route_frame(const std::string& line)
    {
        protocol::Frame frame;
        try
        {
            frame = protocol::FrameParser::parse_frame(line);
        }
        catch (const JSONDecodeError& e)
        {
            log::logger()->debug("dropping malformed frame: {}", e.what());
            return;
        }
        catch (const MessageParseError& e)
        {
            log::logger()->debug("dropping invalid control frame: {}", e.what());
            return;
        }

        switch (frame.kind)
        {
        case protocol::FrameKind::ControlResponse:
            control_protocol_->handle_response(frame.response);
            break;
        case protocol::FrameKind::ControlRequest:
            dispatch(std::move(frame.request));
            break;
        case protocol::FrameKind::Message:
            // Blocks while the consumer is behind; gives up once the session closes
            if (!message_queue_->push(std::move(frame.raw), session_cancel_.token()))
                log::logger()->trace("message dropped: session closing");
            break;
        }
    }

    // ------------------------------------------------------------------------
    // Reverse requests
    // ------------------------------------------------------------------------

    void dispatch(protocol::ControlRequest request)
    {
        if (!request.request.is_object())
        {
            send_control_response(
                protocol::ControlResponse::failure(request.request_id, "invalid control request"));
            return;
        }

        std::string subtype_name = request.subtype();
        protocol::ReverseSubtype subtype = protocol::parse_reverse_subtype(subtype_name);

        if (subtype == protocol::ReverseSubtype::Unknown)
        {
            log::logger()->warn("unsupported control request subtype '{}' ({})", subtype_name,
                                request.request_id);
            if (options_.unknown_request_policy == UnknownRequestPolicy::ReplyWithError)
            {
                send_control_response(protocol::ControlResponse::failure(
                    request.request_id, "unsupported control request subtype: " + subtype_name));
            }
            return;
        }

        if (options_.dispatch_mode == DispatchMode::Detached)
        {
            std::lock_guard<std::mutex> lock(dispatch_mutex_);
            if (stop_reader_)
                return;
            reap_finished_workers();

            auto done = std::make_shared<std::atomic<bool>>(false);
            std::thread thread(
                [self = shared_from_this(), request = std::move(request), subtype, done]()
                {
                    self->serve(request, subtype);
                    *done = true;
                });
            dispatch_workers_.push_back(DispatchWorker{std::move(thread), std::move(done)});
            return;
        }

        serve(request, subtype);
    }

    // Joins workers that have finished serving. Requires dispatch_mutex_.
    void reap_finished_workers()
    {
        for (auto it = dispatch_workers_.begin(); it != dispatch_workers_.end();)
        {
            if (it->done->load())
            {
                it->thread.join();
                it = dispatch_workers_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    size_t dispatch_thread_count() const
    {
        std::lock_guard<std::mutex> lock(dispatch_mutex_);
        return dispatch_workers_.size();
    }

    void serve(const protocol::ControlRequest& request, protocol::ReverseSubtype subtype)
    {
        log::logger()->debug("serving {} ({})", protocol::to_string(subtype), request.request_id);

        protocol::ControlResponse reply;
        try
        {
            json data;
            switch (subtype)
            {
            case protocol::ReverseSubtype::CanUseTool:
                data = permission_handler_.handle(request.request);
                break;
            case protocol::ReverseSubtype::HookCallback:
                data = hook_handler_.handle(request.request, session_cancel_.token());
                break;
            case protocol::ReverseSubtype::McpMessage:
                data = mcp_handler_.handle(request.request);
                break;
            case protocol::ReverseSubtype::Unknown:
                throw HandlerError("unsupported control request subtype");
            }
            reply = protocol::ControlResponse::success(request.request_id, std::move(data));
        }
        catch (const std::exception& e)
        {
            log::logger()->debug("{} ({}) failed: {}", protocol::to_string(subtype),
                                 request.request_id, e.what());
            reply = protocol::ControlResponse::failure(request.request_id, e.what());
        }
        catch (...)
        {
            log::logger()->warn("{} ({}) failed with a non-standard exception",
                                protocol::to_string(subtype), request.request_id);
            reply = protocol::ControlResponse::failure(request.request_id,
                                                       "handler failed with unknown error");
        }

        send_control_response(reply);
    }

    // Never throws: runs on the reader or on a dispatch thread
    void send_control_response(const protocol::ControlResponse& response)
    {
        std::string line;
        try
        {
            // Callback output may carry invalid UTF-8; replace it rather than fail the reply
            line = response.to_json().dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
        }
        catch (const json::exception& e)
        {
            log::logger()->warn("could not encode reply for {}: {}", response.response.request_id,
                                e.what());
            line = protocol::ControlResponse::failure(response.response.request_id,
                                                      "failed to encode reply")
                       .to_json()
                       .dump() +
                   "\n";
        }

        try
        {
            write_frame(line);
        }
        catch (const TransportError& e)
        {
            // The remote end is gone; the reader will notice on its next read
            log::logger()->debug("could not send reply for {}: {}", response.response.request_id,
                                 e.what());
        }
        catch (const std::exception& e)
        {
            log::logger()->warn("could not send reply for {}: {}", response.response.request_id,
                                e.what());
        }
    }
};

// ============================================================================
// ControlSession implementation
// ============================================================================

ControlSession::ControlSession(std::unique_ptr<Transport> transport, const SessionOptions& options)
    : impl_(std::make_shared<Impl>(std::move(transport), options))
{
}

ControlSession::~ControlSession()
{
    if (impl_)
        impl_->close();
}

ControlSession::ControlSession(ControlSession&&) noexcept = default;
ControlSession& ControlSession::operator=(ControlSession&&) noexcept = default;

void ControlSession::start()
{
    impl_->start();
}

void ControlSession::close()
{
    impl_->close();
}

bool ControlSession::is_started() const
{
    return impl_->is_started();
}

bool ControlSession::is_closed() const
{
    return impl_->is_closed();
}

InitializeResult ControlSession::initialize(const CancellationToken& cancel)
{
    return impl_->initialize(cancel);
}

bool ControlSession::is_initialized() const
{
    return impl_->is_initialized();
}

std::optional<json> ControlSession::server_info() const
{
    return impl_->server_info();
}

void ControlSession::interrupt(const CancellationToken& cancel)
{
    impl_->send(protocol::InterruptRequest{}, impl_->options_.control_timeout, cancel);
}

void ControlSession::set_permission_mode(const std::string& mode, const CancellationToken& cancel)
{
    protocol::SetPermissionModeRequest request;
    request.mode = mode;
    impl_->send(request, impl_->options_.control_timeout, cancel);
}

void ControlSession::set_model(const std::optional<std::string>& model,
                               const CancellationToken& cancel)
{
    protocol::SetModelRequest request;
    request.model = model;
    impl_->send(request, impl_->options_.control_timeout, cancel);
}

void ControlSession::rewind_files(const std::string& user_message_id,
                                  const CancellationToken& cancel)
{
    protocol::RewindFilesRequest request;
    request.user_message_id = user_message_id;
    impl_->send(request, impl_->options_.control_timeout, cancel);
}

json ControlSession::mcp_status(const CancellationToken& cancel)
{
    return impl_->send(protocol::McpStatusRequest{}, impl_->options_.control_timeout, cancel);
}

void ControlSession::register_hook_callback(const std::string& callback_id, HookCallback callback)
{
    if (impl_->is_closed())
        throw SessionStateError("Session is closed");
    impl_->hook_handler_.register_callback(callback_id, std::move(callback));
}

std::string ControlSession::next_callback_id()
{
    return impl_->hook_handler_.next_callback_id();
}

MessageStream ControlSession::receive_messages()
{
    return MessageStream(impl_->message_queue_);
}

CancellationToken ControlSession::cancellation_token() const
{
    return impl_->session_cancel_.token();
}

size_t ControlSession::dispatch_thread_count() const
{
    return impl_->dispatch_thread_count();
}

} // namespace agentlink
