#ifndef AGENTLINK_ERRORS_HPP
#define AGENTLINK_ERRORS_HPP

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace agentlink
{

// Base exception
class AgentLinkError : public std::runtime_error
{
  public:
    explicit AgentLinkError(const std::string& message) : std::runtime_error(message) {}
};

// Writing to (or serializing for) the transport failed
class TransportError : public AgentLinkError
{
  public:
    explicit TransportError(const std::string& message) : AgentLinkError(message) {}
};

// Operation not valid in the current session lifecycle state
class SessionStateError : public AgentLinkError
{
  public:
    explicit SessionStateError(const std::string& message) : AgentLinkError(message) {}
};

// No reply arrived before the deadline
class ControlTimeoutError : public AgentLinkError
{
  public:
    ControlTimeoutError(const std::string& subtype, std::chrono::milliseconds timeout)
        : AgentLinkError("Control request timed out: " + subtype + " (after " +
                         std::to_string(timeout.count()) + "ms)"),
          subtype_(subtype), timeout_(timeout)
    {
    }

    const std::string& subtype() const
    {
        return subtype_;
    }

    std::chrono::milliseconds timeout() const
    {
        return timeout_;
    }

  private:
    std::string subtype_;
    std::chrono::milliseconds timeout_;
};

// The caller's own cancellation token fired while waiting
class ControlCancelledError : public AgentLinkError
{
  public:
    explicit ControlCancelledError(const std::string& message) : AgentLinkError(message) {}
};

// The session was closed while the request was pending (or before it was sent)
class SessionClosedError : public ControlCancelledError
{
  public:
    explicit SessionClosedError(const std::string& message) : ControlCancelledError(message) {}
};

// The remote process answered with an error reply
class ControlRequestError : public AgentLinkError
{
  public:
    ControlRequestError(const std::string& message, const std::string& request_id)
        : AgentLinkError(message), request_id_(request_id)
    {
    }

    const std::string& request_id() const
    {
        return request_id_;
    }

  private:
    std::string request_id_;
};

// JSON decode error
class JSONDecodeError : public AgentLinkError
{
  public:
    explicit JSONDecodeError(const std::string& message) : AgentLinkError(message) {}
};

// Frame parsed as JSON but does not have the expected envelope shape
class MessageParseError : public AgentLinkError
{
  public:
    explicit MessageParseError(const std::string& message)
        : AgentLinkError(message), data_(nullptr) {}

    MessageParseError(const std::string& message, const nlohmann::json& data)
        : AgentLinkError(message), data_(std::make_shared<nlohmann::json>(data)) {}

    // Get the optional data associated with the parse error
    const nlohmann::json* data() const
    {
        return data_.get();
    }

  private:
    std::shared_ptr<nlohmann::json> data_;
};

// A reverse request could not be served (missing callback, bad payload, callback threw).
// Converted into an error reply on the wire; never escapes the reader.
class HandlerError : public AgentLinkError
{
  public:
    explicit HandlerError(const std::string& message) : AgentLinkError(message) {}
};

} // namespace agentlink

#endif // AGENTLINK_ERRORS_HPP
