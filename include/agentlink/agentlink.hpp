#ifndef AGENTLINK_HPP
#define AGENTLINK_HPP

// Main header that includes everything

#include <agentlink/cancellation.hpp>
#include <agentlink/errors.hpp>
#include <agentlink/hooks.hpp>
#include <agentlink/message_stream.hpp>
#include <agentlink/session.hpp>
#include <agentlink/transport.hpp>
#include <agentlink/types.hpp>
#include <agentlink/version.hpp>

// In-process MCP tool servers (agentlink::mcp::create_server and friends)
#include <agentlink/mcp.hpp>

#endif // AGENTLINK_HPP
