#ifndef AGENTLINK_INTERNAL_MCP_HANDLER_HPP
#define AGENTLINK_INTERNAL_MCP_HANDLER_HPP

#include <agentlink/mcp/server.hpp>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace agentlink
{
namespace internal
{

// JSON-RPC error codes used in mcp_response payloads
constexpr int JSONRPC_INVALID_REQUEST = -32600;
constexpr int JSONRPC_METHOD_NOT_FOUND = -32601;
constexpr int JSONRPC_INVALID_PARAMS = -32602;
constexpr int JSONRPC_INTERNAL_ERROR = -32603;

// MCP protocol revision reported by in-process servers
constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

// Serves mcp_message reverse requests by routing the embedded JSON-RPC
// message to one of the caller's in-process servers.
class McpHandler
{
  public:
    using ServerMap = std::map<std::string, std::shared_ptr<mcp::McpServer>>;

    explicit McpHandler(ServerMap servers);

    // Returns the control success payload {"mcp_response": <jsonrpc>}.
    // Throws HandlerError when server_name or message is missing; every other
    // failure is reported as a JSON-RPC error inside the success payload.
    nlohmann::json handle(const nlohmann::json& request) const;

    bool has_server(const std::string& name) const;

  private:
    nlohmann::json route(mcp::McpServer& server, const nlohmann::json& message) const;

    static nlohmann::json build_initialize_response(const nlohmann::json& id,
                                                    mcp::McpServer& server);
    static nlohmann::json build_tools_list_response(const nlohmann::json& id,
                                                    mcp::McpServer& server);
    static nlohmann::json build_tool_call_response(const nlohmann::json& id,
                                                   const nlohmann::json& params,
                                                   mcp::McpServer& server);
    static nlohmann::json build_error_response(const nlohmann::json& id, int code,
                                               const std::string& message);

    ServerMap servers_;
};

} // namespace internal
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_MCP_HANDLER_HPP
