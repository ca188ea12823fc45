#include "mcp_handler.hpp"

#include "json_util.hpp"
#include "logging.hpp"

#include <agentlink/errors.hpp>

namespace agentlink
{
namespace internal
{

using json = nlohmann::json;

namespace
{
json wrap(json mcp_response)
{
    return json{{"mcp_response", std::move(mcp_response)}};
}

json message_id(const json& message)
{
    auto it = message.find("id");
    return it != message.end() ? *it : json(nullptr);
}
} // namespace

McpHandler::McpHandler(ServerMap servers) : servers_(std::move(servers)) {}

bool McpHandler::has_server(const std::string& name) const
{
    return servers_.find(name) != servers_.end();
}

json McpHandler::handle(const json& request) const
{
    std::string server_name = get_string(request, "server_name");
    if (server_name.empty())
        throw HandlerError("missing server_name");

    auto msg_it = request.find("message");
    if (msg_it == request.end() || !msg_it->is_object())
        throw HandlerError("missing message");
    const json& message = *msg_it;

    auto it = servers_.find(server_name);
    if (it == servers_.end() || !it->second)
    {
        return wrap(build_error_response(message_id(message), JSONRPC_METHOD_NOT_FOUND,
                                         "server '" + server_name + "' not found"));
    }

    try
    {
        return wrap(route(*it->second, message));
    }
    catch (const std::exception& e)
    {
        log::logger()->debug("mcp server '{}' failed: {}", server_name, e.what());
        return wrap(build_error_response(message_id(message), JSONRPC_INTERNAL_ERROR, e.what()));
    }
}

json McpHandler::route(mcp::McpServer& server, const json& message) const
{
    json id = message_id(message);

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string())
        return build_error_response(id, JSONRPC_INVALID_REQUEST,
                                    "Invalid Request: missing 'method' field");

    const std::string& method = method_it->get_ref<const std::string&>();

    if (method == "initialize")
        return build_initialize_response(id, server);
    if (method == "tools/list")
        return build_tools_list_response(id, server);
    if (method == "tools/call")
        return build_tool_call_response(id, get_object(message, "params"), server);
    if (method == "notifications/initialized")
        return json{{"jsonrpc", "2.0"}, {"result", json::object()}};

    return build_error_response(id, JSONRPC_METHOD_NOT_FOUND,
                                "method '" + method + "' not found");
}

json McpHandler::build_initialize_response(const json& id, mcp::McpServer& server)
{
    return json{{"jsonrpc", "2.0"},
                {"id", id},
                {"result",
                 {{"protocolVersion", MCP_PROTOCOL_VERSION},
                  {"capabilities", {{"tools", json::object()}}},
                  {"serverInfo", {{"name", server.name()}, {"version", server.version()}}}}}};
}

json McpHandler::build_tools_list_response(const json& id, mcp::McpServer& server)
{
    json tools_array = json::array();

    for (const auto& tool : server.list_tools())
    {
        tools_array.push_back({{"name", tool.name},
                               {"description", tool.description},
                               {"inputSchema", tool.input_schema}});
    }

    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", {{"tools", tools_array}}}};
}

json McpHandler::build_tool_call_response(const json& id, const json& params,
                                          mcp::McpServer& server)
{
    std::string tool_name = get_string(params, "name");
    if (tool_name.empty())
        return build_error_response(id, JSONRPC_INVALID_PARAMS,
                                    "Invalid params: missing 'name' field");
    json arguments = get_object(params, "arguments");

    // Exceptions propagate to handle(), which reports them as internal errors
    mcp::McpToolResult result = server.call_tool(tool_name, arguments);

    json content = json::array();
    for (const auto& block : result.content)
    {
        json item = {{"type", block.type}};
        if (block.type == "text")
        {
            item["text"] = block.text;
        }
        else if (block.type == "image")
        {
            item["data"] = block.data;
            item["mimeType"] = block.mime_type;
        }
        content.push_back(item);
    }

    json data = {{"content", content}};
    if (result.is_error)
        data["isError"] = true;

    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", data}};
}

json McpHandler::build_error_response(const json& id, int code, const std::string& message)
{
    return json{
        {"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

} // namespace internal
} // namespace agentlink
