#include "../../src/internal/mcp_handler.hpp"

#include <agentlink/errors.hpp>
#include <agentlink/mcp.hpp>
#include <gtest/gtest.h>

using namespace agentlink;
using namespace agentlink::mcp;
using internal::McpHandler;

namespace
{
// Hand-written server: the handler only depends on the McpServer interface
class FakeServer : public McpServer
{
  public:
    std::string name() const override
    {
        return "fake";
    }

    std::string version() const override
    {
        return "9.9.9";
    }

    std::vector<McpToolDefinition> list_tools() override
    {
        return {McpToolDefinition{"snapshot", "Take a screenshot"}};
    }

    McpToolResult call_tool(const std::string& tool_name, const json& arguments) override
    {
        last_tool = tool_name;
        last_arguments = arguments;
        if (tool_name == "explode")
            throw std::runtime_error("kaboom");

        McpToolResult result;
        result.content.push_back(McpContent::text_content("took it"));
        result.content.push_back(McpContent::image_content("iVBORw0=", "image/png"));
        result.is_error = tool_name == "partial";
        return result;
    }

    std::string last_tool;
    json last_arguments;
};

McpHandler make_handler(std::shared_ptr<McpServer> server)
{
    McpHandler::ServerMap servers;
    servers["calc"] = std::move(server);
    return McpHandler(servers);
}

std::shared_ptr<SdkMcpServer> calculator()
{
    auto add = make_tool("add", "Add two numbers",
                         {{"type", "object"},
                          {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}}},
                         [](const json& args)
                         {
                             int sum = args.value("a", 0) + args.value("b", 0);
                             return McpToolResult{{McpContent::text_content(std::to_string(sum))}};
                         });
    return create_server("calc", "1.0.0", {add});
}

json mcp_request(const json& message, const std::string& server = "calc")
{
    return json{{"subtype", "mcp_message"}, {"server_name", server}, {"message", message}};
}
} // namespace

TEST(McpMessageRoutingTest, Initialize)
{
    McpHandler handler = make_handler(calculator());

    json reply =
        handler.handle(mcp_request({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}}));
    const json& rpc = reply["mcp_response"];

    EXPECT_EQ(rpc["jsonrpc"], "2.0");
    EXPECT_EQ(rpc["id"], 1);
    EXPECT_EQ(rpc["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(rpc["result"]["capabilities"], json({{"tools", json::object()}}));
    EXPECT_EQ(rpc["result"]["serverInfo"]["name"], "calc");
    EXPECT_EQ(rpc["result"]["serverInfo"]["version"], "1.0.0");
}

TEST(McpMessageRoutingTest, ToolsList)
{
    McpHandler handler = make_handler(calculator());

    json reply =
        handler.handle(mcp_request({{"jsonrpc", "2.0"}, {"id", "a"}, {"method", "tools/list"}}));
    const json& tools = reply["mcp_response"]["result"]["tools"];

    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0]["name"], "add");
    EXPECT_EQ(tools[0]["description"], "Add two numbers");
    EXPECT_EQ(tools[0]["inputSchema"]["type"], "object");
}

TEST(McpMessageRoutingTest, ToolsCallReturnsText)
{
    McpHandler handler = make_handler(calculator());

    json reply = handler.handle(mcp_request({{"jsonrpc", "2.0"},
                                             {"id", 7},
                                             {"method", "tools/call"},
                                             {"params", {{"name", "add"},
                                                         {"arguments", {{"a", 40}, {"b", 2}}}}}}));
    const json& rpc = reply["mcp_response"];

    EXPECT_EQ(rpc["id"], 7);
    ASSERT_EQ(rpc["result"]["content"].size(), 1u);
    EXPECT_EQ(rpc["result"]["content"][0], json({{"type", "text"}, {"text", "42"}}));
    EXPECT_FALSE(rpc["result"].contains("isError"));
}

TEST(McpMessageRoutingTest, ToolsCallMapsImagesAndErrorFlag)
{
    auto server = std::make_shared<FakeServer>();
    McpHandler handler = make_handler(server);

    json reply = handler.handle(mcp_request(
        {{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/call"}, {"params", {{"name", "partial"}}}}));
    const json& result = reply["mcp_response"]["result"];

    // Missing arguments default to an empty object
    EXPECT_EQ(server->last_arguments, json::object());
    EXPECT_EQ(result["isError"], true);
    ASSERT_EQ(result["content"].size(), 2u);
    EXPECT_EQ(result["content"][1]["type"], "image");
    EXPECT_EQ(result["content"][1]["data"], "iVBORw0=");
    EXPECT_EQ(result["content"][1]["mimeType"], "image/png");
}

TEST(McpMessageRoutingTest, ServerExceptionIsInternalError)
{
    McpHandler handler = make_handler(std::make_shared<FakeServer>());

    json reply = handler.handle(mcp_request(
        {{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/call"}, {"params", {{"name", "explode"}}}}));
    const json& rpc = reply["mcp_response"];

    EXPECT_EQ(rpc["id"], 3);
    EXPECT_EQ(rpc["error"]["code"], -32603);
    EXPECT_EQ(rpc["error"]["message"], "kaboom");
}

TEST(McpMessageRoutingTest, UnknownToolOnSdkServerIsInternalError)
{
    McpHandler handler = make_handler(calculator());

    json reply = handler.handle(mcp_request(
        {{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/call"}, {"params", {{"name", "mul"}}}}));
    EXPECT_EQ(reply["mcp_response"]["error"]["code"], -32603);
}

TEST(McpMessageRoutingTest, MissingToolNameIsInvalidParams)
{
    McpHandler handler = make_handler(calculator());

    json reply = handler.handle(
        mcp_request({{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"}, {"params", {}}}));
    EXPECT_EQ(reply["mcp_response"]["error"]["code"], -32602);
}

TEST(McpMessageRoutingTest, NotificationsInitialized)
{
    McpHandler handler = make_handler(calculator());

    json reply = handler.handle(
        mcp_request({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}));
    EXPECT_EQ(reply["mcp_response"], json({{"jsonrpc", "2.0"}, {"result", json::object()}}));
}

TEST(McpMessageRoutingTest, UnknownMethodIsMethodNotFound)
{
    McpHandler handler = make_handler(calculator());

    json reply = handler.handle(
        mcp_request({{"jsonrpc", "2.0"}, {"id", 6}, {"method", "resources/list"}}));
    EXPECT_EQ(reply["mcp_response"]["error"]["code"], -32601);
    EXPECT_EQ(reply["mcp_response"]["error"]["message"], "method 'resources/list' not found");
}

TEST(McpMessageRoutingTest, UnknownServerIsWrappedJsonRpcError)
{
    McpHandler handler = make_handler(calculator());

    json reply = handler.handle(
        mcp_request({{"jsonrpc", "2.0"}, {"id", 8}, {"method", "tools/list"}}, "nope"));
    const json& rpc = reply["mcp_response"];

    EXPECT_EQ(rpc["id"], 8);
    EXPECT_EQ(rpc["error"]["code"], -32601);
    EXPECT_EQ(rpc["error"]["message"], "server 'nope' not found");
}

TEST(McpMessageRoutingTest, MissingServerNameOrMessageFails)
{
    McpHandler handler = make_handler(calculator());

    EXPECT_THROW(handler.handle({{"subtype", "mcp_message"}, {"message", json::object()}}),
                 HandlerError);
    EXPECT_THROW(handler.handle({{"subtype", "mcp_message"}, {"server_name", "calc"}}),
                 HandlerError);
    EXPECT_THROW(handler.handle(
                     {{"subtype", "mcp_message"}, {"server_name", "calc"}, {"message", "text"}}),
                 HandlerError);
}
