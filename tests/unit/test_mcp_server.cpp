#include <agentlink/mcp.hpp>
#include <gtest/gtest.h>

using namespace agentlink;
using namespace agentlink::mcp;

namespace
{
McpTool echo_tool(const std::string& name)
{
    return make_tool(name, "Echo the text argument",
                     {{"type", "object"},
                      {"properties", {{"text", {{"type", "string"}}}}},
                      {"required", {"text"}}},
                     [](const json& args)
                     { return McpToolResult{{McpContent::text_content(args.value("text", ""))}}; });
}
} // namespace

TEST(SdkMcpServerTest, CreateServerRegistersTools)
{
    auto server = create_server("utils", "2.1.0", {echo_tool("echo"), echo_tool("say")});

    EXPECT_EQ(server->name(), "utils");
    EXPECT_EQ(server->version(), "2.1.0");
    EXPECT_EQ(server->tool_count(), 2u);
    EXPECT_TRUE(server->has_tool("echo"));

    auto tools = server->list_tools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "echo");
    EXPECT_EQ(tools[0].description, "Echo the text argument");
    EXPECT_EQ(tools[0].input_schema["required"], json({"text"}));
}

TEST(SdkMcpServerTest, DuplicateToolNameRejected)
{
    auto server = create_server("utils", "1.0.0", {echo_tool("echo")});
    EXPECT_THROW(server->add_tool(echo_tool("echo")), std::invalid_argument);
    EXPECT_THROW(create_server("x", "1", {echo_tool("a"), echo_tool("a")}),
                 std::invalid_argument);
}

TEST(SdkMcpServerTest, CallToolInvokesHandler)
{
    auto server = create_server("utils", "1.0.0", {echo_tool("echo")});

    McpToolResult result = server->call_tool("echo", {{"text", "hello"}});
    ASSERT_EQ(result.content.size(), 1u);
    EXPECT_EQ(result.content[0].type, "text");
    EXPECT_EQ(result.content[0].text, "hello");
    EXPECT_FALSE(result.is_error);
}

TEST(SdkMcpServerTest, UnknownToolThrows)
{
    auto server = create_server("utils", "1.0.0");
    try
    {
        server->call_tool("missing", json::object());
        FAIL() << "expected McpToolNotFoundError";
    }
    catch (const McpToolNotFoundError& e)
    {
        EXPECT_EQ(e.tool_name(), "missing");
    }
}

TEST(SdkMcpServerTest, BuilderProducesServer)
{
    auto server = mcp::server("calc", "0.1.0").add_tool(echo_tool("echo")).build();
    EXPECT_EQ(server->name(), "calc");
    EXPECT_EQ(server->tool_count(), 1u);
}

TEST(SdkMcpServerTest, ImageContentHelper)
{
    McpContent image = McpContent::image_content("aGVsbG8=", "image/png");
    EXPECT_EQ(image.type, "image");
    EXPECT_EQ(image.data, "aGVsbG8=");
    EXPECT_EQ(image.mime_type, "image/png");
}
