#ifndef AGENTLINK_MCP_HPP
#define AGENTLINK_MCP_HPP

/**
 * @file mcp.hpp
 * @brief In-process MCP (Model Context Protocol) tool servers
 *
 * The agent reaches these servers through mcp_message control requests; the
 * session answers initialize, tools/list and tools/call on their behalf.
 *
 * Example usage:
 * @code
 * #include <agentlink/agentlink.hpp>
 *
 * auto add = agentlink::mcp::make_tool(
 *     "add", "Add two numbers",
 *     {{"type", "object"},
 *      {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
 *      {"required", {"a", "b"}}},
 *     [](const agentlink::json& args)
 *     {
 *         double sum = args.value("a", 0.0) + args.value("b", 0.0);
 *         return agentlink::mcp::McpToolResult{
 *             {agentlink::mcp::McpContent::text_content(std::to_string(sum))}};
 *     });
 *
 * agentlink::SessionOptions opts;
 * opts.mcp_servers["calc"] = agentlink::mcp::create_server("calc", "1.0.0", {add});
 * @endcode
 *
 * Implement agentlink::mcp::McpServer directly to expose tools from an
 * existing registry instead.
 */

#include <agentlink/mcp/server.hpp>
#include <agentlink/mcp/tool.hpp>

#endif // AGENTLINK_MCP_HPP
