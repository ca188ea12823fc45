/**
 * @file mcp_calculator.cpp
 * @brief Example: Calculator MCP Server
 *
 * Serves an in-process MCP server named "calc" to an agent connected on
 * stdin/stdout. The agent reaches the tools through mcp_message control
 * requests; no separate server process is involved.
 */

#include <agentlink/agentlink.hpp>
#include <cmath>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace agentlink;
using namespace agentlink::mcp;

namespace
{

json binary_schema(const char* a, const char* b)
{
    return json{{"type", "object"},
                {"properties", {{a, {{"type", "number"}}}, {b, {{"type", "number"}}}}},
                {"required", {a, b}}};
}

McpToolResult number_result(double value)
{
    return McpToolResult{{McpContent::text_content(std::to_string(value))}};
}

McpToolResult error_result(const std::string& message)
{
    return McpToolResult{{McpContent::text_content(message)}, true};
}

McpTool add_numbers()
{
    return make_tool("add", "Add two numbers", binary_schema("a", "b"), [](const json& args)
                     { return number_result(args.at("a").get<double>() + args.at("b").get<double>()); });
}

McpTool multiply_numbers()
{
    return make_tool("multiply", "Multiply two numbers", binary_schema("a", "b"),
                     [](const json& args)
                     { return number_result(args.at("a").get<double>() * args.at("b").get<double>()); });
}

McpTool divide_numbers()
{
    return make_tool("divide", "Divide one number by another", binary_schema("a", "b"),
                     [](const json& args)
                     {
                         double b = args.at("b").get<double>();
                         if (b == 0.0)
                             return error_result("Error: Division by zero is not allowed");
                         return number_result(args.at("a").get<double>() / b);
                     });
}

McpTool square_root()
{
    json schema = {{"type", "object"},
                   {"properties", {{"n", {{"type", "number"}}}}},
                   {"required", {"n"}}};
    return make_tool("sqrt", "Calculate square root", schema,
                     [](const json& args)
                     {
                         double n = args.at("n").get<double>();
                         if (n < 0)
                             return error_result("Error: Cannot calculate square root of negative "
                                                 "number " +
                                                 std::to_string(n));
                         return number_result(std::sqrt(n));
                     });
}

McpTool power()
{
    return make_tool("power", "Raise a number to a power", binary_schema("base", "exponent"),
                     [](const json& args)
                     {
                         return number_result(std::pow(args.at("base").get<double>(),
                                                       args.at("exponent").get<double>()));
                     });
}

} // namespace

int main()
{
    auto calculator = server("calc", "2.0.0")
                          .add_tool(add_numbers())
                          .add_tool(multiply_numbers())
                          .add_tool(divide_numbers())
                          .add_tool(square_root())
                          .add_tool(power())
                          .build();

    std::cerr << "Calculator server exposes " << calculator->tool_count() << " tools\n";

    SessionOptions opts;
    opts.mcp_servers["calc"] = calculator;
    opts.tool_permission_callback =
        [](const std::string&, const json&, const ToolPermissionContext&) -> PermissionResult
    { return PermissionResultAllow{}; };

    try
    {
        PipeTransportOptions pipe_opts;
        pipe_opts.owns_fds = false;

        ControlSession session(create_pipe_transport(STDIN_FILENO, STDOUT_FILENO, pipe_opts), opts);
        session.start();
        session.initialize();

        for (const auto& msg : session.receive_messages())
        {
            if (msg.value("type", "") == "result")
            {
                std::cerr << "Result: " << msg.value("result", "") << "\n";
                break;
            }
        }

        std::cerr << "MCP status: " << session.mcp_status().dump() << "\n";
        session.close();
    }
    catch (const AgentLinkError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
