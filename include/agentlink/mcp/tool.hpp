#ifndef AGENTLINK_MCP_TOOL_HPP
#define AGENTLINK_MCP_TOOL_HPP

#include <functional>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>
#include <vector>

namespace agentlink
{
namespace mcp
{

using json = nlohmann::json;

// ============================================================================
// Tool result types
// ============================================================================

/// One content block of a tool result
struct McpContent
{
    std::string type = "text"; // "text" or "image"
    std::string text;          // for type "text"
    std::string data;          // base64 payload for type "image"
    std::string mime_type;     // for type "image"

    static McpContent text_content(std::string value)
    {
        McpContent c;
        c.type = "text";
        c.text = std::move(value);
        return c;
    }

    static McpContent image_content(std::string base64_data, std::string mime)
    {
        McpContent c;
        c.type = "image";
        c.data = std::move(base64_data);
        c.mime_type = std::move(mime);
        return c;
    }
};

/// Result of tools/call
struct McpToolResult
{
    std::vector<McpContent> content;
    bool is_error = false;
};

/// Tool description as returned by tools/list
struct McpToolDefinition
{
    std::string name;
    std::string description;
    json input_schema = json{{"type", "object"}, {"properties", json::object()}};
};

// ============================================================================
// Tool - a named handler with a JSON schema
// ============================================================================

using McpToolHandler = std::function<McpToolResult(const json& arguments)>;

class McpTool
{
  public:
    McpTool(std::string name, std::string description, json input_schema, McpToolHandler handler)
        : name_(std::move(name)), description_(std::move(description)),
          input_schema_(std::move(input_schema)), handler_(std::move(handler))
    {
    }

    const std::string& name() const
    {
        return name_;
    }

    const std::string& description() const
    {
        return description_;
    }

    const json& input_schema() const
    {
        return input_schema_;
    }

    McpToolDefinition definition() const
    {
        return McpToolDefinition{name_, description_, input_schema_};
    }

    /// Invoke the tool. Throws std::runtime_error if the tool has no handler.
    McpToolResult call(const json& arguments) const
    {
        if (!handler_)
            throw std::runtime_error("tool '" + name_ + "' has no handler");
        return handler_(arguments);
    }

  private:
    std::string name_;
    std::string description_;
    json input_schema_;
    McpToolHandler handler_;
};

/// Convenience factory mirroring create_server()
inline McpTool make_tool(std::string name, std::string description, json input_schema,
                         McpToolHandler handler)
{
    return McpTool(std::move(name), std::move(description), std::move(input_schema),
                   std::move(handler));
}

} // namespace mcp
} // namespace agentlink

#endif // AGENTLINK_MCP_TOOL_HPP
