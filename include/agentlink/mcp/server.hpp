#ifndef AGENTLINK_MCP_SERVER_HPP
#define AGENTLINK_MCP_SERVER_HPP

#include <agentlink/errors.hpp>
#include <agentlink/mcp/tool.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace agentlink
{
namespace mcp
{

// ============================================================================
// McpServer - capability object hosted by the caller
// ============================================================================

/**
 * In-process tool server reachable by the agent through mcp_message requests.
 *
 * Methods are called from the session's reader thread (or a dispatch thread in
 * detached mode) and may throw; exceptions become JSON-RPC internal errors.
 */
class McpServer
{
  public:
    virtual ~McpServer() = default;

    virtual std::string name() const = 0;
    virtual std::string version() const = 0;
    virtual std::vector<McpToolDefinition> list_tools() = 0;
    virtual McpToolResult call_tool(const std::string& tool_name, const json& arguments) = 0;
};

// Requested tool is not registered on the server
class McpToolNotFoundError : public AgentLinkError
{
  public:
    explicit McpToolNotFoundError(const std::string& tool_name)
        : AgentLinkError("tool '" + tool_name + "' not found"), tool_name_(tool_name)
    {
    }

    const std::string& tool_name() const
    {
        return tool_name_;
    }

  private:
    std::string tool_name_;
};

// ============================================================================
// SdkMcpServer - McpServer backed by a set of McpTool objects
// ============================================================================

/// Thread-safe tool registry implementing McpServer
class SdkMcpServer : public McpServer
{
  public:
    SdkMcpServer(std::string name, std::string version)
        : name_(std::move(name)), version_(std::move(version))
    {
    }

    /// Add a tool. Throws std::invalid_argument on a duplicate name.
    void add_tool(McpTool tool)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string tool_name = tool.name();
        if (tools_.find(tool_name) != tools_.end())
            throw std::invalid_argument("Duplicate tool name: " + tool_name);
        tools_.emplace(std::move(tool_name), std::move(tool));
    }

    std::string name() const override
    {
        return name_;
    }

    std::string version() const override
    {
        return version_;
    }

    std::vector<McpToolDefinition> list_tools() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<McpToolDefinition> defs;
        defs.reserve(tools_.size());
        for (const auto& [name, tool] : tools_)
            defs.push_back(tool.definition());
        return defs;
    }

    McpToolResult call_tool(const std::string& tool_name, const json& arguments) override
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = tools_.find(tool_name);
        if (it == tools_.end())
            throw McpToolNotFoundError(tool_name);
        McpTool tool = it->second;
        lock.unlock();

        // Run the handler unlocked so tools may call back into the server
        return tool.call(arguments);
    }

    size_t tool_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return tools_.size();
    }

    bool has_tool(const std::string& tool_name) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return tools_.find(tool_name) != tools_.end();
    }

  private:
    std::string name_;
    std::string version_;
    mutable std::mutex mutex_;
    std::map<std::string, McpTool> tools_;
};

// ============================================================================
// Server Factory Functions
// ============================================================================

/// Create an in-process server from a list of tools
inline std::shared_ptr<SdkMcpServer> create_server(const std::string& name,
                                                   const std::string& version,
                                                   std::vector<McpTool> tools = {})
{
    auto server = std::make_shared<SdkMcpServer>(name, version);
    for (auto& tool : tools)
        server->add_tool(std::move(tool));
    return server;
}

/// Fluent builder for MCP servers
class ServerBuilder
{
  public:
    ServerBuilder(std::string name, std::string version)
        : server_(std::make_shared<SdkMcpServer>(std::move(name), std::move(version)))
    {
    }

    ServerBuilder& add_tool(McpTool tool)
    {
        server_->add_tool(std::move(tool));
        return *this;
    }

    std::shared_ptr<SdkMcpServer> build()
    {
        return server_;
    }

    size_t tool_count() const
    {
        return server_->tool_count();
    }

  private:
    std::shared_ptr<SdkMcpServer> server_;
};

/// Create a server builder
inline ServerBuilder server(const std::string& name, const std::string& version)
{
    return ServerBuilder(name, version);
}

} // namespace mcp
} // namespace agentlink

#endif // AGENTLINK_MCP_SERVER_HPP
