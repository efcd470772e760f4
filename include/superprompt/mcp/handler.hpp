#pragma once
#include "superprompt/events.hpp"
#include "superprompt/settings.hpp"
#include "superprompt/tools/registry.hpp"
#include "superprompt/types.hpp"

#include <array>
#include <functional>
#include <optional>
#include <string>

namespace superprompt::mcp
{

namespace error_code
{
constexpr int ParseError = -32700;
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InvalidParams = -32602;
constexpr int InternalError = -32603;
constexpr int ToolExecution = -32000;
} // namespace error_code

/// Methods served by this protocol subset.
enum class Method
{
    Initialize,
    Ping,
    ToolsList,
    ToolsCall,
    PromptsList,
    PromptsGet,
    Unknown
};

constexpr size_t kMethodCount = static_cast<size_t>(Method::Unknown);

Method method_from_string(const std::string& name);

Json jsonrpc_result(const Json& id, Json result);
Json jsonrpc_error(const Json& id, int code, const std::string& message);

/// True for a message that must never be answered: jsonrpc "2.0" with an absent or null id.
bool is_notification(const Json& message);

struct ServerInfo
{
    std::string name;
    std::string version;
    std::string protocol_version;

    static ServerInfo from_settings(const Settings& settings);
};

/// JSON-RPC dispatcher for the MCP subset: initialize, ping, tools/list, tools/call,
/// prompts/list, prompts/get.
///
/// handle() returns the response for a request and std::nullopt for a notification.
/// It never throws: every failure becomes a JSON-RPC error object.
class McpHandler
{
  public:
    McpHandler(ServerInfo info, const tools::ToolRegistry& tools,
               Permission granted = Permission::Admin, EventSink* events = nullptr);

    // Routes capture this.
    McpHandler(const McpHandler&) = delete;
    McpHandler& operator=(const McpHandler&) = delete;

    std::optional<Json> handle(const Json& message) const;

    std::optional<Json> operator()(const Json& message) const
    {
        return handle(message);
    }

    const ServerInfo& info() const
    {
        return info_;
    }

  private:
    using Route = std::function<Json(const Json& id, const Json& params)>;

    Json initialize(const Json& id) const;
    Json list_tools(const Json& id) const;
    Json call_tool(const Json& id, const Json& params) const;
    void notify(const std::string& tool_name) const;

    ServerInfo info_;
    const tools::ToolRegistry& tools_;
    Permission granted_;
    EventSink* events_;
    std::array<Route, kMethodCount> routes_;
};

using Handler = std::function<std::optional<Json>(const Json&)>;

/// Wrap an McpHandler in a copyable callable for the stdio server.
Handler make_mcp_handler(ServerInfo info, const tools::ToolRegistry& tools,
                         Permission granted = Permission::Admin, EventSink* events = nullptr);

Handler make_mcp_handler(const Settings& settings, const tools::ToolRegistry& tools,
                         EventSink* events = nullptr);

} // namespace superprompt::mcp
