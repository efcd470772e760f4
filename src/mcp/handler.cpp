#include "superprompt/mcp/handler.hpp"

#include "superprompt/content.hpp"
#include "superprompt/exceptions.hpp"
#include "superprompt/util/log.hpp"
#include "superprompt/version.hpp"

#include <memory>
#include <unordered_map>

namespace superprompt::mcp
{

Method method_from_string(const std::string& name)
{
    static const std::unordered_map<std::string, Method> kMethods = {
        {"initialize", Method::Initialize},    {"ping", Method::Ping},
        {"tools/list", Method::ToolsList},     {"tools/call", Method::ToolsCall},
        {"prompts/list", Method::PromptsList}, {"prompts/get", Method::PromptsGet},
    };
    auto it = kMethods.find(name);
    if (it == kMethods.end())
        return Method::Unknown;
    return it->second;
}

Json jsonrpc_result(const Json& id, Json result)
{
    return Json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

Json jsonrpc_error(const Json& id, int code, const std::string& message)
{
    return Json{{"jsonrpc", "2.0"},
                {"id", id},
                {"error", Json{{"code", code}, {"message", message}}}};
}

bool is_notification(const Json& message)
{
    if (!message.is_object())
        return false;
    auto it = message.find("id");
    const bool no_id = it == message.end() || it->is_null();
    auto version = message.find("jsonrpc");
    return no_id && version != message.end() && version->is_string() &&
           version->get<std::string>() == "2.0";
}

ServerInfo ServerInfo::from_settings(const Settings& settings)
{
    return ServerInfo{settings.server_name, settings.server_version, PROTOCOL_VERSION};
}

McpHandler::McpHandler(ServerInfo info, const tools::ToolRegistry& tools, Permission granted,
                       EventSink* events)
    : info_(std::move(info)), tools_(tools), granted_(granted), events_(events)
{
    auto slot = [this](Method m) -> Route& { return routes_[static_cast<size_t>(m)]; };

    slot(Method::Initialize) = [this](const Json& id, const Json&) { return initialize(id); };
    slot(Method::Ping) = [](const Json& id, const Json&)
    { return jsonrpc_result(id, Json::object()); };
    slot(Method::ToolsList) = [this](const Json& id, const Json&) { return list_tools(id); };
    slot(Method::ToolsCall) = [this](const Json& id, const Json& params)
    { return call_tool(id, params); };
    slot(Method::PromptsList) = [](const Json& id, const Json&)
    { return jsonrpc_result(id, Json{{"prompts", Json::array()}}); };
    // No prompt collaborators are wired; every lookup misses.
    slot(Method::PromptsGet) = [](const Json& id, const Json&)
    { return jsonrpc_error(id, error_code::MethodNotFound, "Prompt not found"); };
}

std::optional<Json> McpHandler::handle(const Json& message) const
{
    if (!message.is_object())
        return jsonrpc_error(nullptr, error_code::InvalidRequest, "Invalid Request");

    if (is_notification(message))
    {
        auto mit = message.find("method");
        if (mit != message.end() && mit->is_string())
            util::log::debug("notification ignored: " + mit->get<std::string>());
        return std::nullopt;
    }

    const Json id = message.contains("id") ? message.at("id") : Json();
    try
    {
        auto mit = message.find("method");
        if (mit == message.end() || !mit->is_string())
            return jsonrpc_error(id, error_code::InvalidRequest, "Invalid Request");

        const std::string method = mit->get<std::string>();
        const Json params = message.contains("params") && !message.at("params").is_null()
                                ? message.at("params")
                                : Json::object();

        const Method tag = method_from_string(method);
        if (tag == Method::Unknown)
            return jsonrpc_error(id, error_code::MethodNotFound,
                                 "Method '" + method + "' not implemented");

        return routes_[static_cast<size_t>(tag)](id, params);
    }
    catch (const std::exception& e)
    {
        util::log::error(std::string("internal error: ") + e.what());
        return jsonrpc_error(id, error_code::InternalError, e.what());
    }
}

Json McpHandler::initialize(const Json& id) const
{
    return jsonrpc_result(
        id, Json{{"protocolVersion", info_.protocol_version},
                 {"serverInfo", Json{{"name", info_.name}, {"version", info_.version}}},
                 {"capabilities", Json{{"tools", Json{{"listChanged", false}}},
                                       {"prompts", Json{{"listChanged", false}}}}}});
}

Json McpHandler::list_tools(const Json& id) const
{
    Json tools_array = Json::array();
    for (const auto& descriptor : tools_.list())
        tools_array.push_back(Json(descriptor));
    return jsonrpc_result(id, Json{{"tools", std::move(tools_array)}});
}

Json McpHandler::call_tool(const Json& id, const Json& params) const
{
    if (!params.is_object())
        return jsonrpc_error(id, error_code::InvalidParams, "Invalid params");

    std::string name;
    auto nit = params.find("name");
    if (nit != params.end() && nit->is_string())
        name = nit->get<std::string>();
    if (name.empty())
        return jsonrpc_error(id, error_code::InvalidParams, "Missing tool name");

    const tools::Tool* tool = tools_.find(name);
    if (!tool)
        return jsonrpc_error(id, error_code::InvalidParams, "Tool '" + name + "' not found");

    try
    {
        tools::check_permission(*tool, granted_);
    }
    catch (const PermissionDeniedError& e)
    {
        util::log::warn(name + " denied: " + e.what());
        return jsonrpc_error(id, error_code::ToolExecution, name + " failed: " + e.what());
    }

    const Json arguments = params.contains("arguments") ? params.at("arguments") : Json();

    ToolResult result;
    try
    {
        util::log::debug("tools/call " + name);
        result = tool->call(tool->bind(arguments));
    }
    catch (const BindingError& e)
    {
        return jsonrpc_error(id, error_code::InvalidParams,
                             "Invalid arguments for " + name + ": " + e.what());
    }
    catch (const std::exception& e)
    {
        util::log::warn(name + " failed: " + e.what());
        return jsonrpc_error(id, error_code::ToolExecution, name + " failed: " + e.what());
    }
    catch (...)
    {
        util::log::warn(name + " failed with a non-standard exception");
        return jsonrpc_error(id, error_code::ToolExecution, name + " failed: unknown error");
    }

    Json content = to_content_array(normalize(result));
    notify(name);
    return jsonrpc_result(id, Json{{"content", std::move(content)}});
}

void McpHandler::notify(const std::string& tool_name) const
{
    if (!events_)
        return;
    try
    {
        events_->record(tool_name);
    }
    catch (const std::exception& e)
    {
        util::log::warn("event sink failed for " + tool_name + ": " + e.what());
    }
}

Handler make_mcp_handler(ServerInfo info, const tools::ToolRegistry& tools, Permission granted,
                         EventSink* events)
{
    auto handler = std::make_shared<McpHandler>(std::move(info), tools, granted, events);
    return [handler](const Json& message) { return handler->handle(message); };
}

Handler make_mcp_handler(const Settings& settings, const tools::ToolRegistry& tools,
                         EventSink* events)
{
    return make_mcp_handler(ServerInfo::from_settings(settings), tools,
                            settings.permission_level, events);
}

} // namespace superprompt::mcp
