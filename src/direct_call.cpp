#include "superprompt/direct_call.hpp"

#include "superprompt/content.hpp"
#include "superprompt/exceptions.hpp"
#include "superprompt/util/log.hpp"

namespace superprompt
{

int run_direct_call(const tools::ToolRegistry& registry, const Settings& settings,
                    const std::string& tool_name, const std::string& args_json,
                    std::ostream& out)
{
    if (!settings.direct_call_allowed)
    {
        util::log::error("direct tool call requires MCP_SERVER_MODE=1");
        return direct_exit::NotInServerMode;
    }

    Json args = Json::parse(args_json.empty() ? std::string("{}") : args_json, nullptr,
                            /*allow_exceptions=*/false);
    if (args.is_discarded() || !args.is_object())
    {
        util::log::error("invalid --args-json payload: expected a JSON object");
        return direct_exit::InvalidArgs;
    }

    const tools::Tool* tool = registry.find(tool_name);
    if (!tool)
    {
        util::log::error("unknown tool: " + tool_name);
        return direct_exit::UnknownTool;
    }

    ToolResult result;
    try
    {
        tools::check_permission(*tool, settings.permission_level);
        result = tool->invoke(args);
    }
    catch (const BindingError& e)
    {
        util::log::error("bad arguments for " + tool_name + ": " + e.what());
        return direct_exit::BadArguments;
    }
    catch (const std::exception& e)
    {
        util::log::error("tool " + tool_name + " failed: " + e.what());
        return direct_exit::ToolFailed;
    }

    out << join_text(normalize(result));
    out.flush();
    return direct_exit::Ok;
}

} // namespace superprompt
