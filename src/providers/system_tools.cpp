#include "superprompt/providers/system_tools.hpp"

#include "superprompt/exceptions.hpp"
#include "superprompt/util/log.hpp"

namespace superprompt::providers
{

using tools::Signature;
using tools::Tool;

namespace
{
Tool mode_switch(const ModeStore& modes, std::string name, std::string doc, std::string target,
                 std::string message)
{
    return Tool(std::move(name), std::move(doc), Signature{},
                [&modes, target, message](const Json&) -> ToolResult
                {
                    modes.set(target);
                    return TextContent{"text", message};
                },
                /*destructive=*/true)
        .set_category("mode")
        .set_tags({"mode", "llm"});
}
} // namespace

SystemToolsProvider::SystemToolsProvider(std::string version, std::filesystem::path project_root)
    : version_(std::move(version)), modes_(std::move(project_root))
{
}

void SystemToolsProvider::register_tools(tools::ToolRegistry& registry)
{
    const std::string version = version_;

    registry.register_tool(Tool("sp.version", "Get Super Prompt version", Signature{},
                                [version](const Json&) -> ToolResult
                                { return TextContent{"text", "Super Prompt v" + version}; })
                               .set_category("system")
                               .set_tags({"system", "info"}));

    registry.register_tool(
        Tool("sp.health", "Report server liveness", Signature{},
             [&registry](const Json&) -> ToolResult
             {
                 return std::string("ok: " + std::to_string(registry.size()) +
                                    " tool(s) registered");
             })
            .set_category("system")
            .set_tags({"system", "health"}));

    registry.register_tool(
        Tool("sp.list_tools", "List the names of all registered tools\n\nOne name per line.",
             Signature{}, [&registry](const Json&) -> ToolResult { return registry.list_names(); })
            .set_category("system")
            .set_tags({"system", "info"}));

    registry.register_tool(Tool("sp.mode_get", "Get current LLM mode (gpt|grok|claude)",
                                Signature{}, [this](const Json&) -> ToolResult
                                { return modes_.get(); })
                               .set_category("mode")
                               .set_tags({"mode", "llm"}));

    registry.register_tool(
        Tool("sp.mode_set", "Set LLM mode to 'gpt', 'grok' or 'claude'",
             Signature{}.param<std::string>("mode"),
             [this](const Json& args) -> ToolResult
             {
                 const std::string mode = modes_.set(args.at("mode").get<std::string>());
                 util::log::info("mode set to " + mode);
                 return TextContent{"text", "mode set to " + mode};
             },
             /*destructive=*/true)
            .set_category("mode")
            .set_tags({"mode", "llm"}));

    registry.register_tool(mode_switch(modes_, "sp.gpt_mode_on", "Turn on GPT mode", "gpt",
                                       "GPT mode enabled"));
    registry.register_tool(mode_switch(modes_, "sp.grok_mode_on", "Turn on Grok mode", "grok",
                                       "Grok mode enabled"));
    registry.register_tool(mode_switch(modes_, "sp.claude_mode_on", "Turn on Claude mode",
                                       "claude", "Claude mode enabled"));
    registry.register_tool(mode_switch(modes_, "sp.gpt_mode_off", "Turn off GPT mode", "grok",
                                       "GPT mode turned off, switched to Grok"));
    registry.register_tool(mode_switch(modes_, "sp.grok_mode_off", "Turn off Grok mode", "gpt",
                                       "Grok mode turned off, switched to GPT"));
}

} // namespace superprompt::providers
