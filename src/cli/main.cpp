#include "superprompt/direct_call.hpp"
#include "superprompt/events.hpp"
#include "superprompt/exceptions.hpp"
#include "superprompt/providers/system_tools.hpp"
#include "superprompt/runtime/selector.hpp"
#include "superprompt/settings.hpp"
#include "superprompt/tools/registry.hpp"
#include "superprompt/util/log.hpp"
#include "superprompt/version.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "superprompt-mcp " << superprompt::VERSION_STRING << "\n";
    std::cout << "Usage:\n";
    std::cout << "  superprompt-mcp                         Serve MCP over stdio\n";
    std::cout << "  superprompt-mcp --call <tool> [--args-json <json>]\n";
    std::cout << "  superprompt-mcp --help\n";
    std::cout << "  superprompt-mcp --version\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  SUPER_PROMPT_ENGINE             Primary engine shared library\n";
    std::cout << "  SUPER_PROMPT_LOG_LEVEL          DEBUG|INFO|WARNING|ERROR|OFF\n";
    std::cout << "  SUPER_PROMPT_PROJECT_ROOT       Project directory (default: .)\n";
    std::cout << "  SUPER_PROMPT_PERMISSION_LEVEL   read|write|admin\n";
    std::cout << "  MCP_SERVER_MODE                 Required for --call\n";
    std::cout << "  SP_DIRECT_TOOL / SP_DIRECT_ARGS_JSON   Same as --call / --args-json\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] != flag)
            continue;
        if (i + 1 >= args.size())
            return std::nullopt;
        std::string value = args[i + 1];
        args.erase(args.begin() + static_cast<std::ptrdiff_t>(i),
                   args.begin() + static_cast<std::ptrdiff_t>(i + 2));
        return value;
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<std::ptrdiff_t>(i));
            return true;
        }
    }
    return false;
}

static std::string getenv_str(const char* key)
{
    const char* v = std::getenv(key);
    return v ? std::string(v) : std::string();
}

} // namespace

int main(int argc, char** argv)
{
    using namespace superprompt;

    std::vector<std::string> args(argv + 1, argv + argc);
    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);
    if (consume_flag(args, "--version"))
    {
        std::cout << "superprompt-mcp " << VERSION_STRING << "\n";
        return 0;
    }

    std::string direct_tool = getenv_str("SP_DIRECT_TOOL");
    std::string direct_args = getenv_str("SP_DIRECT_ARGS_JSON");
    if (auto v = consume_flag_value(args, "--call"))
    {
        if (direct_tool.empty())
            direct_tool = *v;
    }
    if (auto v = consume_flag_value(args, "--args-json"))
    {
        if (direct_args.empty())
            direct_args = *v;
    }
    if (!args.empty())
    {
        std::cerr << "Unknown argument: " << args.front() << "\n";
        return usage(2);
    }

    try
    {
        const Settings settings = Settings::from_env();
        util::log::set_level(util::log::level_from_string(settings.log_level));

        auto system_tools =
            std::make_shared<providers::SystemToolsProvider>(settings.server_version,
                                                             settings.project_root);
        std::vector<std::shared_ptr<tools::ToolProvider>> providers{system_tools};
        tools::ToolRegistry registry(providers);

        if (!direct_tool.empty())
        {
            registry.freeze();
            return run_direct_call(registry, settings, direct_tool, direct_args, std::cout);
        }

        LoggingEventSink events;
        runtime::RuntimeSelector selector(registry, settings, &events);
        runtime::Selection selection = selector.select();
        util::log::info("runtime mode: " + to_string(selection.mode) + ", " +
                        std::to_string(registry.size()) + " tool(s)");
        return selection.runtime->run();
    }
    catch (const std::exception& e)
    {
        util::log::error(std::string("fatal: ") + e.what());
        return 1;
    }
}
