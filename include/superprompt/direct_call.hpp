#pragma once
#include "superprompt/settings.hpp"
#include "superprompt/tools/registry.hpp"

#include <ostream>
#include <string>

namespace superprompt
{

/// Process exit codes of a direct tool call.
namespace direct_exit
{
constexpr int Ok = 0;
constexpr int InvalidArgs = 2;
constexpr int UnknownTool = 3;
constexpr int BadArguments = 4;
constexpr int ToolFailed = 5;
constexpr int NotInServerMode = 97;
} // namespace direct_exit

/// Invoke one tool outside the protocol and write its normalized text to out.
///
/// args_json must be a JSON object (an empty string means {}). Failures are logged and
/// reported through the returned exit code; nothing is written to out on failure.
int run_direct_call(const tools::ToolRegistry& registry, const Settings& settings,
                    const std::string& tool_name, const std::string& args_json,
                    std::ostream& out);

} // namespace superprompt
