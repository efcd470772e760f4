#pragma once
#include "superprompt/types.hpp"

#include <string>

namespace superprompt
{

struct Settings
{
    std::string log_level{"INFO"};
    std::string server_name;
    std::string server_version;
    /// Path of the primary engine shared library. Empty means no primary runtime.
    std::string engine_library;
    std::string project_root{"."};
    Permission permission_level{Permission::Admin};
    /// Direct tool calls outside the protocol require MCP_SERVER_MODE.
    bool direct_call_allowed{false};

    Settings();

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace superprompt
