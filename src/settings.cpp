#include "superprompt/settings.hpp"

#include "superprompt/exceptions.hpp"
#include "superprompt/version.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace superprompt
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string to_upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

Settings::Settings() : server_name(SERVER_NAME), server_version(VERSION_STRING) {}

Settings Settings::from_env()
{
    Settings s;
    s.log_level = to_upper(getenv_str("SUPER_PROMPT_LOG_LEVEL", s.log_level));
    s.server_version = getenv_str("SUPER_PROMPT_VERSION", s.server_version);
    s.engine_library = getenv_str("SUPER_PROMPT_ENGINE", "");
    s.project_root = getenv_str("SUPER_PROMPT_PROJECT_ROOT", s.project_root);

    // An explicit level wins; otherwise ALLOW_INIT=0 drops the caller to read-only.
    Permission explicit_level;
    auto level = to_lower(getenv_str("SUPER_PROMPT_PERMISSION_LEVEL", ""));
    if (permission_from_string(level, explicit_level))
    {
        s.permission_level = explicit_level;
    }
    else
    {
        auto flag = to_lower(getenv_str("SUPER_PROMPT_ALLOW_INIT", ""));
        if (flag == "0" || flag == "false" || flag == "no")
            s.permission_level = Permission::Read;
    }

    s.direct_call_allowed = !getenv_str("MCP_SERVER_MODE", "").empty();
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = to_upper(j.at("log_level").get<std::string>());
    if (j.contains("server_name"))
        s.server_name = j.at("server_name").get<std::string>();
    if (j.contains("server_version"))
        s.server_version = j.at("server_version").get<std::string>();
    if (j.contains("engine_library"))
        s.engine_library = j.at("engine_library").get<std::string>();
    if (j.contains("project_root"))
        s.project_root = j.at("project_root").get<std::string>();
    if (j.contains("permission_level"))
    {
        auto level = to_lower(j.at("permission_level").get<std::string>());
        if (!permission_from_string(level, s.permission_level))
            throw ValidationError("unknown permission level: " + level);
    }
    if (j.contains("direct_call_allowed"))
        s.direct_call_allowed = j.at("direct_call_allowed").get<bool>();
    return s;
}

} // namespace superprompt
