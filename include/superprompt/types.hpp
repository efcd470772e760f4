#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace superprompt
{

using Json = nlohmann::json;

/// Which protocol runtime serves this process. Decided once at startup.
enum class RuntimeMode
{
    Primary, ///< External engine loaded from a shared library
    Fallback ///< Built-in line-delimited stdio server
};

inline std::string to_string(RuntimeMode mode)
{
    switch (mode)
    {
    case RuntimeMode::Primary:
        return "primary";
    case RuntimeMode::Fallback:
        return "fallback";
    }
    return "fallback";
}

/// Access level required by a tool / granted to the caller.
enum class Permission
{
    Read = 1,
    Write = 2,
    Admin = 3
};

inline std::string to_string(Permission level)
{
    switch (level)
    {
    case Permission::Read:
        return "read";
    case Permission::Write:
        return "write";
    case Permission::Admin:
        return "admin";
    }
    return "read";
}

inline bool permission_from_string(const std::string& s, Permission& out)
{
    if (s == "read")
        out = Permission::Read;
    else if (s == "write")
        out = Permission::Write;
    else if (s == "admin")
        out = Permission::Admin;
    else
        return false;
    return true;
}

/// Serialize a JSON value as one wire line. Invalid UTF-8 is replaced, never thrown.
inline std::string dump_line(const Json& j)
{
    return j.dump(-1, ' ', false, Json::error_handler_t::replace);
}

} // namespace superprompt
