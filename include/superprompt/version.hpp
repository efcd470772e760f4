#pragma once

namespace superprompt
{

constexpr int VERSION_MAJOR = 5;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 5;
constexpr const char* VERSION_STRING = "5.0.5";

/// MCP protocol revision reported by the fallback server.
constexpr const char* PROTOCOL_VERSION = "0.1.0";

constexpr const char* SERVER_NAME = "super-prompt";

} // namespace superprompt
