#pragma once
#include <ostream>
#include <string>

namespace superprompt::util::log
{

enum class Level
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

/// Parse "DEBUG" / "INFO" / "WARNING" / "WARN" / "ERROR" / "OFF"; unknown names map to Info.
Level level_from_string(const std::string& name);

void set_level(Level level);
Level level();

/// Redirect diagnostics (tests). Passing nullptr restores std::cerr. Never point this at stdout.
void set_sink(std::ostream* sink);

void write(Level level, const std::string& message);

inline void debug(const std::string& message)
{
    write(Level::Debug, message);
}
inline void info(const std::string& message)
{
    write(Level::Info, message);
}
inline void warn(const std::string& message)
{
    write(Level::Warn, message);
}
inline void error(const std::string& message)
{
    write(Level::Error, message);
}

} // namespace superprompt::util::log
