#include "superprompt/util/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace superprompt::util::log
{

namespace
{
constexpr const char kPrefix[] = "-------- MCP:";

std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_mutex;
std::ostream* g_sink = nullptr;

const char* level_tag(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        break;
    }
    return "";
}
} // namespace

Level level_from_string(const std::string& name)
{
    if (name == "DEBUG")
        return Level::Debug;
    if (name == "WARNING" || name == "WARN")
        return Level::Warn;
    if (name == "ERROR" || name == "CRITICAL")
        return Level::Error;
    if (name == "OFF" || name == "NONE")
        return Level::Off;
    return Level::Info;
}

void set_level(Level level)
{
    g_level = static_cast<int>(level);
}

Level level()
{
    return static_cast<Level>(g_level.load());
}

void set_sink(std::ostream* sink)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    g_sink = sink;
}

void write(Level lvl, const std::string& message)
{
    if (lvl == Level::Off || static_cast<int>(lvl) < g_level.load())
        return;

    std::lock_guard<std::mutex> lock(g_mutex);
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << kPrefix << " [" << level_tag(lvl) << "] " << message << std::endl;
}

} // namespace superprompt::util::log
