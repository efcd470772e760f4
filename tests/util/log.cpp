#include "superprompt/util/log.hpp"

#include <cassert>
#include <sstream>
#include <string>

int main()
{
    using namespace superprompt::util;

    assert(log::level_from_string("DEBUG") == log::Level::Debug);
    assert(log::level_from_string("WARNING") == log::Level::Warn);
    assert(log::level_from_string("ERROR") == log::Level::Error);
    assert(log::level_from_string("OFF") == log::Level::Off);
    assert(log::level_from_string("bogus") == log::Level::Info);

    std::ostringstream sink;
    log::set_sink(&sink);

    log::set_level(log::Level::Info);
    log::debug("hidden");
    log::info("shown");
    log::error("broken");
    const std::string out = sink.str();
    assert(out.find("hidden") == std::string::npos);
    assert(out.find("-------- MCP: [INFO] shown\n") != std::string::npos);
    assert(out.find("-------- MCP: [ERROR] broken\n") != std::string::npos);

    sink.str("");
    log::set_level(log::Level::Off);
    log::error("silenced");
    assert(sink.str().empty());

    log::set_level(log::Level::Debug);
    log::debug("verbose");
    assert(sink.str().find("[DEBUG] verbose") != std::string::npos);

    log::set_sink(nullptr);
    log::set_level(log::Level::Info);
    return 0;
}
