#pragma once
#include "superprompt/util/log.hpp"

#include <string>

namespace superprompt
{

/// Observer notified after each successful tools/call. Fire-and-forget: the caller
/// logs and drops anything a sink throws. Implementations must not block.
class EventSink
{
  public:
    virtual ~EventSink() = default;

    virtual void record(const std::string& tool_name) = 0;
};

class LoggingEventSink : public EventSink
{
  public:
    void record(const std::string& tool_name) override
    {
        util::log::debug("tool_call " + tool_name);
    }
};

} // namespace superprompt
