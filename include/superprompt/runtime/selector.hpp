#pragma once
#include "superprompt/runtime/runtime.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace superprompt::runtime
{

struct Selection
{
    RuntimeMode mode;
    Runtime* runtime; ///< Owned by the selector
    std::string fallback_reason; ///< Why the primary engine was not used; empty for Primary
};

/// Picks the runtime for this process, once.
///
/// select() freezes the registry, probes the primary engine and falls back to the stdio
/// server when the engine is unavailable. An engine that fails for any other reason, or a
/// fallback that cannot be built, propagates out of select().
class RuntimeSelector
{
  public:
    RuntimeSelector(tools::ToolRegistry& tools, const Settings& settings,
                    EventSink* events = nullptr, std::istream& in = std::cin,
                    std::ostream& out = std::cout);

    RuntimeSelector(const RuntimeSelector&) = delete;
    RuntimeSelector& operator=(const RuntimeSelector&) = delete;

    /// Throws Error when called a second time.
    Selection select();

    /// Empty until select() succeeded.
    std::optional<RuntimeMode> mode() const
    {
        return mode_;
    }

  private:
    tools::ToolRegistry& tools_;
    const Settings& settings_;
    EventSink* events_;
    std::istream& in_;
    std::ostream& out_;
    bool attempted_{false};
    std::optional<RuntimeMode> mode_;
    std::unique_ptr<Runtime> runtime_;
};

} // namespace superprompt::runtime
