#pragma once
#include "superprompt/events.hpp"
#include "superprompt/settings.hpp"
#include "superprompt/tools/registry.hpp"
#include "superprompt/types.hpp"

// Engines are POSIX shared objects loaded with dlopen().
#define SUPERPROMPT_ENGINE_API __attribute__((visibility("default")))

namespace superprompt::runtime
{

/// A protocol runtime that owns the process's stdin/stdout until it returns.
class Runtime
{
  public:
    virtual ~Runtime() = default;

    virtual RuntimeMode mode() const = 0;

    /// Serve until the peer goes away. Returns the process exit code.
    virtual int run() = 0;
};

/// What a primary engine gets to build itself from. Outlives the engine.
struct EngineContext
{
    const tools::ToolRegistry& tools;
    const Settings& settings;
    EventSink* events;
};

/// Entry point exported by a primary engine library. Engines are built against these
/// headers only and do not link the superprompt library. Returns an owned Runtime, or
/// nullptr / throws RuntimeUnavailableError when the engine cannot serve here.
using CreateEngineFn = Runtime* (*)(const EngineContext& context);

constexpr const char kCreateEngineSymbol[] = "superprompt_create_engine";

} // namespace superprompt::runtime
