#pragma once
#include "superprompt/runtime/runtime.hpp"

#include <memory>
#include <string>
#include <variant>

namespace superprompt::runtime
{

/// RAII handle on a dlopen()ed library.
class SharedLibrary
{
  public:
    explicit SharedLibrary(std::string path) : path_(std::move(path)) {}

    SharedLibrary(SharedLibrary&& other) noexcept;
    SharedLibrary& operator=(SharedLibrary&& other) noexcept;

    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;

    ~SharedLibrary()
    {
        reset();
    }

    bool load(std::string* error);
    void* symbol(const char* name, std::string* error) const;

    const std::string& path() const
    {
        return path_;
    }
    bool loaded() const
    {
        return handle_ != nullptr;
    }

  private:
    void reset();

    std::string path_;
    void* handle_{nullptr};
};

struct Available
{
    std::unique_ptr<Runtime> runtime;
};

struct Unavailable
{
    std::string reason;
};

using ProbeResult = std::variant<Available, Unavailable>;

/// Try to acquire the primary engine named by context.settings.engine_library.
///
/// Absence of the capability (nothing configured, missing file, dlopen failure, missing
/// entry symbol, null engine, RuntimeUnavailableError from the factory) is Unavailable.
/// Any other exception from the factory is rethrown as Error.
ProbeResult probe_primary(const EngineContext& context);

} // namespace superprompt::runtime
