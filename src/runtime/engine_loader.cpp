#include "superprompt/runtime/engine_loader.hpp"

#include "superprompt/exceptions.hpp"
#include "superprompt/util/log.hpp"

#include <dlfcn.h>
#include <filesystem>

namespace superprompt::runtime
{

namespace
{
/// Keeps the library mapped for as long as the engine it produced is alive.
class LoadedEngine final : public Runtime
{
  public:
    LoadedEngine(SharedLibrary library, std::unique_ptr<Runtime> engine)
        : library_(std::move(library)), engine_(std::move(engine))
    {
    }

    RuntimeMode mode() const override
    {
        return RuntimeMode::Primary;
    }

    int run() override
    {
        return engine_->run();
    }

  private:
    // Declared first so it is destroyed last.
    SharedLibrary library_;
    std::unique_ptr<Runtime> engine_;
};
} // namespace

SharedLibrary::SharedLibrary(SharedLibrary&& other) noexcept
{
    *this = std::move(other);
}

SharedLibrary& SharedLibrary::operator=(SharedLibrary&& other) noexcept
{
    if (this != &other)
    {
        reset();
        path_ = std::move(other.path_);
        handle_ = other.handle_;
        other.handle_ = nullptr;
    }
    return *this;
}

bool SharedLibrary::load(std::string* error)
{
    reset();
    handle_ = dlopen(path_.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle_)
    {
        if (error)
        {
            const char* err = dlerror();
            *error = err ? err : "dlopen failed";
        }
        return false;
    }
    return true;
}

void* SharedLibrary::symbol(const char* name, std::string* error) const
{
    if (!handle_)
    {
        if (error)
            *error = "library not loaded";
        return nullptr;
    }
    dlerror();
    void* proc = dlsym(handle_, name);
    if (!proc && error)
    {
        const char* err = dlerror();
        *error = err ? err : "symbol not found";
    }
    return proc;
}

void SharedLibrary::reset()
{
    if (handle_)
        dlclose(handle_);
    handle_ = nullptr;
}

ProbeResult probe_primary(const EngineContext& context)
{
    const std::string& path = context.settings.engine_library;
    if (path.empty())
        return Unavailable{"no engine library configured"};

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return Unavailable{"engine library not found: " + path};

    SharedLibrary library(path);
    std::string error;
    if (!library.load(&error))
        return Unavailable{"cannot load " + path + ": " + error};

    void* symbol = library.symbol(kCreateEngineSymbol, &error);
    if (!symbol)
        return Unavailable{"no " + std::string(kCreateEngineSymbol) + " in " + path + ": " + error};

    auto create = reinterpret_cast<CreateEngineFn>(symbol);
    std::unique_ptr<Runtime> engine;
    try
    {
        engine.reset(create(context));
    }
    // Messages are copied out while the library is still mapped.
    catch (const RuntimeUnavailableError& e)
    {
        return Unavailable{std::string("engine unavailable: ") + e.what()};
    }
    catch (const std::exception& e)
    {
        throw Error("primary engine " + path + " failed to start: " + e.what());
    }

    if (!engine)
        return Unavailable{"engine factory in " + path + " returned no runtime"};

    util::log::debug("primary engine loaded from " + path);
    return Available{std::make_unique<LoadedEngine>(std::move(library), std::move(engine))};
}

} // namespace superprompt::runtime
