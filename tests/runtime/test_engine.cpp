#include "superprompt/exceptions.hpp"
#include "superprompt/runtime/runtime.hpp"

#include <stdexcept>

using namespace superprompt;

namespace
{
class TestEngine final : public runtime::Runtime
{
  public:
    explicit TestEngine(const runtime::EngineContext& context) : context_(context) {}

    RuntimeMode mode() const override
    {
        return RuntimeMode::Primary;
    }

    // 40 plus the number of tools the engine was handed.
    int run() override
    {
        return 40 + static_cast<int>(context_.tools.size());
    }

  private:
    runtime::EngineContext context_;
};
} // namespace

#ifndef SP_TEST_ENGINE_NO_SYMBOL
extern "C" SUPERPROMPT_ENGINE_API runtime::Runtime*
superprompt_create_engine(const runtime::EngineContext& context)
{
#if defined(SP_TEST_ENGINE_THROWS)
    (void)context;
    throw std::runtime_error("engine exploded");
#elif defined(SP_TEST_ENGINE_UNAVAILABLE)
    (void)context;
    throw RuntimeUnavailableError("engine support not installed");
#elif defined(SP_TEST_ENGINE_NULL)
    (void)context;
    return nullptr;
#else
    return new TestEngine(context);
#endif
}
#else
extern "C" SUPERPROMPT_ENGINE_API int superprompt_unrelated_symbol()
{
    return 0;
}
#endif
