#include "superprompt/runtime/selector.hpp"

#include "superprompt/exceptions.hpp"
#include "superprompt/mcp/handler.hpp"
#include "superprompt/runtime/engine_loader.hpp"
#include "superprompt/runtime/fallback_runtime.hpp"
#include "superprompt/util/log.hpp"

namespace superprompt::runtime
{

RuntimeSelector::RuntimeSelector(tools::ToolRegistry& tools, const Settings& settings,
                                 EventSink* events, std::istream& in, std::ostream& out)
    : tools_(tools), settings_(settings), events_(events), in_(in), out_(out)
{
}

Selection RuntimeSelector::select()
{
    if (attempted_)
        throw Error("runtime already selected for this process");
    attempted_ = true;

    tools_.freeze();

    EngineContext context{tools_, settings_, events_};
    ProbeResult probe = probe_primary(context);

    if (auto* available = std::get_if<Available>(&probe))
    {
        runtime_ = std::move(available->runtime);
        mode_ = RuntimeMode::Primary;
        util::log::info("using primary runtime from " + settings_.engine_library);
        return Selection{*mode_, runtime_.get(), {}};
    }

    const std::string reason = std::get<Unavailable>(probe).reason;
    util::log::info("primary runtime unavailable (" + reason + "); using fallback stdio server");

    runtime_ = std::make_unique<FallbackRuntime>(mcp::make_mcp_handler(settings_, tools_, events_),
                                                 in_, out_);
    mode_ = RuntimeMode::Fallback;
    return Selection{*mode_, runtime_.get(), reason};
}

} // namespace superprompt::runtime
