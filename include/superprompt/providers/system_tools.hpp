#pragma once
#include "superprompt/providers/mode_store.hpp"
#include "superprompt/tools/registry.hpp"

#include <string>

namespace superprompt::providers
{

/// Built-in sp.* tools: version, health, tool listing and LLM mode management.
/// The registered handlers refer to this provider and to the registry; both must outlive
/// every call.
class SystemToolsProvider : public tools::ToolProvider
{
  public:
    SystemToolsProvider(std::string version, std::filesystem::path project_root);

    void register_tools(tools::ToolRegistry& registry) override;

    const ModeStore& modes() const
    {
        return modes_;
    }

  private:
    std::string version_;
    ModeStore modes_;
};

} // namespace superprompt::providers
