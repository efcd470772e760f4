#include "superprompt/tools/registry.hpp"

#include "superprompt/util/log.hpp"

namespace superprompt::tools
{

void ToolRegistry::register_tool(Tool tool)
{
    if (frozen_)
        throw RegistryFrozenError("cannot register '" + tool.name() +
                                  "': registration phase is over");
    if (tool.name().empty())
        throw ValidationError("tool name must not be empty");
    if (has(tool.name()))
        throw DuplicateNameError("tool already registered: " + tool.name());

    index_.emplace(tool.name(), tools_.size());
    tools_.push_back(std::move(tool));
}

void ToolRegistry::register_all(const std::vector<std::shared_ptr<ToolProvider>>& providers)
{
    for (const auto& provider : providers)
    {
        if (!provider)
            throw ValidationError("tool provider cannot be null");
        const size_t before = tools_.size();
        provider->register_tools(*this);
        util::log::debug("provider registered " + std::to_string(tools_.size() - before) +
                         " tool(s)");
    }
}

std::vector<ToolDescriptor> ToolRegistry::list() const
{
    std::vector<ToolDescriptor> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_)
        out.push_back(tool.descriptor());
    return out;
}

std::vector<std::string> ToolRegistry::list_names() const
{
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& tool : tools_)
        names.push_back(tool.name());
    return names;
}

const Tool* ToolRegistry::find(const std::string& name) const
{
    auto it = index_.find(name);
    if (it == index_.end())
        return nullptr;
    return &tools_[it->second];
}

const Tool& ToolRegistry::get(const std::string& name) const
{
    const Tool* tool = find(name);
    if (!tool)
        throw NotFoundError("tool not found: " + name);
    return *tool;
}

} // namespace superprompt::tools
