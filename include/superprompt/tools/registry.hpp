#pragma once
#include "superprompt/exceptions.hpp"
#include "superprompt/tools/tool.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace superprompt::tools
{

class ToolRegistry;

/// A collaborator that contributes tools during the registration phase.
class ToolProvider
{
  public:
    virtual ~ToolProvider() = default;

    virtual void register_tools(ToolRegistry& registry) = 0;
};

/// Name-keyed, registration-ordered tool collection.
///
/// Registration is append-only and ends with freeze(); after that the registry is
/// read-only and safe for concurrent lookups. Pointers returned by find() stay valid
/// from freeze() until the registry is destroyed.
class ToolRegistry
{
  public:
    ToolRegistry() = default;
    explicit ToolRegistry(const std::vector<std::shared_ptr<ToolProvider>>& providers)
    {
        register_all(providers);
    }

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// Throws DuplicateNameError if the name is taken, RegistryFrozenError after freeze().
    void register_tool(Tool tool);

    /// Let every provider register its tools, in order.
    void register_all(const std::vector<std::shared_ptr<ToolProvider>>& providers);

    /// Descriptors in registration order.
    std::vector<ToolDescriptor> list() const;
    std::vector<std::string> list_names() const;

    const Tool* find(const std::string& name) const;
    /// Throws NotFoundError.
    const Tool& get(const std::string& name) const;

    bool has(const std::string& name) const
    {
        return index_.count(name) > 0;
    }
    size_t size() const
    {
        return tools_.size();
    }
    bool empty() const
    {
        return tools_.empty();
    }

    void freeze()
    {
        frozen_ = true;
    }
    bool frozen() const
    {
        return frozen_;
    }

  private:
    std::vector<Tool> tools_;
    std::unordered_map<std::string, size_t> index_;
    bool frozen_{false};
};

} // namespace superprompt::tools
