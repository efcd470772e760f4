#pragma once
#include "superprompt/content.hpp"
#include "superprompt/tools/signature.hpp"
#include "superprompt/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace superprompt::tools
{

/// Static metadata of one callable tool, as advertised by tools/list.
struct ToolDescriptor
{
    std::string name;
    std::string description;
    std::optional<Json> input_schema; ///< Absent when the tool takes no input
    bool destructive{false};
    std::optional<std::string> category;
    std::vector<std::string> tags;
    Permission permission{Permission::Read};
};

/// tools/list entry: name, description, inputSchema (when present), annotations.
void to_json(Json& j, const ToolDescriptor& d);

/// First non-empty line of a documentation text, trimmed.
std::string short_description(const std::string& doc);

class Tool
{
  public:
    /// Receives arguments already bound to the signature (defaults filled in).
    using Fn = std::function<ToolResult(const Json&)>;

    Tool() = default;

    Tool(std::string name, std::string doc, Signature signature, Fn fn, bool destructive = false)
        : name_(std::move(name)), doc_(std::move(doc)), signature_(std::move(signature)),
          fn_(std::move(fn)), destructive_(destructive),
          permission_(destructive ? Permission::Write : Permission::Read)
    {
        input_schema_ = synthesize_schema(signature_);
    }

    const std::string& name() const
    {
        return name_;
    }
    const std::string& doc() const
    {
        return doc_;
    }
    std::string description() const;
    const Signature& signature() const
    {
        return signature_;
    }
    const std::optional<Json>& input_schema() const
    {
        return input_schema_;
    }
    bool destructive() const
    {
        return destructive_;
    }
    const std::optional<std::string>& category() const
    {
        return category_;
    }
    const std::vector<std::string>& tags() const
    {
        return tags_;
    }
    Permission permission() const
    {
        return permission_;
    }

    ToolDescriptor descriptor() const;

    /// Throws BindingError when the arguments do not fit the signature.
    Json bind(const Json& arguments) const
    {
        return bind_arguments(signature_, arguments);
    }

    /// Run the handler on arguments returned by bind().
    ToolResult call(const Json& bound_arguments) const
    {
        return fn_(bound_arguments);
    }

    ToolResult invoke(const Json& arguments) const
    {
        return call(bind(arguments));
    }

    // Setters for optional fields (builder pattern)
    Tool& set_category(std::string category)
    {
        category_ = std::move(category);
        return *this;
    }
    Tool& set_tags(std::vector<std::string> tags)
    {
        tags_ = std::move(tags);
        return *this;
    }
    Tool& set_permission(Permission permission)
    {
        permission_ = permission;
        return *this;
    }

  private:
    std::string name_;
    std::string doc_;
    Signature signature_;
    std::optional<Json> input_schema_;
    Fn fn_;
    bool destructive_{false};
    std::optional<std::string> category_;
    std::vector<std::string> tags_;
    Permission permission_{Permission::Read};
};

/// Throws PermissionDeniedError when the granted level is below what the tool requires.
void check_permission(const Tool& tool, Permission granted);

} // namespace superprompt::tools
