#include "superprompt/tools/tool.hpp"

#include "superprompt/exceptions.hpp"

namespace superprompt::tools
{

std::string short_description(const std::string& doc)
{
    size_t start = 0;
    while (start <= doc.size())
    {
        size_t end = doc.find('\n', start);
        if (end == std::string::npos)
            end = doc.size();

        std::string line = doc.substr(start, end - start);
        const auto first = line.find_first_not_of(" \t\r");
        if (first != std::string::npos)
        {
            const auto last = line.find_last_not_of(" \t\r");
            return line.substr(first, last - first + 1);
        }
        start = end + 1;
    }
    return "";
}

std::string Tool::description() const
{
    auto text = short_description(doc_);
    if (text.empty())
        return name_ + " tool";
    return text;
}

ToolDescriptor Tool::descriptor() const
{
    ToolDescriptor d;
    d.name = name_;
    d.description = description();
    d.input_schema = input_schema_;
    d.destructive = destructive_;
    d.category = category_;
    d.tags = tags_;
    d.permission = permission_;
    return d;
}

void to_json(Json& j, const ToolDescriptor& d)
{
    j = Json{{"name", d.name}, {"description", d.description}};
    if (d.input_schema)
        j["inputSchema"] = *d.input_schema;

    Json annotations = {{"destructiveHint", d.destructive}};
    if (d.category)
        annotations["category"] = *d.category;
    if (!d.tags.empty())
        annotations["tags"] = d.tags;
    j["annotations"] = std::move(annotations);
}

void check_permission(const Tool& tool, Permission granted)
{
    if (static_cast<int>(tool.permission()) <= static_cast<int>(granted))
        return;
    throw PermissionDeniedError("Insufficient permissions. Tool '" + tool.name() + "' requires '" +
                                to_string(tool.permission()) + "' level, but caller has '" +
                                to_string(granted) + "' level");
}

} // namespace superprompt::tools
