#pragma once
#include "superprompt/types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace superprompt
{

/// Canonical result unit of a tools/call.
struct TextContent
{
    std::string type{"text"};
    std::string text;
};

inline bool operator==(const TextContent& a, const TextContent& b)
{
    return a.type == b.type && a.text == b.text;
}

inline bool operator!=(const TextContent& a, const TextContent& b)
{
    return !(a == b);
}

// nlohmann::json adapters
inline void to_json(Json& j, const TextContent& c)
{
    j = Json{{"type", c.type}, {"text", c.text}};
}

inline void from_json(const Json& j, TextContent& c)
{
    c.type = j.value("type", std::string("text"));
    c.text = j.at("text").get<std::string>();
}

/// Everything a tool handler may hand back.
///   std::monostate            nothing (a tool with no output)
///   std::string               a single text
///   std::vector<std::string>  lines, joined with '\n'
///   TextContent               one ready item
///   std::vector<TextContent>  ready items, passed through
///   Json                      any structured value (mapping, list, scalar)
using ToolResult = std::variant<std::monostate, std::string, std::vector<std::string>, TextContent,
                                std::vector<TextContent>, Json>;

/// Convert a tool result into a non-empty list of content items. Never throws on data shape.
std::vector<TextContent> normalize(const ToolResult& value);

/// Rules, in order: null -> one empty item; list of {type,text} objects -> passed through;
/// other list -> elements joined with '\n'; {type,text} object -> one item;
/// object with "content" -> that member, normalized; anything else -> its JSON text.
std::vector<TextContent> normalize(const Json& value);

/// Items as a JSON array, ready for {"content": [...]}.
Json to_content_array(const std::vector<TextContent>& items);

/// Texts of all items joined with '\n' (direct-call output).
std::string join_text(const std::vector<TextContent>& items);

} // namespace superprompt
