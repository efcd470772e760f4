#include "superprompt/content.hpp"

namespace superprompt
{

namespace
{
std::string stringify(const Json& v)
{
    if (v.is_string())
        return v.get<std::string>();
    return dump_line(v);
}

bool is_content_item(const Json& v)
{
    return v.is_object() && v.contains("type") && v.contains("text");
}

TextContent item_from(const Json& v)
{
    TextContent c;
    c.type = stringify(v.at("type"));
    c.text = stringify(v.at("text"));
    return c;
}

std::vector<TextContent> single(std::string text)
{
    TextContent c;
    c.text = std::move(text);
    return {std::move(c)};
}

std::string join_lines(const std::vector<std::string>& lines)
{
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
            out += '\n';
        out += lines[i];
    }
    return out;
}

struct ResultVisitor
{
    std::vector<TextContent> operator()(const std::monostate&) const
    {
        return single("");
    }
    std::vector<TextContent> operator()(const std::string& s) const
    {
        return single(s);
    }
    std::vector<TextContent> operator()(const std::vector<std::string>& lines) const
    {
        return single(join_lines(lines));
    }
    std::vector<TextContent> operator()(const TextContent& item) const
    {
        return {item};
    }
    std::vector<TextContent> operator()(const std::vector<TextContent>& items) const
    {
        if (items.empty())
            return single("");
        return items;
    }
    std::vector<TextContent> operator()(const Json& j) const
    {
        return normalize(j);
    }
};
} // namespace

std::vector<TextContent> normalize(const ToolResult& value)
{
    return std::visit(ResultVisitor{}, value);
}

std::vector<TextContent> normalize(const Json& value)
{
    if (value.is_null())
        return single("");

    if (value.is_array())
    {
        if (value.empty())
            return single("");

        bool all_items = true;
        for (const auto& element : value)
        {
            if (!is_content_item(element))
            {
                all_items = false;
                break;
            }
        }

        if (all_items)
        {
            std::vector<TextContent> items;
            items.reserve(value.size());
            for (const auto& element : value)
                items.push_back(item_from(element));
            return items;
        }

        std::vector<std::string> lines;
        lines.reserve(value.size());
        for (const auto& element : value)
            lines.push_back(stringify(element));
        return single(join_lines(lines));
    }

    if (is_content_item(value))
        return {item_from(value)};

    if (value.is_object() && value.contains("content"))
        return normalize(value.at("content"));

    return single(stringify(value));
}

Json to_content_array(const std::vector<TextContent>& items)
{
    Json arr = Json::array();
    for (const auto& item : items)
        arr.push_back(Json(item));
    return arr;
}

std::string join_text(const std::vector<TextContent>& items)
{
    std::vector<std::string> texts;
    texts.reserve(items.size());
    for (const auto& item : items)
        texts.push_back(item.text);
    return join_lines(texts);
}

} // namespace superprompt
