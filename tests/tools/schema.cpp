#include "superprompt/exceptions.hpp"
#include "superprompt/tools/signature.hpp"
#include "superprompt/tools/tool.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace superprompt;
using namespace superprompt::tools;

int main()
{
    // Type mapping is total
    {
        assert(json_type_name(ParamType::Boolean) == "boolean");
        assert(json_type_name(ParamType::Integer) == "integer");
        assert(json_type_name(ParamType::Number) == "number");
        assert(json_type_name(ParamType::String) == "string");
        assert(json_type_name(ParamType::Any) == "string");

        assert(param_type_from_annotation("bool") == ParamType::Boolean);
        assert(param_type_from_annotation("int") == ParamType::Integer);
        assert(param_type_from_annotation("float") == ParamType::Number);
        assert(param_type_from_annotation("str") == ParamType::String);
        assert(param_type_from_annotation("Dict[str, Any]") == ParamType::Any);
        assert(json_type_name(param_type_from_annotation("")) == "string");

        static_assert(param_type_of<bool>() == ParamType::Boolean, "bool");
        static_assert(param_type_of<int>() == ParamType::Integer, "int");
        static_assert(param_type_of<double>() == ParamType::Number, "double");
        static_assert(param_type_of<std::string>() == ParamType::String, "string");
        static_assert(param_type_of<Json>() == ParamType::Any, "json");
        std::cout << "[PASS] type mapping\n";
    }

    // Required and optional parameters
    {
        Signature sig;
        sig.param<std::string>("query").param<int>("limit", 10).param("flag", ParamType::Boolean,
                                                                       false);
        auto schema = synthesize_schema(sig);
        assert(schema.has_value());
        const Json& s = *schema;
        assert(s["type"] == "object");
        assert(s["properties"]["query"] == (Json{{"type", "string"}}));
        assert(s["properties"]["limit"] == (Json{{"type", "integer"}, {"default", 10}}));
        assert(s["properties"]["flag"]["default"] == false);
        assert(s["required"] == Json::array({"query"}));
        assert(s["additionalProperties"] == false);
        std::cout << "[PASS] required/optional parameters\n";
    }

    // Null default is carried as a default
    {
        Signature sig;
        sig.param("persona", ParamType::Any, nullptr);
        auto schema = synthesize_schema(sig);
        assert(schema.has_value());
        assert((*schema)["properties"]["persona"]["type"] == "string");
        assert((*schema)["properties"]["persona"].contains("default"));
        assert((*schema)["properties"]["persona"]["default"].is_null());
        assert(!schema->contains("required"));
        std::cout << "[PASS] null default\n";
    }

    // Catch-all parameters never appear
    {
        Signature sig;
        sig.param<std::string>("a").var_args().var_kwargs();
        auto schema = synthesize_schema(sig);
        assert(schema.has_value());
        assert((*schema)["properties"].size() == 1);
        assert(!(*schema)["properties"].contains("args"));
        assert(!(*schema)["properties"].contains("kwargs"));
        assert(!schema->contains("additionalProperties"));
        std::cout << "[PASS] catch-all parameters excluded\n";
    }

    // No eligible parameters: no schema at all
    {
        assert(!synthesize_schema(Signature{}).has_value());

        Signature only_variadic;
        only_variadic.var_args("items").var_kwargs("options");
        assert(!synthesize_schema(only_variadic).has_value());

        Tool t("noop", "", Signature{}, [](const Json&) -> ToolResult { return {}; });
        assert(!t.input_schema().has_value());
        Json listed = t.descriptor();
        assert(!listed.contains("inputSchema"));
        std::cout << "[PASS] no schema for parameterless tools\n";
    }

    // Malformed signatures are rejected at registration time
    {
        bool threw = false;
        try
        {
            Signature sig;
            sig.param<int>("x").param<int>("x");
        }
        catch (const ValidationError&)
        {
            threw = true;
        }
        assert(threw);

        threw = false;
        try
        {
            Signature sig;
            sig.var_args("a").var_args("b");
        }
        catch (const ValidationError&)
        {
            threw = true;
        }
        assert(threw);
        std::cout << "[PASS] malformed signatures rejected\n";
    }

    // Descriptor rendering
    {
        Tool t("sp.mode_set", "\n  Set LLM mode  \nLonger text.", Signature{}.param<std::string>("mode"),
               [](const Json&) -> ToolResult { return std::string("ok"); }, true);
        t.set_category("mode").set_tags({"mode"});
        Json d = t.descriptor();
        assert(d["name"] == "sp.mode_set");
        assert(d["description"] == "Set LLM mode");
        assert(d["inputSchema"]["required"] == Json::array({"mode"}));
        assert(d["annotations"]["destructiveHint"] == true);
        assert(d["annotations"]["category"] == "mode");
        assert(d["annotations"]["tags"] == Json::array({"mode"}));
        assert(t.permission() == Permission::Write);

        Tool plain("plain", "", Signature{}, [](const Json&) -> ToolResult { return {}; });
        assert(plain.description() == "plain tool");
        assert(plain.permission() == Permission::Read);
        Json pd = plain.descriptor();
        assert(pd["annotations"] == (Json{{"destructiveHint", false}}));
        std::cout << "[PASS] descriptor rendering\n";
    }

    return 0;
}
