#include "superprompt/tools/signature.hpp"

#include "superprompt/exceptions.hpp"

namespace superprompt::tools
{

std::string json_type_name(ParamType type)
{
    switch (type)
    {
    case ParamType::Boolean:
        return "boolean";
    case ParamType::Integer:
        return "integer";
    case ParamType::Number:
        return "number";
    case ParamType::String:
    case ParamType::Any:
        break;
    }
    return "string";
}

ParamType param_type_from_annotation(const std::string& annotation)
{
    if (annotation == "bool" || annotation == "boolean")
        return ParamType::Boolean;
    if (annotation == "int" || annotation == "integer")
        return ParamType::Integer;
    if (annotation == "float" || annotation == "number" || annotation == "double")
        return ParamType::Number;
    if (annotation == "str" || annotation == "string")
        return ParamType::String;
    return ParamType::Any;
}

Signature& Signature::param(std::string name, ParamType type)
{
    Param p;
    p.name = std::move(name);
    p.type = type;
    add(std::move(p));
    return *this;
}

Signature& Signature::param(std::string name, ParamType type, Json default_value)
{
    Param p;
    p.name = std::move(name);
    p.type = type;
    p.default_value = std::move(default_value);
    add(std::move(p));
    return *this;
}

Signature& Signature::var_args(std::string name)
{
    Param p;
    p.name = std::move(name);
    p.kind = ParamKind::VarPositional;
    add(std::move(p));
    return *this;
}

Signature& Signature::var_kwargs(std::string name)
{
    Param p;
    p.name = std::move(name);
    p.kind = ParamKind::VarKeyword;
    add(std::move(p));
    return *this;
}

bool Signature::accepts_extra_keywords() const
{
    for (const auto& p : params_)
        if (p.kind == ParamKind::VarKeyword)
            return true;
    return false;
}

const Param* Signature::find(const std::string& name) const
{
    for (const auto& p : params_)
        if (p.kind == ParamKind::Named && p.name == name)
            return &p;
    return nullptr;
}

void Signature::add(Param p)
{
    if (p.name.empty())
        throw ValidationError("parameter name must not be empty");
    for (const auto& existing : params_)
    {
        if (existing.name == p.name)
            throw ValidationError("duplicate parameter '" + p.name + "'");
        if (p.kind != ParamKind::Named && existing.kind == p.kind)
            throw ValidationError("more than one catch-all parameter of the same kind");
    }
    params_.push_back(std::move(p));
}

std::optional<Json> synthesize_schema(const Signature& signature)
{
    Json properties = Json::object();
    Json required = Json::array();

    for (const auto& p : signature.params())
    {
        if (p.kind != ParamKind::Named)
            continue;

        Json prop = {{"type", json_type_name(p.type)}};
        if (p.default_value)
            prop["default"] = *p.default_value;
        else
            required.push_back(p.name);
        properties[p.name] = std::move(prop);
    }

    if (properties.empty())
        return std::nullopt;

    Json schema = {{"type", "object"}, {"properties", std::move(properties)}};
    if (!signature.accepts_extra_keywords())
        schema["additionalProperties"] = false;
    if (!required.empty())
        schema["required"] = std::move(required);
    return schema;
}

namespace
{
bool value_matches(const Param& p, const Json& value)
{
    // An explicit null is fine where null is the default.
    if (value.is_null() && p.default_value && p.default_value->is_null())
        return true;

    switch (p.type)
    {
    case ParamType::Boolean:
        return value.is_boolean();
    case ParamType::Integer:
        return value.is_number_integer();
    case ParamType::Number:
        return value.is_number();
    case ParamType::String:
        return value.is_string();
    case ParamType::Any:
        return true;
    }
    return true;
}

std::string quoted_list(const std::vector<std::string>& names)
{
    std::string out;
    for (size_t i = 0; i < names.size(); ++i)
    {
        if (i > 0)
            out += ", ";
        out += "'" + names[i] + "'";
    }
    return out;
}
} // namespace

Json bind_arguments(const Signature& signature, const Json& arguments)
{
    if (!arguments.is_null() && !arguments.is_object())
        throw BindingError("arguments must be an object");

    const Json args = arguments.is_null() ? Json::object() : arguments;
    const bool extra_ok = signature.accepts_extra_keywords();

    Json bound = Json::object();
    for (auto it = args.begin(); it != args.end(); ++it)
    {
        const Param* p = signature.find(it.key());
        if (!p)
        {
            if (!extra_ok)
                throw BindingError("got an unexpected keyword argument '" + it.key() + "'");
            bound[it.key()] = it.value();
            continue;
        }
        if (!value_matches(*p, it.value()))
            throw BindingError("argument '" + p->name + "' must be of type " +
                               json_type_name(p->type));
        bound[p->name] = it.value();
    }

    std::vector<std::string> missing;
    for (const auto& p : signature.params())
    {
        if (p.kind != ParamKind::Named || bound.contains(p.name))
            continue;
        if (p.default_value)
            bound[p.name] = *p.default_value;
        else
            missing.push_back(p.name);
    }

    if (!missing.empty())
    {
        throw BindingError("missing " + std::to_string(missing.size()) + " required argument" +
                           (missing.size() == 1 ? "" : "s") + ": " + quoted_list(missing));
    }
    return bound;
}

} // namespace superprompt::tools
