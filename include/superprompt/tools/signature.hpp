#pragma once
#include "superprompt/types.hpp"

#include <optional>
#include <string>
#include <type_traits>
#include <vector>

namespace superprompt::tools
{

/// Declared type of a tool parameter. Any is untyped and advertised as "string".
enum class ParamType
{
    Boolean,
    Integer,
    Number,
    String,
    Any
};

enum class ParamKind
{
    Named,         ///< Ordinary named parameter
    VarPositional, ///< Catch-all positional; never part of the schema
    VarKeyword     ///< Catch-all keyword; unknown arguments pass through to the handler
};

struct Param
{
    std::string name;
    ParamType type{ParamType::Any};
    std::optional<Json> default_value;
    ParamKind kind{ParamKind::Named};

    bool required() const
    {
        return kind == ParamKind::Named && !default_value.has_value();
    }
};

/// JSON Schema type name for a parameter type. Total: unknown or untyped maps to "string".
std::string json_type_name(ParamType type);

/// Map a textual annotation ("bool", "int", "float", "str", "Any", ...) to a parameter type.
/// Unrecognized annotations degrade to Any.
ParamType param_type_from_annotation(const std::string& annotation);

template <typename T>
constexpr ParamType param_type_of()
{
    using U = std::decay_t<T>;
    if constexpr (std::is_same_v<U, bool>)
        return ParamType::Boolean;
    else if constexpr (std::is_integral_v<U>)
        return ParamType::Integer;
    else if constexpr (std::is_floating_point_v<U>)
        return ParamType::Number;
    else if constexpr (std::is_same_v<U, std::string> || std::is_same_v<U, const char*>)
        return ParamType::String;
    else
        return ParamType::Any;
}

/// Ordered parameter list of a tool, supplied explicitly at registration time.
///
/// Usage:
///   Signature sig;
///   sig.param<std::string>("query").param<bool>("force", false).var_kwargs();
class Signature
{
  public:
    Signature() = default;

    /// Required parameter.
    Signature& param(std::string name, ParamType type);
    /// Optional parameter carrying its default.
    Signature& param(std::string name, ParamType type, Json default_value);

    template <typename T>
    Signature& param(std::string name)
    {
        return param(std::move(name), param_type_of<T>());
    }

    template <typename T>
    Signature& param(std::string name, const T& default_value)
    {
        return param(std::move(name), param_type_of<T>(), Json(default_value));
    }

    Signature& var_args(std::string name = "args");
    Signature& var_kwargs(std::string name = "kwargs");

    const std::vector<Param>& params() const
    {
        return params_;
    }

    bool accepts_extra_keywords() const;

    const Param* find(const std::string& name) const;

  private:
    void add(Param p);

    std::vector<Param> params_;
};

/// Derive the input schema from a signature. Catch-all parameters are skipped; a signature
/// with no named parameter yields std::nullopt (the tool takes no input). Never throws.
std::optional<Json> synthesize_schema(const Signature& signature);

/// Bind call arguments to a signature: reject unknown and missing names and mistyped values,
/// fill defaults. Throws BindingError with a message describing the first mismatch.
Json bind_arguments(const Signature& signature, const Json& arguments);

} // namespace superprompt::tools
