#pragma once
#include <stdexcept>
#include <string>

namespace superprompt
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct DuplicateNameError : public Error
{
    using Error::Error;
};

struct RegistryFrozenError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

/// Arguments of a tools/call do not fit the tool's declared parameters.
struct BindingError : public ValidationError
{
    using ValidationError::ValidationError;
};

/// The caller's permission level is below the tool's.
struct PermissionDeniedError : public Error
{
    using Error::Error;
};

/// The primary runtime cannot be used in this environment; callers degrade to the fallback.
struct RuntimeUnavailableError : public Error
{
    using Error::Error;
};

} // namespace superprompt
