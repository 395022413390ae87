#pragma once
#include <stdexcept>
#include <string>

namespace ssemcp
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

struct ToolTimeoutError : public Error
{
    using Error::Error;
};

/// Invalid configuration detected at startup (bad settings, duplicate tool names).
struct ConfigError : public Error
{
    using Error::Error;
};

} // namespace ssemcp
