#pragma once

/**
 * @file exception.hpp
 * @brief Definition of the `exception` class.
 */

#include "format.hpp"

#include <exception>
#include <functional>
#include <map>
#include <string>
#include <utility>

namespace base {

/**
 * @brief Base class for all strata exceptions.
 *
 * Besides the message, an exception carries a set of named string parameters which adapters and callers can
 * inspect without parsing the message.
 */
class exception : public std::exception
{
public:
    using params_t = std::map<std::string, std::string, std::less<>>;

public:
    explicit exception(std::string&& what)
        : what_(std::move(what))
    {
    }

    exception(std::string&& what, params_t&& params)
        : what_(std::move(what))
        , params_(std::move(params))
    {
    }

    const char* what() const noexcept override
    {
        return what_.c_str();
    }

    const std::string& message() const noexcept
    {
        return what_;
    }

    const auto& params() const noexcept
    {
        return params_;
    }

    std::string param(std::string_view key) const
    {
        auto it = params_.find(key);
        return it == params_.end() ? std::string() : it->second;
    }

private:
    std::string what_;
    params_t params_;
};

class invalid_environment_value : public exception
{
public:
    invalid_environment_value(const std::string& name, const std::string& value)
        : exception(fmt::format("Environment variable {} has invalid value '{}'.", name, value),
                    params_t{{"name", name}, {"value", value}})
    {
    }
};

} // namespace base
