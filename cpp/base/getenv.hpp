#pragma once

#include "exception.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>
#include <type_traits>

namespace base {

namespace detail {

inline const char* get_env_impl(const char* name)
{
    return std::getenv(name);
}

} // namespace detail

/**
 * @brief Reads environment variable @p name, converted to `T`.
 *
 * Returns @p default_value when the variable is not set. Booleans accept `1/true/yes` and `0/false/no` in any case.
 * @throws invalid_environment_value if the value can't be converted to `T`.
 */
template <typename T>
requires std::is_same_v<T, std::string> || std::is_same_v<T, bool> || std::is_integral_v<T>
inline T getenv(const std::string& name, T default_value = T{})
{
    const char* value = detail::get_env_impl(name.c_str());
    if (!value) {
        return default_value;
    }

    std::string str(value);
    if constexpr (std::is_same_v<T, std::string>) {
        return str;
    } else if constexpr (std::is_same_v<T, bool>) {
        std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (str == "1" || str == "true" || str == "yes") {
            return true;
        }
        if (str == "0" || str == "false" || str == "no") {
            return false;
        }
        throw invalid_environment_value(name, value);
    } else {
        T result{};
        auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), result);
        if (ec != std::errc() || ptr != str.data() + str.size()) {
            throw invalid_environment_value(name, str);
        }
        return result;
    }
}

} // namespace base
