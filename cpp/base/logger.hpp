#pragma once

/**
 * @file logger.hpp
 * @brief Definition and implementation of the `logger` class.
 */

#include "assert.hpp"
#include "format.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace base {
class logger_adapter;

enum class log_level : unsigned char
{
    debug,
    info,
    warning,
    error
};

inline std::string log_level_to_str(const log_level t)
{
    switch (t) {
    case log_level::debug:
        return "debug";
    case log_level::info:
        return "info";
    case log_level::warning:
        return "warning";
    case log_level::error:
        return "error";
    default:
        ASSERT_MESSAGE(false, "Unknown log level");
        return "unknown";
    }
}

/**
 * @brief Parses a log level name, case insensitive.
 * @return false for unknown names, in which case @p out is left untouched.
 */
inline bool str_to_log_level(const std::string& level, log_level& out)
{
    auto final_string = level;
    std::ranges::transform(final_string, final_string.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (final_string == "DEBUG") {
        out = log_level::debug;
    } else if (final_string == "INFO") {
        out = log_level::info;
    } else if (final_string == "WARN" || final_string == "WARNING") {
        out = log_level::warning;
    } else if (final_string == "ERROR") {
        out = log_level::error;
    } else {
        return false;
    }
    return true;
}

class logger
{
public:
    logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;
    logger& operator=(logger&&) = delete;
    ~logger() = default;

    void log(log_level level, const std::string& channel, const std::string& message) const;

    void log(log_level level, const std::string& channel, const std::string& message,
             const std::map<std::string, std::string, std::less<>>& params) const;

    void log(log_level level, const std::string& channel, const std::string& message, const fmt::format_args& args) const;

    void add(std::shared_ptr<logger_adapter> adapter);

    void remove(const std::string& id);

    void clear();

    bool empty() const;

    void set_level(log_level level) noexcept
    {
        level_.store(level, std::memory_order_relaxed);
    }

    log_level level() const noexcept
    {
        return level_.load(std::memory_order_relaxed);
    }

    bool enabled(log_level level) const noexcept
    {
        return level >= this->level();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<logger_adapter>> adapters_;
    std::atomic<log_level> level_ = log_level::warning;
};

} // namespace base
