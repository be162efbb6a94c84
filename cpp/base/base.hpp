#pragma once

/**
 * @file base.hpp
 * @brief Module level functions of `base`: logger setup and the logging front end.
 */

/**
 * @defgroup base
 * @{
 * @brief Lowest level utilities of strata: exceptions, assertions, logging and environment access.
 *
 * @}
 */

#include "exception.hpp"
#include "log_channel.hpp"
#include "logger_adapter.hpp"
#include "logging_span_holder.hpp"

#include <memory>
#include <string>

namespace base {

/**
 * @brief Routes all logging to @p adapter instead of the default spdlog adapter.
 */
void initialize(std::shared_ptr<logger_adapter> adapter, log_level level = log_level::warning);

/**
 * @brief Restores the default spdlog adapter and the warning level.
 */
void deinitialize();

bool is_initialized();

logger& get_logger();

/**
 * Logs the start of an operation now, and its end with the duration when the returned holder is ended or destroyed.
 */
std::unique_ptr<logging_span_holder> log_span(const log_channel& channel, const std::string& message);

template <typename... Args>
inline void log(log_level level, const log_channel& channel, const std::string& message, Args&&... args)
{
    auto& l = get_logger();
    if (l.enabled(level)) {
        l.log(level, channel.name(), message, fmt::make_format_args(args...));
    }
}

template <typename... Args>
inline void log_debug(const log_channel& channel, const std::string& message, Args&&... args)
{
    log(log_level::debug, channel, message, std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_info(const log_channel& channel, const std::string& message, Args&&... args)
{
    log(log_level::info, channel, message, std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_warning(const log_channel& channel, const std::string& message, Args&&... args)
{
    log(log_level::warning, channel, message, std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_error(const log_channel& channel, const std::string& message, Args&&... args)
{
    log(log_level::error, channel, message, std::forward<Args>(args)...);
}

/**
 * @brief Logs `context: what()` followed by the exception parameters.
 */
void log_exception(log_level level, const log_channel& channel, std::string_view context, const exception& e);

} // namespace base
