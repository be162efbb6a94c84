#pragma once

/**
 * @file logging_span_holder.hpp
 * @brief Scoped debug logging of an operation and its duration.
 */

#include "log_channel.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace base {

/**
 * @brief Logs "Started" on construction and "Finished" with the elapsed time when ended or destroyed.
 *
 * A span ended through `fail` logs a warning with the reason instead, regardless of the debug level.
 */
class logging_span_holder
{
public:
    logging_span_holder(const log_channel& channel, std::string message);

    logging_span_holder(const logging_span_holder&) = delete;
    logging_span_holder& operator=(const logging_span_holder&) = delete;
    logging_span_holder(logging_span_holder&&) = delete;
    logging_span_holder& operator=(logging_span_holder&&) = delete;

    ~logging_span_holder()
    {
        end();
    }

    void end();

    void fail(std::string_view reason);

    std::chrono::microseconds elapsed() const;

private:
    const log_channel& channel_;
    const std::string message_;
    const std::chrono::steady_clock::time_point start_;
    bool ended_ = false;
};

} // namespace base
