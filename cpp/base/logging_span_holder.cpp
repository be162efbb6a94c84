#include "logging_span_holder.hpp"
#include "base.hpp"

#include <utility>

namespace base {

logging_span_holder::logging_span_holder(const log_channel& channel, std::string message)
    : channel_(channel)
    , message_(std::move(message))
    , start_(std::chrono::steady_clock::now())
{
    log_debug(channel_, "Started: {}", message_);
}

void logging_span_holder::end()
{
    if (std::exchange(ended_, true)) {
        return;
    }
    log_debug(channel_, "Finished: {} ({} us)", message_, elapsed().count());
}

void logging_span_holder::fail(std::string_view reason)
{
    if (std::exchange(ended_, true)) {
        return;
    }
    log_warning(channel_, "Failed: {} ({} us): {}", message_, elapsed().count(), reason);
}

std::chrono::microseconds logging_span_holder::elapsed() const
{
    return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);
}

} // namespace base
