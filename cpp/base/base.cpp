#include "base.hpp"
#include "assert.hpp"
#include "backtrace.hpp"

#include <cstdlib>

namespace base {

namespace {

struct state
{
    logger log;
    bool initialized = false;

    state()
    {
        log.add(std::make_shared<spdlog_logger_adapter>());
    }
};

state& get_state()
{
    static state s;
    return s;
}

} // namespace

void initialize(std::shared_ptr<logger_adapter> adapter, log_level level)
{
    auto& s = get_state();
    s.log.clear();
    s.log.add(std::move(adapter));
    s.log.set_level(level);
    s.initialized = true;
}

void deinitialize()
{
    auto& s = get_state();
    s.log.clear();
    s.log.add(std::make_shared<spdlog_logger_adapter>());
    s.log.set_level(log_level::warning);
    s.initialized = false;
}

bool is_initialized()
{
    return get_state().initialized;
}

logger& get_logger()
{
    return get_state().log;
}

std::unique_ptr<logging_span_holder> log_span(const log_channel& channel, const std::string& message)
{
    return std::make_unique<logging_span_holder>(channel, message);
}

void log_exception(log_level level, const log_channel& channel, std::string_view context, const exception& e)
{
    get_logger().log(level, channel.name(), fmt::format("{}: {}", context, e.what()), e.params());
}

#ifdef STRATA_ASSERTIONS
void assertion_failed(const char* expression, const std::string& message, const char* file, int line)
{
    get_logger().log(log_level::error,
                     log_channel::generic.name(),
                     fmt::format("Assertion failed: {}\nMessage: {}\nFile: {}:{}\nBacktrace:\n{}",
                                 expression,
                                 message,
                                 file,
                                 line,
                                 backtrace()));
    std::abort();
}
#endif

} // namespace base
