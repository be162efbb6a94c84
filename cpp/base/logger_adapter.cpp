#include "logger_adapter.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace base {

namespace {

spdlog::level::level_enum to_spdlog_level(log_level level)
{
    switch (level) {
    case log_level::debug:
        return spdlog::level::debug;
    case log_level::info:
        return spdlog::level::info;
    case log_level::warning:
        return spdlog::level::warn;
    case log_level::error:
        return spdlog::level::err;
    }
    return spdlog::level::err;
}

} // namespace

spdlog_logger_adapter::spdlog_logger_adapter()
    : logger_(std::make_shared<spdlog::logger>("strata", std::make_shared<spdlog::sinks::stderr_color_sink_mt>()))
{
    logger_->set_level(spdlog::level::trace);
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
}

void spdlog_logger_adapter::log(log_level level, const std::string& channel, const std::string& message)
{
    logger_->log(to_spdlog_level(level), "[{}] {}", channel, message);
}

} // namespace base
