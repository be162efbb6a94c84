#pragma once

#include "logger.hpp"

#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace base {

class logger_adapter
{
public:
    virtual ~logger_adapter() = default;

    [[nodiscard]] virtual const std::string name() const = 0;
    virtual void log(log_level level, const std::string& channel, const std::string& message) = 0;
};

/**
 * @brief Adapter forwarding every message to a spdlog logger writing to stderr.
 *
 * Level filtering is done by `base::logger`, the spdlog logger accepts every level.
 */
class spdlog_logger_adapter : public logger_adapter
{
public:
    spdlog_logger_adapter();

    [[nodiscard]] const std::string name() const override
    {
        return "spdlog";
    }

    void log(log_level level, const std::string& channel, const std::string& message) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace base
