#pragma once

/**
 * @file log_channel.hpp
 * @brief Named channels every log message is tagged with.
 */

#include <string>
#include <utility>

namespace base {

class log_channel
{
public:
    [[nodiscard]] const std::string& name() const noexcept
    {
        return name_;
    }

    bool operator==(const log_channel& other) const noexcept
    {
        return name_ == other.name_;
    }

    /// Initialization, configuration and anything without a better channel.
    static const log_channel generic;
    /// Registry changes.
    static const log_channel dtype;
    /// Allocation, transfers and host mappings.
    static const log_channel storage;
    /// Borrowed views and imports.
    static const log_channel bridge;

private:
    explicit log_channel(std::string name)
        : name_(std::move(name))
    {
    }

    std::string name_;
};

} // namespace base
