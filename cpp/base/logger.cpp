#include "logger.hpp"
#include "logger_adapter.hpp"

namespace base {

void logger::log(log_level level, const std::string& channel, const std::string& message) const
{
    if (!enabled(level)) {
        return;
    }
    std::lock_guard lock(mutex_);
    for (const auto& adapter : adapters_) {
        adapter->log(level, channel, message);
    }
}

void logger::log(log_level level, const std::string& channel, const std::string& message,
                 const std::map<std::string, std::string, std::less<>>& params) const
{
    if (!enabled(level)) {
        return;
    }
    if (params.empty()) {
        log(level, channel, message);
        return;
    }
    std::string full = message + " {";
    bool first = true;
    for (const auto& [key, value] : params) {
        full += fmt::format("{}{}={}", first ? "" : ", ", key, value);
        first = false;
    }
    full += "}";
    log(level, channel, full);
}

void logger::log(log_level level, const std::string& channel, const std::string& message,
                 const fmt::format_args& args) const
{
    if (!enabled(level)) {
        return;
    }
    log(level, channel, fmt::vformat(message, args));
}

void logger::add(std::shared_ptr<logger_adapter> adapter)
{
    ASSERT(adapter != nullptr);
    std::lock_guard lock(mutex_);
    adapters_.push_back(std::move(adapter));
}

void logger::remove(const std::string& id)
{
    std::lock_guard lock(mutex_);
    std::erase_if(adapters_, [&id](const auto& adapter) {
        return adapter->name() == id;
    });
}

void logger::clear()
{
    std::lock_guard lock(mutex_);
    adapters_.clear();
}

bool logger::empty() const
{
    std::lock_guard lock(mutex_);
    return adapters_.empty();
}

} // namespace base
