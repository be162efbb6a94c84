#include "strata.hpp"

#include <base/base.hpp>

#include <mutex>

namespace strata {

namespace {

struct state
{
    std::mutex mutex;
    config cfg;
    std::shared_ptr<host_memory_resource> host_resource;
};

state& get_state()
{
    static state s;
    return s;
}

} // namespace

void initialize(const config& c)
{
    c.apply();
    auto& s = get_state();
    std::lock_guard lock(s.mutex);
    s.cfg = c;
    s.host_resource = std::make_shared<host_memory_resource>(c);
    base::log_info(base::log_channel::generic, "strata initialized, host alignment {}", c.host_alignment);
}

void deinitialize()
{
    auto& s = get_state();
    std::lock_guard lock(s.mutex);
    s.cfg = config();
    s.host_resource.reset();
    base::get_logger().set_level(s.cfg.log_level);
}

std::shared_ptr<host_memory_resource> default_host_resource()
{
    auto& s = get_state();
    std::lock_guard lock(s.mutex);
    if (s.host_resource == nullptr) {
        s.host_resource = std::make_shared<host_memory_resource>(s.cfg);
    }
    return s.host_resource;
}

config current_config()
{
    auto& s = get_state();
    std::lock_guard lock(s.mutex);
    return s.cfg;
}

} // namespace strata
