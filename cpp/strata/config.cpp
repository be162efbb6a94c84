#include "config.hpp"

#include <base/base.hpp>
#include <base/getenv.hpp>

#include <bit>
#include <string>

namespace strata {

config config::from_env()
{
    config c;
    auto level = base::getenv<std::string>("STRATA_LOG_LEVEL");
    if (!level.empty() && !base::str_to_log_level(level, c.log_level)) {
        throw base::invalid_environment_value("STRATA_LOG_LEVEL", level);
    }
    c.host_alignment = base::getenv<uint64_t>("STRATA_HOST_ALIGNMENT", c.host_alignment);
    if (c.host_alignment == 0 || !std::has_single_bit(c.host_alignment)) {
        throw base::invalid_environment_value("STRATA_HOST_ALIGNMENT", std::to_string(c.host_alignment));
    }
    c.host_memory_limit = base::getenv<uint64_t>("STRATA_HOST_MEMORY_LIMIT", c.host_memory_limit);
    c.contents_max_elements = base::getenv<std::size_t>("STRATA_CONTENTS_MAX_ELEMENTS", c.contents_max_elements);
    return c;
}

void config::apply() const
{
    base::get_logger().set_level(log_level);
    base::log_debug(base::log_channel::generic,
                    "Configuration applied: host_alignment={}, host_memory_limit={}, contents_max_elements={}",
                    host_alignment,
                    host_memory_limit,
                    contents_max_elements);
}

} // namespace strata
