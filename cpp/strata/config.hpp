#pragma once

/**
 * @file config.hpp
 * @brief Definition of the `config` struct.
 */

#include <base/logger.hpp>

#include <cstddef>
#include <cstdint>

namespace strata {

/**
 * @brief Library wide settings. Defaults are overridden by the `STRATA_*` environment variables in `from_env`.
 */
struct config
{
    /// STRATA_LOG_LEVEL: debug, info, warning or error.
    base::log_level log_level = base::log_level::warning;

    /// STRATA_HOST_ALIGNMENT: alignment of host allocations, a power of two.
    uint64_t host_alignment = 64;

    /// STRATA_HOST_MEMORY_LIMIT: bytes the host memory resource may hand out, 0 for no limit.
    uint64_t host_memory_limit = 0;

    /// STRATA_CONTENTS_MAX_ELEMENTS: elements printed by `array::contents_to_string`.
    std::size_t contents_max_elements = 64;

    /**
     * @throws base::invalid_environment_value
     */
    static config from_env();

    /**
     * @brief Applies the process wide parts of the configuration (log level).
     */
    void apply() const;
};

/**
 * @brief Configuration of the last `initialize` call, or the defaults.
 */
config current_config();

} // namespace strata
