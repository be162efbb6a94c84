#pragma once

/**
 * @defgroup strata
 * @{
 * @brief Typed n-dimensional arrays over host and device storage, with Eigen interop.
 *
 * @}
 */

#include "array.hpp"
#include "bridge.hpp"
#include "config.hpp"
#include "dims.hpp"
#include "dtype.hpp"
#include "memory_resource.hpp"
#include "storage.hpp"

#include <memory>

namespace strata {

/**
 * @brief Applies @p c and replaces the default host memory resource with one built from it.
 *
 * Arrays allocated from the previous default resource stay valid, they keep their resource alive.
 */
void initialize(const config& c = config::from_env());

void deinitialize();

/**
 * @brief Host resource built from the configuration of the last `initialize` call, or from defaults.
 */
std::shared_ptr<host_memory_resource> default_host_resource();

} // namespace strata
