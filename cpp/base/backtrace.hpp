#pragma once

#include <string>

namespace base {

/**
 * @brief Returns the current call stack, one frame per line.
 */
std::string backtrace();

} // namespace base
