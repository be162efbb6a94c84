#pragma once

/**
 * @file assert.hpp
 * @brief Internal invariant checks, compiled in only with STRATA_ASSERTIONS.
 */

#ifdef STRATA_ASSERTIONS

#include <string>

namespace base {

/**
 * @brief Logs the failed check with a backtrace and aborts.
 */
[[noreturn]] void assertion_failed(const char* expression, const std::string& message, const char* file, int line);

} // namespace base

#define ASSERT_MESSAGE(expression, message)                                                                            \
    do {                                                                                                               \
        if (!(expression)) {                                                                                           \
            ::base::assertion_failed(#expression, (message), __FILE__, __LINE__);                                      \
        }                                                                                                              \
    } while (false)

#else // STRATA_ASSERTIONS

#define ASSERT_MESSAGE(expression, message) ((void)0)

#endif // STRATA_ASSERTIONS

#define ASSERT(expression) ASSERT_MESSAGE((expression), #expression)
