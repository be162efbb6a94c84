#pragma once

/**
 * @file small_vector.hpp
 * @brief Definition of small_vector template.
 */

#include <boost/container/small_vector.hpp>

#include <cstddef>

namespace strata {

/// Most arrays have at most 6 axes; shapes and strides up to that rank stay inline.
template <typename T, std::size_t N = 6>
using small_vector = boost::container::small_vector<T, N>;

} // namespace strata
