#pragma once

#include "assert.hpp"

#include <cstdint>
#include <span>
#include <type_traits>

namespace base {

/**
 * @brief Reinterprets the span elements as `To`. The byte size of the source must be a multiple of `sizeof(To)`.
 */
template <typename To, typename From>
requires(sizeof(To) % sizeof(From) == 0 || sizeof(From) % sizeof(To) == 0)
inline std::span<To> span_cast(std::span<From> source)
{
    ASSERT(source.size_bytes() % sizeof(To) == 0);
    auto s = source.size() * sizeof(From) / sizeof(To);
    return std::span<To>(reinterpret_cast<To*>(source.data()), s);
}

template <typename T>
requires std::is_trivially_copyable_v<T>
inline std::span<const uint8_t> byte_span(std::span<const T> source)
{
    return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(source.data()), source.size_bytes());
}

template <typename T>
requires(std::is_trivially_copyable_v<T> && !std::is_const_v<T>)
inline std::span<uint8_t> writable_byte_span(std::span<T> source)
{
    return std::span<uint8_t>(reinterpret_cast<uint8_t*>(source.data()), source.size_bytes());
}

} // namespace base
