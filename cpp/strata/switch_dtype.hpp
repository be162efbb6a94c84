#pragma once

/**
 * @file switch_dtype.hpp
 * @brief Dispatch from a runtime `dtype` to the C++ element type.
 */

#include "dtype.hpp"

namespace strata {

/**
 * @brief Calls `f.template operator()<T>()` with the C++ type of @p d elements.
 *
 * Signless integers map to the signed C++ type of the same width.
 * @throws incompatible_cast for packed, opaque and block dtypes.
 */
template <typename F>
auto switch_dtype(const dtype& d, F f)
{
    switch (d.kind()) {
    case dtype_kind::boolean:
        return f.template operator()<bool>();
    case dtype_kind::signless_integer:
    case dtype_kind::signed_integer:
        switch (d.bit_count()) {
        case 8:
            return f.template operator()<int8_t>();
        case 16:
            return f.template operator()<int16_t>();
        case 32:
            return f.template operator()<int32_t>();
        case 64:
            return f.template operator()<int64_t>();
        default:
            break;
        }
        break;
    case dtype_kind::unsigned_integer:
        switch (d.bit_count()) {
        case 8:
            return f.template operator()<uint8_t>();
        case 16:
            return f.template operator()<uint16_t>();
        case 32:
            return f.template operator()<uint32_t>();
        case 64:
            return f.template operator()<uint64_t>();
        default:
            break;
        }
        break;
    case dtype_kind::floating:
        if (d == dtypes::float16) {
            return f.template operator()<Eigen::half>();
        }
        if (d == dtypes::bfloat16) {
            return f.template operator()<Eigen::bfloat16>();
        }
        if (d == dtypes::float32) {
            return f.template operator()<float>();
        }
        if (d == dtypes::float64) {
            return f.template operator()<double>();
        }
        break;
    case dtype_kind::complex:
        if (d == dtypes::complex64) {
            return f.template operator()<std::complex<float>>();
        }
        if (d == dtypes::complex128) {
            return f.template operator()<std::complex<double>>();
        }
        break;
    case dtype_kind::opaque:
    case dtype_kind::block_quantized:
        break;
    }
    throw incompatible_cast(d.name(), "C++ element type", "no native element type");
}

/**
 * @brief True if `switch_dtype` can dispatch @p d.
 */
inline bool has_native_type(const dtype& d) noexcept
{
    if (d.is_packed()) {
        return false;
    }
    switch (d.kind()) {
    case dtype_kind::boolean:
    case dtype_kind::signless_integer:
    case dtype_kind::signed_integer:
    case dtype_kind::unsigned_integer:
        return true;
    case dtype_kind::floating:
        return d == dtypes::float16 || d == dtypes::bfloat16 || d == dtypes::float32 || d == dtypes::float64;
    case dtype_kind::complex:
        return d == dtypes::complex64 || d == dtypes::complex128;
    case dtype_kind::opaque:
    case dtype_kind::block_quantized:
        return false;
    }
    return false;
}

} // namespace strata
