#pragma once

/**
 * @file dtype.hpp
 * @brief Definition of the `dtype` class, the built-in dtypes and the `dtype_registry`.
 */

#include "exceptions.hpp"

#include <Eigen/Core>

#include <complex>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>

namespace strata {

enum class dtype_kind : uint8_t
{
    boolean,
    signless_integer,
    signed_integer,
    unsigned_integer,
    floating,
    complex,
    opaque,
    block_quantized
};

std::string_view dtype_kind_to_str(dtype_kind k);

/**
 * @brief Immutable description of an element type.
 *
 * Elements are stored in groups: a group of `group_size()` elements occupies `bit_count()` bits. Every type except
 * the block quantized ones has a group size of 1, so `bit_count()` is the element width. Types whose width is not a
 * whole number of bytes, and block types, are packed: they have no per-element byte address.
 *
 * Two dtypes are equal when their names are equal.
 */
class dtype
{
public:
    constexpr dtype(std::string_view name, dtype_kind kind, uint32_t bit_count, uint32_t group_size = 1) noexcept
        : name_(name)
        , kind_(kind)
        , bit_count_(bit_count)
        , group_size_(group_size)
    {
    }

    constexpr std::string_view name() const noexcept
    {
        return name_;
    }

    constexpr dtype_kind kind() const noexcept
    {
        return kind_;
    }

    constexpr uint32_t bit_count() const noexcept
    {
        return bit_count_;
    }

    constexpr uint32_t group_size() const noexcept
    {
        return group_size_;
    }

    constexpr bool is_boolean() const noexcept
    {
        return kind_ == dtype_kind::boolean;
    }

    constexpr bool is_integer() const noexcept
    {
        return kind_ == dtype_kind::signless_integer || kind_ == dtype_kind::signed_integer ||
               kind_ == dtype_kind::unsigned_integer;
    }

    constexpr bool is_integer_bitwidth(uint32_t bits) const noexcept
    {
        return is_integer() && bit_count_ == bits;
    }

    constexpr bool is_signed() const noexcept
    {
        return kind_ == dtype_kind::signed_integer;
    }

    constexpr bool is_float() const noexcept
    {
        return kind_ == dtype_kind::floating;
    }

    constexpr bool is_complex() const noexcept
    {
        return kind_ == dtype_kind::complex;
    }

    constexpr bool is_opaque() const noexcept
    {
        return kind_ == dtype_kind::opaque;
    }

    constexpr bool is_block() const noexcept
    {
        return group_size_ > 1;
    }

    constexpr bool is_packed() const noexcept
    {
        return is_block() || bit_count_ % 8 != 0;
    }

    constexpr bool is_byte_addressable() const noexcept
    {
        return !is_packed();
    }

    /**
     * @brief Size of one element in bytes.
     * @throws invalid_packing for packed dtypes.
     */
    int64_t element_size() const
    {
        if (is_packed()) {
            throw invalid_packing(fmt::format("Dtype {} is packed and has no per-element byte size.", name_));
        }
        return bit_count_ / 8;
    }

    /**
     * @brief Exact number of bytes needed to store @p count dense elements.
     *
     * Sub-byte types round up to whole bytes. Block types require @p count to be a multiple of the group size.
     * @throws invalid_packing, invalid_shape
     */
    uint64_t dense_byte_count(int64_t count) const;

    std::string to_string() const
    {
        return std::string(name_);
    }

    constexpr bool operator==(const dtype& other) const noexcept
    {
        return name_ == other.name_;
    }

private:
    std::string_view name_;
    dtype_kind kind_;
    uint32_t bit_count_;
    uint32_t group_size_;
};

/**
 * @brief Storage footprint of @p count elements of @p d, see `dtype::dense_byte_count`.
 */
inline uint64_t size_in_bytes(const dtype& d, int64_t count)
{
    return d.dense_byte_count(count);
}

namespace dtypes {

#define STRATA_DTYPE(id, kind, bits, group) inline constexpr dtype id{#id, dtype_kind::kind, bits, group};
#include "dtypes.inl"
#undef STRATA_DTYPE

} // namespace dtypes

//////////////
/// dtype_of
//////////////
template <typename T>
struct dtype_of;

template <>
struct dtype_of<bool>
{
    static constexpr const dtype& value = dtypes::bool8;
};

template <>
struct dtype_of<int8_t>
{
    static constexpr const dtype& value = dtypes::sint8;
};

template <>
struct dtype_of<uint8_t>
{
    static constexpr const dtype& value = dtypes::uint8;
};

template <>
struct dtype_of<int16_t>
{
    static constexpr const dtype& value = dtypes::sint16;
};

template <>
struct dtype_of<uint16_t>
{
    static constexpr const dtype& value = dtypes::uint16;
};

template <>
struct dtype_of<int32_t>
{
    static constexpr const dtype& value = dtypes::sint32;
};

template <>
struct dtype_of<uint32_t>
{
    static constexpr const dtype& value = dtypes::uint32;
};

template <>
struct dtype_of<int64_t>
{
    static constexpr const dtype& value = dtypes::sint64;
};

template <>
struct dtype_of<uint64_t>
{
    static constexpr const dtype& value = dtypes::uint64;
};

template <>
struct dtype_of<Eigen::half>
{
    static constexpr const dtype& value = dtypes::float16;
};

template <>
struct dtype_of<Eigen::bfloat16>
{
    static constexpr const dtype& value = dtypes::bfloat16;
};

template <>
struct dtype_of<float>
{
    static constexpr const dtype& value = dtypes::float32;
};

template <>
struct dtype_of<double>
{
    static constexpr const dtype& value = dtypes::float64;
};

template <>
struct dtype_of<std::complex<float>>
{
    static constexpr const dtype& value = dtypes::complex64;
};

template <>
struct dtype_of<std::complex<double>>
{
    static constexpr const dtype& value = dtypes::complex128;
};

template <typename T>
constexpr const dtype& dtype_of_v = dtype_of<std::remove_cvref_t<T>>::value;

/**
 * @brief True if values of `T` can be stored in, or read from, elements of @p d without conversion.
 *
 * Signless integers and opaque types accept any C++ type of the same width.
 */
template <typename T>
bool is_storage_compatible(const dtype& d) noexcept
{
    if (d == dtype_of_v<T>) {
        return true;
    }
    if (d.is_packed() || d.bit_count() != sizeof(T) * 8) {
        return false;
    }
    if (d.kind() == dtype_kind::opaque) {
        return true;
    }
    return d.kind() == dtype_kind::signless_integer && std::is_integral_v<T> && !std::is_same_v<T, bool>;
}

/**
 * @brief Append-only table of the dtypes known to a process.
 *
 * Built once during start-up, usually with `create_default()`, then passed by reference to the code which resolves
 * dtype names. Registration is not synchronized and must not run concurrently with lookups.
 */
class dtype_registry
{
public:
    dtype_registry() = default;

    dtype_registry(const dtype_registry&) = delete;
    dtype_registry& operator=(const dtype_registry&) = delete;
    dtype_registry(dtype_registry&&) noexcept = default;
    dtype_registry& operator=(dtype_registry&&) noexcept = default;

    /**
     * @brief Returns a registry holding every built-in dtype.
     */
    static dtype_registry create_default();

    /**
     * @brief Adds @p d to the registry. The name is copied into a process wide table, so @p d may refer to temporary
     * storage and copies of the returned dtype stay valid after the registry is destroyed.
     * @return The registered entry, valid for the lifetime of the registry.
     * @throws invalid_operation if the name is already registered.
     */
    const dtype& register_dtype(const dtype& d);

    /**
     * @throws unknown_dtype
     */
    const dtype& lookup(std::string_view name) const;

    bool contains(std::string_view name) const;

    std::size_t size() const noexcept
    {
        return entries_.size();
    }

    auto begin() const noexcept
    {
        return entries_.begin();
    }

    auto end() const noexcept
    {
        return entries_.end();
    }

private:
    std::deque<dtype> entries_;
    std::unordered_map<std::string_view, const dtype*> index_;
};

} // namespace strata

template <>
struct fmt::formatter<strata::dtype> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(const strata::dtype& d, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(d.name(), ctx);
    }
};
