#pragma once

/**
 * @file array.hpp
 * @brief Definition of the `array` class.
 */

#include "config.hpp"
#include "dims.hpp"
#include "dtype.hpp"
#include "storage.hpp"

#include <base/span_cast.hpp>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace strata {

/**
 * @brief Half-open range [start, stop) of indices along one axis.
 */
struct axis_range
{
    int64_t start = 0;
    int64_t stop = 0;
};

/**
 * @brief Typed, shaped window over a storage.
 *
 * An array is a small value: copying it copies the metadata and shares the storage. Element `(i0, ..., in)` lives at
 * byte `byte_offset() + sum(ik * strides()[k])` of the storage. `view`, `reshape`, `transpose` and `cast_view` never
 * touch bytes, `clone` always copies them into a new storage.
 *
 * Arrays of packed dtypes (sub-byte and block quantized types) are always dense and have no strides. They support
 * `reshape`, `cast_view`, `clone` and the byte level I/O, but not per-element addressing.
 */
class array
{
public:
    /**
     * @brief Wraps @p s without checks. Use the factory functions unless the layout is already validated.
     */
    array(strata::dtype dtype,
          strata::dims dims,
          std::shared_ptr<strata::storage> s,
          uint64_t byte_offset,
          strides_t strides) noexcept
        : dtype_(dtype)
        , dims_(std::move(dims))
        , storage_(std::move(s))
        , byte_offset_(byte_offset)
        , strides_(std::move(strides))
    {
    }

    /**
     * @brief Allocates a dense array from @p resource.
     * @throws invalid_shape, invalid_packing, allocation_failed
     */
    static array allocate(std::shared_ptr<memory_resource> resource,
                          const strata::dtype& dtype,
                          const strata::dims& dims,
                          enum residency r);

    static array for_host(std::shared_ptr<memory_resource> resource, const strata::dtype& dtype, const strata::dims& dims)
    {
        return allocate(std::move(resource), dtype, dims, strata::residency::host);
    }

    static array
    for_device(std::shared_ptr<memory_resource> resource, const strata::dtype& dtype, const strata::dims& dims)
    {
        return allocate(std::move(resource), dtype, dims, strata::residency::device);
    }

    /**
     * @brief Dense array over existing storage, starting at @p byte_offset.
     * @throws out_of_bounds if the array does not fit into the storage.
     */
    static array for_storage(std::shared_ptr<strata::storage> s,
                             const strata::dtype& dtype,
                             const strata::dims& dims,
                             uint64_t byte_offset = 0);

    /**
     * @brief Strided array over existing storage. Strides are in bytes and must not be negative.
     * @throws out_of_bounds, invalid_shape, invalid_packing
     */
    static array for_storage(std::shared_ptr<strata::storage> s,
                             const strata::dtype& dtype,
                             const strata::dims& dims,
                             uint64_t byte_offset,
                             strides_t strides);

public:
    const strata::dtype& dtype() const noexcept
    {
        return dtype_;
    }

    const strata::dims& dims() const noexcept
    {
        return dims_;
    }

    std::size_t rank() const noexcept
    {
        return dims_.rank();
    }

    uint64_t byte_offset() const noexcept
    {
        return byte_offset_;
    }

    /// Byte strides, one per axis. Empty for packed dtypes.
    const strides_t& strides() const noexcept
    {
        return strides_;
    }

    const std::shared_ptr<strata::storage>& storage() const noexcept
    {
        return storage_;
    }

    enum residency residency() const
    {
        return storage_->residency();
    }

    int64_t element_count() const
    {
        return dims_.element_count();
    }

    /// Bytes occupied by the elements when stored densely.
    uint64_t byte_size() const
    {
        return dtype_.dense_byte_count(element_count());
    }

    bool is_contiguous() const;

    /**
     * @brief Sub-array selecting @p ranges, one per leading axis. Trailing axes without a range are kept whole.
     * @throws out_of_bounds, invalid_packing
     */
    array view(std::span<const axis_range> ranges) const;

    array view(std::initializer_list<axis_range> ranges) const
    {
        return view(std::span<const axis_range>(ranges.begin(), ranges.size()));
    }

    /**
     * @throws not_contiguous, shape_mismatch, invalid_shape
     */
    array reshape(std::span<const int64_t> new_extents) const;

    array reshape(std::initializer_list<int64_t> new_extents) const
    {
        return reshape(std::span<const int64_t>(new_extents.begin(), new_extents.size()));
    }

    /**
     * @brief Axis `i` of the result is axis `permutation[i]` of this array.
     * @throws invalid_permutation, invalid_packing
     */
    array transpose(std::span<const int64_t> permutation) const;

    array transpose(std::initializer_list<int64_t> permutation) const
    {
        return transpose(std::span<const int64_t>(permutation.begin(), permutation.size()));
    }

    /// Reverses the axes.
    array transpose() const;

    /**
     * @brief Reinterprets the bytes as elements of @p to.
     *
     * Same width types keep the layout. Otherwise the array must be contiguous and the bytes of its innermost axis
     * must split into whole groups of @p to, which determines the new innermost extent.
     * @throws incompatible_cast
     */
    array cast_view(const strata::dtype& to) const;

    /**
     * @brief Dense copy into new storage of the same residency class and memory resource.
     */
    array clone() const;

    /**
     * @brief Dense copy into new storage resident on @p target. The source is not transferred.
     */
    array clone_to(enum residency target) const;

    /**
     * @brief Transfers the underlying storage, see `storage::transfer_to`. Affects every array sharing it.
     */
    array& transfer_to(enum residency target, transfer_mode mode = transfer_mode::move);

    /**
     * @brief Scatters @p bytes, given in dense row-major order, into the array elements.
     * @throws wrong_residency if the storage is not host accessible. Nothing is written in that case.
     * @throws shape_mismatch if the byte count differs from `byte_size()`.
     */
    void write_bytes(std::span<const uint8_t> bytes);

    /**
     * @brief Gathers the array elements in dense row-major order into @p out.
     * @throws wrong_residency, shape_mismatch
     */
    void read_bytes(std::span<uint8_t> out) const;

    std::vector<uint8_t> read_bytes() const
    {
        std::vector<uint8_t> out(byte_size());
        read_bytes(out);
        return out;
    }

    template <typename T>
    void write(std::span<const T> values)
    {
        check_element_type<T>("write");
        if (static_cast<int64_t>(values.size()) != element_count()) {
            throw shape_mismatch(fmt::format("Writing {} values into array of dims {}.", values.size(), dims_));
        }
        write_bytes(base::byte_span(values));
    }

    template <typename T>
    void write(std::initializer_list<T> values)
    {
        write(std::span<const T>(values.begin(), values.size()));
    }

    template <typename T>
    std::vector<T> read() const
    {
        check_element_type<T>("read");
        if constexpr (std::is_same_v<T, bool>) {
            auto bytes = read_bytes();
            return std::vector<bool>(bytes.begin(), bytes.end());
        } else {
            std::vector<T> out(element_count());
            read_bytes(base::writable_byte_span(std::span<T>(out)));
            return out;
        }
    }

    /**
     * @brief Single element at @p index, one index per axis.
     * @throws out_of_bounds, incompatible_cast, wrong_residency
     */
    template <typename T>
    T item(std::initializer_list<int64_t> index) const
    {
        check_element_type<T>("item");
        T value;
        storage_->read_bytes(element_offset(std::span<const int64_t>(index.begin(), index.size())),
                             base::writable_byte_span(std::span<T>(&value, 1)));
        return value;
    }

    /**
     * @brief Sets every element to @p value.
     *
     * An array covering its whole storage is filled whatever the residency, otherwise the storage must be host
     * accessible.
     */
    template <typename T>
    void fill(T value)
    {
        check_element_type<T>("fill");
        fill_bytes(base::byte_span(std::span<const T>(&value, 1)));
    }

    std::string to_string() const;

    /**
     * @brief Nested bracket rendering of at most @p max_elements elements.
     * @throws wrong_residency
     */
    std::string contents_to_string(std::size_t max_elements = current_config().contents_max_elements) const;

private:
    template <typename T>
    void check_element_type(std::string_view operation) const
    {
        if (!is_storage_compatible<T>(dtype_)) {
            throw incompatible_cast(dtype_of_v<T>.name(),
                                    dtype_.name(),
                                    fmt::format("element type of '{}' does not match", operation));
        }
    }

    uint64_t element_offset(std::span<const int64_t> index) const;

    void fill_bytes(std::span<const uint8_t> pattern);

    void check_host_access(std::string_view operation) const;

private:
    strata::dtype dtype_;
    strata::dims dims_;
    std::shared_ptr<strata::storage> storage_;
    uint64_t byte_offset_ = 0;
    strides_t strides_;
};

} // namespace strata

template <>
struct fmt::formatter<strata::array> : fmt::formatter<std::string>
{
    template <typename FormatContext>
    auto format(const strata::array& a, FormatContext& ctx) const
    {
        return fmt::formatter<std::string>::format(a.to_string(), ctx);
    }
};
