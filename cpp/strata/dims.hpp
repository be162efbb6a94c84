#pragma once

/**
 * @file dims.hpp
 * @brief Definition of the `dims` class.
 */

#include "exceptions.hpp"
#include "small_vector.hpp"

#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>

namespace strata {

using strides_t = small_vector<int64_t>;

/**
 * @brief Shape of an array: one non-negative extent per axis. Rank 0 is a scalar.
 *
 * Dims created with `make_partial` may hold `dynamic_extent` placeholders. Those exist only until the binding boundary
 * where the concrete extents become known, see `bind`. Element counts and strides are only defined for concrete dims.
 */
class dims
{
public:
    using value_type = int64_t;
    using container_type = small_vector<value_type>;

    static constexpr value_type dynamic_extent = -1;

public:
    dims() = default;

    /**
     * @throws invalid_shape if any extent is negative.
     */
    static dims make(std::span<const value_type> extents);

    static dims make(std::initializer_list<value_type> extents)
    {
        return make(std::span<const value_type>(extents.begin(), extents.size()));
    }

    /**
     * @brief Like `make`, but accepts `dynamic_extent` for axes that are bound later.
     */
    static dims make_partial(std::span<const value_type> extents);

    static dims make_partial(std::initializer_list<value_type> extents)
    {
        return make_partial(std::span<const value_type>(extents.begin(), extents.size()));
    }

    std::size_t rank() const noexcept
    {
        return extents_.size();
    }

    bool is_scalar() const noexcept
    {
        return extents_.empty();
    }

    value_type operator[](std::size_t axis) const noexcept
    {
        return extents_[axis];
    }

    /**
     * @throws out_of_bounds
     */
    value_type at(int64_t axis) const;

    std::span<const value_type> extents() const noexcept
    {
        return std::span<const value_type>(extents_.data(), extents_.size());
    }

    auto begin() const noexcept
    {
        return extents_.begin();
    }

    auto end() const noexcept
    {
        return extents_.end();
    }

    bool is_dynamic() const noexcept;

    /**
     * @brief Replaces the dynamic axes with the extents of @p concrete.
     * @throws shape_mismatch if the ranks differ or a concrete axis disagrees.
     */
    dims bind(const dims& concrete) const;

    /**
     * @brief Product of the extents: 0 if any extent is 0, 1 for scalars.
     * @throws invalid_shape for dynamic dims.
     */
    int64_t element_count() const;

    /**
     * @brief Row-major byte strides for elements of @p element_size bytes, the last axis varying fastest.
     */
    strides_t default_strides(int64_t element_size) const;

    /**
     * @brief True if @p strides are exactly the default strides.
     */
    bool is_contiguous(std::span<const int64_t> strides, int64_t element_size) const;

    /**
     * @brief Returns dims with @p new_extents after checking the element count is preserved.
     * @throws invalid_shape, shape_mismatch
     */
    dims reshaped(std::span<const value_type> new_extents) const;

    std::string to_string() const;

    bool operator==(const dims& other) const noexcept
    {
        return extents_ == other.extents_;
    }

private:
    explicit dims(container_type extents)
        : extents_(std::move(extents))
    {
    }

    void check_concrete(const char* operation) const;

private:
    container_type extents_;
};

} // namespace strata

template <>
struct fmt::formatter<strata::dims> : fmt::formatter<std::string>
{
    template <typename FormatContext>
    auto format(const strata::dims& d, FormatContext& ctx) const
    {
        return fmt::formatter<std::string>::format(d.to_string(), ctx);
    }
};
