#pragma once

/**
 * @file bridge.hpp
 * @brief Zero-copy Eigen views over host resident arrays, and import of Eigen data by copy.
 */

#include "array.hpp"

#include <Eigen/Core>
#include <unsupported/Eigen/CXX11/Tensor>

#include <cstdint>
#include <memory>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace strata {

enum class bridge_capability : uint8_t
{
    contiguous_only,
    strided
};

std::string_view bridge_capability_to_str(bridge_capability c);

/// Layouts the bridge can expose. Non-contiguous arrays must be cloned first.
inline constexpr bridge_capability bridge_capabilities = bridge_capability::contiguous_only;

template <typename T>
using row_major_matrix = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

template <typename T, int Rank>
using row_major_tensor = Eigen::Tensor<T, Rank, Eigen::RowMajor>;

/**
 * @brief Borrowed host view of a contiguous array.
 *
 * The view holds a host mapping of the array storage: the storage can neither be transferred nor released while the
 * view is alive. Eigen maps obtained from the view must not outlive it.
 */
class external_view
{
public:
    external_view(host_mapping lease, strata::dtype dtype, strata::dims dims, strides_t strides, uint64_t byte_offset);

    external_view(const external_view&) = delete;
    external_view& operator=(const external_view&) = delete;
    external_view(external_view&&) noexcept = default;
    external_view& operator=(external_view&&) noexcept = default;

    const strata::dtype& dtype() const noexcept
    {
        return dtype_;
    }

    const strata::dims& dims() const noexcept
    {
        return dims_;
    }

    /// Byte strides, row-major.
    const strides_t& strides() const noexcept
    {
        return strides_;
    }

    std::span<const uint8_t> bytes() const noexcept
    {
        return lease_.data().subspan(byte_offset_, byte_size_);
    }

    /**
     * @throws invalid_operation if the view is read only.
     */
    std::span<uint8_t> writable_bytes() const
    {
        return lease_.writable_data().subspan(byte_offset_, byte_size_);
    }

    bool is_writable() const noexcept
    {
        return lease_.access() != access_mode::read;
    }

    bool is_valid() const noexcept
    {
        return static_cast<bool>(lease_);
    }

    /**
     * @brief Ends the borrow. Eigen maps obtained from the view become dangling.
     */
    void release()
    {
        lease_.release();
    }

    /**
     * @throws incompatible_cast, shape_mismatch, invalid_operation
     */
    template <typename T, int Rank>
    Eigen::TensorMap<row_major_tensor<T, Rank>> tensor() const
    {
        check_layout<T>(Rank);
        auto* data = reinterpret_cast<T*>(writable_bytes().data());
        return Eigen::TensorMap<row_major_tensor<T, Rank>>(data, eigen_dimensions<Rank>());
    }

    template <typename T, int Rank>
    Eigen::TensorMap<const row_major_tensor<T, Rank>> const_tensor() const
    {
        check_layout<T>(Rank);
        const auto* data = reinterpret_cast<const T*>(bytes().data());
        return Eigen::TensorMap<const row_major_tensor<T, Rank>>(data, eigen_dimensions<Rank>());
    }

    /**
     * @brief Rank 1 arrays map to a single row.
     * @throws incompatible_cast, shape_mismatch, invalid_operation
     */
    template <typename T>
    Eigen::Map<row_major_matrix<T>> matrix() const
    {
        auto [rows, cols] = matrix_extents<T>();
        return Eigen::Map<row_major_matrix<T>>(reinterpret_cast<T*>(writable_bytes().data()), rows, cols);
    }

    template <typename T>
    Eigen::Map<const row_major_matrix<T>> const_matrix() const
    {
        auto [rows, cols] = matrix_extents<T>();
        return Eigen::Map<const row_major_matrix<T>>(reinterpret_cast<const T*>(bytes().data()), rows, cols);
    }

private:
    template <typename T>
    void check_layout(std::size_t rank) const
    {
        if (!is_storage_compatible<T>(dtype_)) {
            throw incompatible_cast(dtype_.name(), dtype_of_v<T>.name(), "Eigen scalar type does not match");
        }
        if (rank != dims_.rank()) {
            throw shape_mismatch(fmt::format("Rank {} Eigen map requested for dims {}.", rank, dims_));
        }
        if (reinterpret_cast<std::uintptr_t>(bytes().data()) % alignof(T) != 0) {
            throw incompatible_cast(dtype_.name(), dtype_of_v<T>.name(), "data is not aligned for the Eigen scalar type");
        }
    }

    template <typename T>
    std::pair<Eigen::Index, Eigen::Index> matrix_extents() const
    {
        if (dims_.rank() == 1) {
            check_layout<T>(1);
            return {1, dims_[0]};
        }
        check_layout<T>(2);
        return {dims_[0], dims_[1]};
    }

    template <int Rank>
    Eigen::DSizes<Eigen::Index, Rank> eigen_dimensions() const
    {
        Eigen::DSizes<Eigen::Index, Rank> d;
        for (int k = 0; k < Rank; ++k) {
            d[k] = dims_[k];
        }
        return d;
    }

private:
    host_mapping lease_;
    strata::dtype dtype_;
    strata::dims dims_;
    strides_t strides_;
    uint64_t byte_offset_;
    uint64_t byte_size_;
};

/**
 * @brief Borrows the bytes of @p a for use with Eigen.
 * @throws wrong_residency unless the storage is host accessible.
 * @throws not_contiguous for arrays with non-default strides.
 * @throws invalid_packing for packed dtypes.
 * @throws incompatible_cast if the byte offset is not a multiple of the element size.
 */
external_view as_external_view(const array& a, access_mode access = access_mode::read_write);

/**
 * @brief Copies the bytes of @p view into a new host array of @p dtype with the view dims.
 * @throws incompatible_cast if the byte sizes differ.
 */
array from_external_view(const external_view& view,
                         const dtype& dtype,
                         std::shared_ptr<memory_resource> resource);

namespace impl {

array from_row_major(const dtype& dtype,
                     std::span<const int64_t> extents,
                     std::span<const uint8_t> bytes,
                     std::shared_ptr<memory_resource> resource);

} // namespace impl

/**
 * @brief Copies a row-major Eigen tensor, tensor map or tensor expression into a new host array.
 */
template <typename Expr>
requires std::is_base_of_v<Eigen::TensorBase<Expr, Eigen::ReadOnlyAccessors>, Expr>
array from_eigen(const Expr& t, std::shared_ptr<memory_resource> resource)
{
    using traits = Eigen::internal::traits<Expr>;
    using scalar = std::remove_const_t<typename traits::Scalar>;
    constexpr int rank = traits::NumDimensions;
    static_assert(static_cast<int>(traits::Layout) == static_cast<int>(Eigen::RowMajor),
                  "Only row-major Eigen tensors can be imported");
    static_assert(!std::is_same_v<scalar, bool>, "Import bool tensors as uint8_t");

    row_major_tensor<scalar, rank> evaluated = t;
    std::vector<int64_t> extents(rank);
    for (int k = 0; k < rank; ++k) {
        extents[k] = evaluated.dimension(k);
    }
    return impl::from_row_major(dtype_of_v<scalar>,
                                extents,
                                base::byte_span(std::span<const scalar>(evaluated.data(), evaluated.size())),
                                std::move(resource));
}

/**
 * @brief Copies an Eigen matrix or matrix expression of any storage order into a new rank 2 host array.
 */
template <typename Derived>
array from_eigen(const Eigen::DenseBase<Derived>& m, std::shared_ptr<memory_resource> resource)
{
    using scalar = typename Derived::Scalar;
    static_assert(!std::is_same_v<scalar, bool>, "Import bool matrices as uint8_t");

    row_major_matrix<scalar> evaluated = m;
    std::vector<int64_t> extents{evaluated.rows(), evaluated.cols()};
    return impl::from_row_major(dtype_of_v<scalar>,
                                extents,
                                base::byte_span(std::span<const scalar>(evaluated.data(), evaluated.size())),
                                std::move(resource));
}

} // namespace strata
