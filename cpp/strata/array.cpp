#include "array.hpp"
#include "switch_dtype.hpp"

#include <base/base.hpp>

#include <algorithm>
#include <numeric>

namespace strata {

namespace {

/**
 * @brief Calls `f(byte_offset, length)` for every run of contiguous bytes of @p a, in row-major element order.
 *
 * Innermost axes laid out densely are coalesced into a single run.
 */
template <typename F>
void for_each_run(const array& a, F f)
{
    if (a.element_count() == 0) {
        return;
    }
    if (a.dtype().is_packed()) {
        f(a.byte_offset(), a.byte_size());
        return;
    }
    const auto& extents = a.dims();
    const auto& strides = a.strides();
    auto run = a.dtype().element_size();
    auto outer = a.rank();
    while (outer > 0) {
        auto k = outer - 1;
        if (extents[k] != 1 && strides[k] != run) {
            break;
        }
        run *= extents[k];
        --outer;
    }

    small_vector<int64_t> index(outer, 0);
    for (;;) {
        auto offset = static_cast<int64_t>(a.byte_offset());
        for (auto k = 0u; k < outer; ++k) {
            offset += index[k] * strides[k];
        }
        f(static_cast<uint64_t>(offset), static_cast<uint64_t>(run));

        auto k = outer;
        for (;;) {
            if (k == 0) {
                return;
            }
            --k;
            if (++index[k] < extents[k]) {
                break;
            }
            index[k] = 0;
        }
    }
}

template <typename T>
std::string format_element(const T& value)
{
    if constexpr (std::is_same_v<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_same_v<T, Eigen::half> || std::is_same_v<T, Eigen::bfloat16>) {
        return fmt::format("{}", static_cast<float>(value));
    } else if constexpr (std::is_same_v<T, std::complex<float>> || std::is_same_v<T, std::complex<double>>) {
        return fmt::format("{}{:+}j", value.real(), value.imag());
    } else {
        return fmt::format("{}", value);
    }
}

/**
 * @brief Renders @p items, the first elements of an array of @p d dims in row-major order, with nested brackets.
 */
std::string render_nested(const dims& d, const std::vector<std::string>& items, int64_t total)
{
    if (d.is_scalar()) {
        return items.empty() ? std::string() : items.front();
    }
    if (total == 0) {
        return "[]";
    }
    std::vector<int64_t> inner(d.rank());
    int64_t p = 1;
    for (auto k = d.rank(); k > 0; --k) {
        p *= d[k - 1];
        inner[k - 1] = p;
    }
    std::string out;
    std::size_t depth = 0;
    for (auto i = 0u; i < items.size(); ++i) {
        auto opens = std::ranges::count_if(inner, [i](auto q) {
            return static_cast<int64_t>(i) % q == 0;
        });
        if (i != 0) {
            out += ", ";
        }
        out.append(opens, '[');
        depth += opens;
        out += items[i];
        auto closes = std::ranges::count_if(inner, [i](auto q) {
            return static_cast<int64_t>(i + 1) % q == 0;
        });
        out.append(closes, ']');
        depth -= closes;
    }
    if (static_cast<int64_t>(items.size()) < total) {
        out += ", ...";
        out.append(depth, ']');
    }
    return out;
}

} // namespace

array array::allocate(std::shared_ptr<memory_resource> resource,
                      const strata::dtype& dtype,
                      const strata::dims& dims,
                      enum residency r)
{
    auto bytes = dtype.dense_byte_count(dims.element_count());
    auto s = storage::allocate(std::move(resource), bytes, r);
    auto strides = dtype.is_packed() ? strides_t() : dims.default_strides(dtype.element_size());
    return array(dtype, dims, std::move(s), 0, std::move(strides));
}

array array::for_storage(std::shared_ptr<strata::storage> s,
                         const strata::dtype& dtype,
                         const strata::dims& dims,
                         uint64_t byte_offset)
{
    auto bytes = dtype.dense_byte_count(dims.element_count());
    if (byte_offset > s->byte_length() || bytes > s->byte_length() - byte_offset) {
        throw out_of_bounds(fmt::format("Array of {} bytes at offset {} exceeds storage of {} bytes.",
                                        bytes,
                                        byte_offset,
                                        s->byte_length()));
    }
    auto strides = dtype.is_packed() ? strides_t() : dims.default_strides(dtype.element_size());
    return array(dtype, dims, std::move(s), byte_offset, std::move(strides));
}

array array::for_storage(std::shared_ptr<strata::storage> s,
                         const strata::dtype& dtype,
                         const strata::dims& dims,
                         uint64_t byte_offset,
                         strides_t strides)
{
    if (dtype.is_packed()) {
        throw invalid_packing(fmt::format("Arrays of packed dtype {} can't have explicit strides.", dtype));
    }
    if (strides.size() != dims.rank()) {
        throw invalid_shape(fmt::format("{} strides given for dims {}.", strides.size(), dims));
    }
    auto end = static_cast<int64_t>(byte_offset);
    if (dims.element_count() != 0) {
        end += dtype.element_size();
        for (auto k = 0u; k < dims.rank(); ++k) {
            if (strides[k] < 0) {
                throw invalid_shape(fmt::format("Stride {} of axis {} is negative.", strides[k], k));
            }
            end += (dims[k] - 1) * strides[k];
        }
    }
    if (static_cast<uint64_t>(end) > s->byte_length()) {
        throw out_of_bounds(fmt::format("Strided array ending at byte {} exceeds storage of {} bytes.",
                                        end,
                                        s->byte_length()));
    }
    return array(dtype, dims, std::move(s), byte_offset, std::move(strides));
}

bool array::is_contiguous() const
{
    if (dtype_.is_packed()) {
        return true;
    }
    return dims_.is_contiguous(std::span<const int64_t>(strides_.data(), strides_.size()), dtype_.element_size());
}

array array::view(std::span<const axis_range> ranges) const
{
    if (dtype_.is_packed()) {
        throw invalid_packing(fmt::format("Views of packed dtype {} are not supported.", dtype_));
    }
    if (ranges.size() > rank()) {
        throw out_of_bounds(fmt::format("{} ranges given for array of rank {}.", ranges.size(), rank()));
    }
    std::vector<int64_t> extents(dims_.begin(), dims_.end());
    auto offset = static_cast<int64_t>(byte_offset_);
    for (auto k = 0u; k < ranges.size(); ++k) {
        const auto& r = ranges[k];
        if (r.start < 0 || r.stop < r.start || r.stop > dims_[k]) {
            throw out_of_bounds(k, r.start, r.stop, dims_[k]);
        }
        extents[k] = r.stop - r.start;
        offset += r.start * strides_[k];
    }
    return array(dtype_, strata::dims::make(extents), storage_, static_cast<uint64_t>(offset), strides_);
}

array array::reshape(std::span<const int64_t> new_extents) const
{
    if (!is_contiguous()) {
        throw not_contiguous("reshape");
    }
    auto d = dims_.reshaped(new_extents);
    auto strides = dtype_.is_packed() ? strides_t() : d.default_strides(dtype_.element_size());
    return array(dtype_, std::move(d), storage_, byte_offset_, std::move(strides));
}

array array::transpose(std::span<const int64_t> permutation) const
{
    if (dtype_.is_packed()) {
        throw invalid_packing(fmt::format("Transpose of packed dtype {} is not supported.", dtype_));
    }
    auto r = static_cast<int64_t>(rank());
    std::vector<bool> seen(rank(), false);
    auto valid = static_cast<int64_t>(permutation.size()) == r;
    for (auto p : permutation) {
        if (!valid) {
            break;
        }
        valid = p >= 0 && p < r && !seen[p];
        if (valid) {
            seen[p] = true;
        }
    }
    if (!valid) {
        throw invalid_permutation(fmt::format("[{}]", fmt::join(permutation, ", ")), r);
    }
    std::vector<int64_t> extents(rank());
    strides_t strides(rank());
    for (auto k = 0u; k < rank(); ++k) {
        extents[k] = dims_[permutation[k]];
        strides[k] = strides_[permutation[k]];
    }
    return array(dtype_, strata::dims::make(extents), storage_, byte_offset_, std::move(strides));
}

array array::transpose() const
{
    std::vector<int64_t> permutation(rank());
    std::iota(permutation.rbegin(), permutation.rend(), 0);
    return transpose(permutation);
}

array array::cast_view(const strata::dtype& to) const
{
    if (to == dtype_) {
        return *this;
    }
    if (!dtype_.is_packed() && !to.is_packed() && dtype_.bit_count() == to.bit_count()) {
        return array(to, dims_, storage_, byte_offset_, strides_);
    }
    if (dtype_.is_packed() && to.is_packed() && dtype_.bit_count() == to.bit_count() &&
        dtype_.group_size() == to.group_size()) {
        return array(to, dims_, storage_, byte_offset_, strides_t());
    }
    if (!is_contiguous()) {
        throw incompatible_cast(dtype_.name(), to.name(), "array is not contiguous");
    }
    if (dims_.is_scalar()) {
        if (to.is_block() || dtype_.dense_byte_count(1) != to.dense_byte_count(1)) {
            throw incompatible_cast(dtype_.name(), to.name(), "scalar byte sizes differ");
        }
        return array(to, dims_, storage_, byte_offset_, strides_t());
    }

    auto row = dims_[rank() - 1];
    uint64_t row_bits = 0;
    if (dtype_.is_block()) {
        if (row % dtype_.group_size() != 0) {
            throw incompatible_cast(dtype_.name(), to.name(), "innermost extent is not a whole number of blocks");
        }
        row_bits = static_cast<uint64_t>(row / dtype_.group_size()) * dtype_.bit_count();
    } else {
        row_bits = static_cast<uint64_t>(row) * dtype_.bit_count();
    }
    if (rank() > 1 && row_bits % 8 != 0) {
        throw incompatible_cast(dtype_.name(), to.name(), "rows are not byte aligned");
    }
    if (row_bits % to.bit_count() != 0) {
        throw incompatible_cast(dtype_.name(),
                                to.name(),
                                fmt::format("{} bits per row do not split into groups of {} bits", row_bits,
                                            to.bit_count()));
    }
    std::vector<int64_t> extents(dims_.begin(), dims_.end());
    extents.back() = static_cast<int64_t>(row_bits / to.bit_count() * to.group_size());
    auto d = strata::dims::make(extents);
    auto strides = to.is_packed() ? strides_t() : d.default_strides(to.element_size());
    return array(to, std::move(d), storage_, byte_offset_, std::move(strides));
}

array array::clone() const
{
    return clone_to(residency());
}

array array::clone_to(enum residency target) const
{
    auto result = allocate(storage_->resource(), dtype_, dims_, target);
    uint64_t dst_offset = 0;
    for_each_run(*this, [&](uint64_t offset, uint64_t length) {
        storage_->copy_region_to(*result.storage_, copy_region{offset, dst_offset, length});
        dst_offset += length;
    });
    base::log_debug(base::log_channel::generic,
                    "Cloned {} {} array ({} bytes) to {}",
                    dtype_,
                    dims_,
                    dst_offset,
                    residency_to_str(target));
    return result;
}

array& array::transfer_to(enum residency target, transfer_mode mode)
{
    storage_->transfer_to(target, mode);
    return *this;
}

void array::check_host_access(std::string_view operation) const
{
    if (!storage_->is_host_accessible()) {
        throw wrong_residency(operation, residency_to_str(storage_->residency()));
    }
}

void array::write_bytes(std::span<const uint8_t> bytes)
{
    check_host_access("write_bytes");
    if (bytes.size() != byte_size()) {
        throw shape_mismatch(
            fmt::format("Writing {} bytes into {} {} array of {} bytes.", bytes.size(), dtype_, dims_, byte_size()));
    }
    uint64_t position = 0;
    for_each_run(*this, [&](uint64_t offset, uint64_t length) {
        storage_->write_bytes(offset, bytes.subspan(position, length));
        position += length;
    });
}

void array::read_bytes(std::span<uint8_t> out) const
{
    check_host_access("read_bytes");
    if (out.size() != byte_size()) {
        throw shape_mismatch(
            fmt::format("Reading {} {} array of {} bytes into {} bytes.", dtype_, dims_, byte_size(), out.size()));
    }
    uint64_t position = 0;
    for_each_run(*this, [&](uint64_t offset, uint64_t length) {
        storage_->read_bytes(offset, out.subspan(position, length));
        position += length;
    });
}

uint64_t array::element_offset(std::span<const int64_t> index) const
{
    if (dtype_.is_packed()) {
        throw invalid_packing(fmt::format("Elements of packed dtype {} are not byte addressable.", dtype_));
    }
    if (index.size() != rank()) {
        throw out_of_bounds(fmt::format("Index of {} axes for array of rank {}.", index.size(), rank()));
    }
    auto offset = static_cast<int64_t>(byte_offset_);
    for (auto k = 0u; k < rank(); ++k) {
        if (index[k] < 0 || index[k] >= dims_[k]) {
            throw out_of_bounds(k, index[k], index[k] + 1, dims_[k]);
        }
        offset += index[k] * strides_[k];
    }
    return static_cast<uint64_t>(offset);
}

void array::fill_bytes(std::span<const uint8_t> pattern)
{
    auto p = pattern.size();
    auto whole_storage = is_contiguous() && byte_offset_ == 0 && byte_size() == storage_->byte_length();
    if (whole_storage && (p == 1 || p == 2 || p == 4 || p == 8)) {
        storage_->fill(pattern);
        return;
    }
    check_host_access("fill");
    std::vector<uint8_t> bytes(byte_size());
    for (uint64_t i = 0; i < bytes.size(); i += p) {
        std::copy(pattern.begin(), pattern.end(), bytes.begin() + i);
    }
    write_bytes(bytes);
}

std::string array::to_string() const
{
    return fmt::format("array(dtype={}, dims={}, byte_offset={}, strides=[{}], {})",
                       dtype_,
                       dims_,
                       byte_offset_,
                       fmt::join(strides_, ", "),
                       storage_->to_string());
}

std::string array::contents_to_string(std::size_t max_elements) const
{
    check_host_access("contents_to_string");
    auto total = element_count();
    auto shown = std::min<int64_t>(total, static_cast<int64_t>(max_elements));
    if (!has_native_type(dtype_)) {
        auto bytes = read_bytes();
        auto n = std::min(bytes.size(), max_elements);
        return fmt::format("<{} bytes of {}: {:02x}{}>",
                           bytes.size(),
                           dtype_,
                           fmt::join(bytes.begin(), bytes.begin() + n, " "),
                           n < bytes.size() ? " ..." : "");
    }
    auto items = switch_dtype(dtype_, [&]<typename T>() {
        auto values = this->template read<T>();
        std::vector<std::string> out;
        out.reserve(shown);
        for (int64_t i = 0; i < shown; ++i) {
            out.push_back(format_element<T>(values[i]));
        }
        return out;
    });
    return render_nested(dims_, items, total);
}

} // namespace strata
