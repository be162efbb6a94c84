#include "dims.hpp"

#include <algorithm>

namespace strata {

dims dims::make(std::span<const value_type> extents)
{
    container_type e(extents.begin(), extents.end());
    for (auto i = 0u; i < e.size(); ++i) {
        if (e[i] < 0) {
            throw invalid_shape(fmt::format("[{}]", fmt::join(e, ", ")), i, e[i]);
        }
    }
    return dims(std::move(e));
}

dims dims::make_partial(std::span<const value_type> extents)
{
    container_type e(extents.begin(), extents.end());
    for (auto i = 0u; i < e.size(); ++i) {
        if (e[i] < 0 && e[i] != dynamic_extent) {
            throw invalid_shape(fmt::format("[{}]", fmt::join(e, ", ")), i, e[i]);
        }
    }
    return dims(std::move(e));
}

dims::value_type dims::at(int64_t axis) const
{
    if (axis < 0 || axis >= static_cast<int64_t>(rank())) {
        throw out_of_bounds(fmt::format("Axis {} is out of bounds for rank {}.", axis, rank()));
    }
    return extents_[axis];
}

bool dims::is_dynamic() const noexcept
{
    return std::find(extents_.begin(), extents_.end(), dynamic_extent) != extents_.end();
}

dims dims::bind(const dims& concrete) const
{
    if (concrete.rank() != rank() || concrete.is_dynamic()) {
        throw shape_mismatch(to_string(), concrete.to_string());
    }
    auto e = extents_;
    for (auto i = 0u; i < e.size(); ++i) {
        if (e[i] == dynamic_extent) {
            e[i] = concrete[i];
        } else if (e[i] != concrete[i]) {
            throw shape_mismatch(to_string(), concrete.to_string());
        }
    }
    return dims(std::move(e));
}

void dims::check_concrete(const char* operation) const
{
    if (is_dynamic()) {
        throw invalid_shape(fmt::format("Dims {} have unbound dynamic axes; {} requires concrete dims.", to_string(),
                                        operation));
    }
}

int64_t dims::element_count() const
{
    check_concrete("element_count");
    int64_t count = 1;
    for (auto e : extents_) {
        count *= e;
    }
    return count;
}

strides_t dims::default_strides(int64_t element_size) const
{
    check_concrete("default_strides");
    strides_t strides(rank());
    auto s = element_size;
    for (auto i = rank(); i > 0; --i) {
        strides[i - 1] = s;
        s *= extents_[i - 1];
    }
    return strides;
}

bool dims::is_contiguous(std::span<const int64_t> strides, int64_t element_size) const
{
    if (strides.size() != rank()) {
        return false;
    }
    auto expected = default_strides(element_size);
    return std::equal(strides.begin(), strides.end(), expected.begin(), expected.end());
}

dims dims::reshaped(std::span<const value_type> new_extents) const
{
    auto result = make(new_extents);
    if (result.element_count() != element_count()) {
        throw shape_mismatch(to_string(), result.to_string());
    }
    return result;
}

std::string dims::to_string() const
{
    std::string out = "[";
    for (auto i = 0u; i < extents_.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += extents_[i] == dynamic_extent ? std::string("?") : std::to_string(extents_[i]);
    }
    out += "]";
    return out;
}

} // namespace strata
