#include "bridge.hpp"

#include <base/base.hpp>

namespace strata {

std::string_view bridge_capability_to_str(bridge_capability c)
{
    switch (c) {
    case bridge_capability::contiguous_only:
        return "contiguous_only";
    case bridge_capability::strided:
        return "strided";
    }
    ASSERT_MESSAGE(false, "Unknown bridge capability");
    return "unknown";
}

external_view::external_view(
    host_mapping lease, strata::dtype dtype, strata::dims dims, strides_t strides, uint64_t byte_offset)
    : lease_(std::move(lease))
    , dtype_(dtype)
    , dims_(std::move(dims))
    , strides_(std::move(strides))
    , byte_offset_(byte_offset)
    , byte_size_(dtype_.dense_byte_count(dims_.element_count()))
{
    ASSERT(byte_offset_ + byte_size_ <= lease_.data().size());
}

external_view as_external_view(const array& a, access_mode access)
{
    const auto& s = a.storage();
    if (!s->is_host_accessible()) {
        throw wrong_residency("as_external_view", residency_to_str(s->residency()));
    }
    if (a.dtype().is_packed()) {
        throw invalid_packing(fmt::format("Dtype {} has no element layout an Eigen map can use.", a.dtype()));
    }
    if constexpr (bridge_capabilities == bridge_capability::contiguous_only) {
        if (!a.is_contiguous()) {
            throw not_contiguous("as_external_view");
        }
    }
    if (a.byte_offset() % static_cast<uint64_t>(a.dtype().element_size()) != 0) {
        throw incompatible_cast(
            a.dtype().name(),
            "Eigen map",
            fmt::format("byte offset {} is not a multiple of the element size {}", a.byte_offset(),
                        a.dtype().element_size()));
    }
    auto lease = s->map_for_host(access);
    base::log_debug(base::log_channel::bridge,
                    "Borrowed {} {} array at byte {} for host access",
                    a.dtype(),
                    a.dims(),
                    a.byte_offset());
    return external_view(std::move(lease), a.dtype(), a.dims(), a.strides(), a.byte_offset());
}

array from_external_view(const external_view& view,
                         const dtype& dtype,
                         std::shared_ptr<memory_resource> resource)
{
    auto bytes = view.bytes();
    auto expected = dtype.dense_byte_count(view.dims().element_count());
    if (expected != bytes.size()) {
        throw incompatible_cast(
            view.dtype().name(),
            dtype.name(),
            fmt::format("{} array needs {} bytes, the view holds {}", view.dims(), expected, bytes.size()));
    }
    auto result = array::for_host(std::move(resource), dtype, view.dims());
    result.write_bytes(bytes);
    return result;
}

namespace impl {

array from_row_major(const dtype& dtype,
                     std::span<const int64_t> extents,
                     std::span<const uint8_t> bytes,
                     std::shared_ptr<memory_resource> resource)
{
    auto result = array::for_host(std::move(resource), dtype, dims::make(extents));
    result.write_bytes(bytes);
    base::log_debug(base::log_channel::bridge, "Imported {} {} array from Eigen", dtype, result.dims());
    return result;
}

} // namespace impl

} // namespace strata
