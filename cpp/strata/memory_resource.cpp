#include "memory_resource.hpp"
#include "exceptions.hpp"

#include <base/base.hpp>

#include <cstring>
#include <new>

namespace strata {

std::string_view memory_kind_to_str(memory_kind k)
{
    switch (k) {
    case memory_kind::host:
        return "host";
    case memory_kind::device:
        return "device";
    case memory_kind::unified:
        return "unified";
    }
    ASSERT_MESSAGE(false, "Unknown memory kind");
    return "unknown";
}

std::string_view copy_direction_to_str(copy_direction d)
{
    switch (d) {
    case copy_direction::host_to_host:
        return "host_to_host";
    case copy_direction::host_to_device:
        return "host_to_device";
    case copy_direction::device_to_host:
        return "device_to_host";
    case copy_direction::device_to_device:
        return "device_to_device";
    }
    ASSERT_MESSAGE(false, "Unknown copy direction");
    return "unknown";
}

copy_direction direction_between(memory_kind src, memory_kind dst) noexcept
{
    auto src_host = is_host_addressable(src);
    auto dst_host = is_host_addressable(dst);
    if (src_host) {
        return dst_host ? copy_direction::host_to_host : copy_direction::host_to_device;
    }
    return dst_host ? copy_direction::device_to_host : copy_direction::device_to_device;
}

void check_copy_region(const buffer& src, const buffer& dst, const copy_region& region)
{
    if (region.src_offset + region.length > src.size || region.dst_offset + region.length > dst.size) {
        throw transfer_failed(fmt::format("Copy of {} bytes from offset {} to offset {} exceeds buffers of {} and {} bytes.",
                                          region.length,
                                          region.src_offset,
                                          region.dst_offset,
                                          src.size,
                                          dst.size));
    }
}

host_memory_resource::host_memory_resource(const config& c)
    : alignment_(c.host_alignment)
    , limit_(c.host_memory_limit)
{
}

buffer host_memory_resource::allocate(uint64_t bytes, memory_kind kind)
{
    if (kind != memory_kind::host) {
        throw allocation_failed(name(), bytes, fmt::format("{} memory is not available", memory_kind_to_str(kind)));
    }
    auto in_use = bytes_in_use_.fetch_add(bytes, std::memory_order_relaxed);
    if (limit_ != 0 && in_use + bytes > limit_) {
        bytes_in_use_.fetch_sub(bytes, std::memory_order_relaxed);
        throw allocation_failed(name(), bytes, fmt::format("limit of {} bytes exceeded", limit_));
    }
    // Zero sized buffers still get a distinct address.
    auto* p = ::operator new(bytes == 0 ? 1 : bytes, std::align_val_t(alignment_), std::nothrow);
    if (p == nullptr) {
        bytes_in_use_.fetch_sub(bytes, std::memory_order_relaxed);
        throw allocation_failed(name(), bytes, "out of memory");
    }
    return buffer{p, bytes, memory_kind::host};
}

void host_memory_resource::release(const buffer& b) noexcept
{
    if (!b) {
        return;
    }
    ::operator delete(b.data, std::align_val_t(alignment_));
    bytes_in_use_.fetch_sub(b.size, std::memory_order_relaxed);
}

void host_memory_resource::copy(const buffer& src, const buffer& dst, const copy_region& region,
                                copy_direction direction)
{
    if (direction != copy_direction::host_to_host) {
        throw transfer_failed(fmt::format("Memory resource '{}' can't copy {}.", name(), copy_direction_to_str(direction)));
    }
    check_copy_region(src, dst, region);
    if (region.length != 0) {
        std::memmove(static_cast<uint8_t*>(dst.data) + region.dst_offset,
                     static_cast<const uint8_t*>(src.data) + region.src_offset,
                     region.length);
    }
}

} // namespace strata
