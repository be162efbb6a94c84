#pragma once

/**
 * @file memory_resource.hpp
 * @brief Boundary with the device/host resource management layer.
 */

#include "config.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace strata {

/**
 * @brief Memory domain of a single buffer. `unified` buffers are addressable from both host and device.
 */
enum class memory_kind : uint8_t
{
    host,
    device,
    unified
};

std::string_view memory_kind_to_str(memory_kind k);

inline bool is_host_addressable(memory_kind k) noexcept
{
    return k == memory_kind::host || k == memory_kind::unified;
}

/**
 * @brief Raw allocation handed out by a `memory_resource`. Device pointers are opaque to the host.
 */
struct buffer
{
    void* data = nullptr;
    uint64_t size = 0;
    memory_kind kind = memory_kind::host;

    explicit operator bool() const noexcept
    {
        return data != nullptr;
    }
};

enum class copy_direction : uint8_t
{
    host_to_host,
    host_to_device,
    device_to_host,
    device_to_device
};

std::string_view copy_direction_to_str(copy_direction d);

/**
 * @brief Direction of a copy between buffers of the given kinds. Unified buffers are copied through the host path.
 */
copy_direction direction_between(memory_kind src, memory_kind dst) noexcept;

struct copy_region
{
    uint64_t src_offset = 0;
    uint64_t dst_offset = 0;
    uint64_t length = 0;
};

/**
 * @brief Allocation, release and copy primitives implemented by the resource management layer.
 *
 * Implementations report failures by throwing `allocation_failed` from `allocate` and `transfer_failed` from `copy`.
 * `copy` completes before returning.
 */
class memory_resource
{
public:
    virtual ~memory_resource() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    virtual bool supports(memory_kind kind) const noexcept = 0;

    virtual buffer allocate(uint64_t bytes, memory_kind kind) = 0;

    virtual void release(const buffer& b) noexcept = 0;

    virtual void copy(const buffer& src, const buffer& dst, const copy_region& region, copy_direction direction) = 0;
};

/**
 * @brief Aligned host memory. Device and unified memory are not available from this resource.
 */
class host_memory_resource : public memory_resource
{
public:
    explicit host_memory_resource(const config& c = config());

    [[nodiscard]] std::string name() const override
    {
        return "host";
    }

    bool supports(memory_kind kind) const noexcept override
    {
        return kind == memory_kind::host;
    }

    buffer allocate(uint64_t bytes, memory_kind kind) override;

    void release(const buffer& b) noexcept override;

    void copy(const buffer& src, const buffer& dst, const copy_region& region, copy_direction direction) override;

    uint64_t bytes_in_use() const noexcept
    {
        return bytes_in_use_.load(std::memory_order_relaxed);
    }

private:
    uint64_t alignment_;
    uint64_t limit_;
    std::atomic<uint64_t> bytes_in_use_ = 0;
};

/**
 * @brief Checks that @p region fits both buffers, throwing `transfer_failed` otherwise.
 */
void check_copy_region(const buffer& src, const buffer& dst, const copy_region& region);

} // namespace strata
