#pragma once

/**
 * @file storage.hpp
 * @brief Definition of the `storage` and `host_mapping` classes.
 */

#include "exceptions.hpp"
#include "memory_resource.hpp"

#include <base/spin_lock.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace strata {

/**
 * @brief Memory domains a storage is addressable from.
 */
enum class residency : uint8_t
{
    host,
    device,
    host_and_device
};

std::string_view residency_to_str(residency r);

enum class transfer_mode : uint8_t
{
    /// The source residency is released once the bytes have been copied.
    move,
    /// The source residency is kept, the storage ends up on both host and device.
    mirror
};

enum class access_mode : uint8_t
{
    read,
    write,
    read_write,
    /// Write access where the previous content is not needed.
    discard_write
};

class storage;

/**
 * @brief Scoped host access to the bytes of a storage.
 *
 * While a mapping is alive the storage can't be transferred or released. Mappings opened for writing on a storage
 * mirrored to the device copy the host bytes back to the device when they end.
 */
class host_mapping
{
public:
    host_mapping() = default;

    host_mapping(const host_mapping&) = delete;
    host_mapping& operator=(const host_mapping&) = delete;

    host_mapping(host_mapping&& other) noexcept;
    host_mapping& operator=(host_mapping&& other) noexcept;

    ~host_mapping();

    std::span<const uint8_t> data() const noexcept
    {
        return data_;
    }

    /**
     * @throws invalid_operation if the mapping was opened with `access_mode::read`.
     */
    std::span<uint8_t> writable_data() const;

    access_mode access() const noexcept
    {
        return access_;
    }

    const std::shared_ptr<storage>& owner() const noexcept
    {
        return storage_;
    }

    explicit operator bool() const noexcept
    {
        return storage_ != nullptr;
    }

    /**
     * @brief Ends the mapping.
     * @throws transfer_failed if the bytes could not be written back to the device mirror. The mirror is dropped in
     * that case and the storage stays host resident.
     */
    void release();

private:
    friend class storage;

    host_mapping(std::shared_ptr<storage> s, std::span<uint8_t> data, access_mode access)
        : storage_(std::move(s))
        , data_(data)
        , access_(access)
    {
    }

    void end(bool propagate_errors);

private:
    std::shared_ptr<storage> storage_;
    std::span<uint8_t> data_;
    access_mode access_ = access_mode::read;
};

/**
 * @brief Fixed size byte buffer shared by arrays, resident on host, device or both.
 *
 * A storage is always owned through `std::shared_ptr`; the last reference releases the buffers to the memory resource.
 * The residency state is a closed set of alternatives and changes only through `transfer_to`. Buffer content is
 * not synchronized: concurrent writers must be serialized by the caller.
 */
class storage : public std::enable_shared_from_this<storage>
{
    struct private_tag
    {
    };

public:
    struct host_only
    {
        buffer host;
    };

    struct device_only
    {
        buffer device;
    };

    /// Separate host and device buffers holding the same bytes.
    struct mirrored
    {
        buffer host;
        buffer device;
    };

    /// A single buffer addressable from host and device.
    struct unified
    {
        buffer both;
    };

    using state_type = std::variant<host_only, device_only, mirrored, unified>;

public:
    storage(private_tag, std::shared_ptr<memory_resource> resource, uint64_t byte_length, state_type state);

    storage(const storage&) = delete;
    storage& operator=(const storage&) = delete;
    storage(storage&&) = delete;
    storage& operator=(storage&&) = delete;

    ~storage();

    /**
     * @brief Allocates @p byte_length bytes from @p resource.
     *
     * `residency::host_and_device` uses unified memory when the resource provides it, separate mirrored buffers
     * otherwise.
     * @throws allocation_failed
     */
    static std::shared_ptr<storage>
    allocate(std::shared_ptr<memory_resource> resource, uint64_t byte_length, enum residency r);

    uint64_t byte_length() const noexcept
    {
        return byte_length_;
    }

    enum residency residency() const;

    bool is_host_accessible() const;

    bool is_device_accessible() const;

    /**
     * @brief Makes the bytes available on @p target. Blocks until the copy completes.
     *
     * No-op if the storage is already accessible from @p target. On failure the storage is left unchanged.
     * @throws storage_leased if host mappings are open.
     * @throws allocation_failed, transfer_failed
     */
    storage& transfer_to(enum residency target, transfer_mode mode = transfer_mode::move);

    /**
     * @throws wrong_residency if the storage is not host accessible.
     */
    host_mapping map_for_host(access_mode access = access_mode::read_write);

    /**
     * @brief Copies @p bytes to @p offset, writing through to the device mirror if there is one.
     * @throws wrong_residency for device only storage, out_of_bounds.
     */
    void write_bytes(uint64_t offset, std::span<const uint8_t> bytes);

    /**
     * @throws wrong_residency for device only storage, out_of_bounds.
     */
    void read_bytes(uint64_t offset, std::span<uint8_t> out) const;

    /**
     * @brief Repeats @p pattern (1, 2, 4 or 8 bytes) over the whole storage, whatever its residency.
     */
    void fill(std::span<const uint8_t> pattern);

    /**
     * @brief Copies every byte of @p source, which must have the same byte length.
     */
    void copy_from(const storage& source);

    /**
     * @brief Copies @p region of this storage into every buffer of @p dst.
     */
    void copy_region_to(storage& dst, const copy_region& region) const;

    long use_count() const noexcept
    {
        return weak_from_this().use_count();
    }

    uint32_t active_leases() const;

    const std::shared_ptr<memory_resource>& resource() const noexcept
    {
        return resource_;
    }

    std::string to_string() const;

private:
    friend class host_mapping;

    state_type snapshot(std::string_view operation) const;

    void end_lease(access_mode access, bool propagate_errors);

    void drop_device_mirror(const buffer& device) noexcept;

    /**
     * @brief Copies @p region of the host buffer of @p m to its device buffer. On failure the device mirror is
     * dropped, the storage keeps the host bytes as its only copy, and the error is rethrown.
     */
    void update_device_mirror(const mirrored& m, const copy_region& region);

    void copy_between(const buffer& src, const buffer& dst, const copy_region& region) const;

    void check_range(uint64_t offset, uint64_t length) const;

private:
    std::shared_ptr<memory_resource> resource_;
    const uint64_t byte_length_;
    mutable base::spin_lock lock_;
    state_type state_;
    uint32_t leases_ = 0;
    bool transferring_ = false;
};

/**
 * @brief The host addressable buffer of @p state, if any.
 */
std::optional<buffer> host_buffer(const storage::state_type& state) noexcept;

/**
 * @brief The device addressable buffer of @p state, if any.
 */
std::optional<buffer> device_buffer(const storage::state_type& state) noexcept;

} // namespace strata
