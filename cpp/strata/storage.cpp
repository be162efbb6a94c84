#include "storage.hpp"

#include <base/base.hpp>
#include <base/overloads.hpp>

#include <cstring>
#include <mutex>
#include <vector>

namespace strata {

namespace {

enum residency residency_of(const storage::state_type& state) noexcept
{
    return std::visit(base::overloads{
                          [](const storage::host_only&) {
                              return residency::host;
                          },
                          [](const storage::device_only&) {
                              return residency::device;
                          },
                          [](const storage::mirrored&) {
                              return residency::host_and_device;
                          },
                          [](const storage::unified&) {
                              return residency::host_and_device;
                          },
                      },
                      state);
}

void release_state(memory_resource& resource, const storage::state_type& state) noexcept
{
    std::visit(base::overloads{
                   [&resource](const storage::host_only& s) {
                       resource.release(s.host);
                   },
                   [&resource](const storage::device_only& s) {
                       resource.release(s.device);
                   },
                   [&resource](const storage::mirrored& s) {
                       resource.release(s.host);
                       resource.release(s.device);
                   },
                   [&resource](const storage::unified& s) {
                       resource.release(s.both);
                   },
               },
               state);
}

uint8_t* host_bytes(const buffer& b) noexcept
{
    return static_cast<uint8_t*>(b.data);
}

} // namespace

std::string_view residency_to_str(residency r)
{
    switch (r) {
    case residency::host:
        return "host";
    case residency::device:
        return "device";
    case residency::host_and_device:
        return "host_and_device";
    }
    ASSERT_MESSAGE(false, "Unknown residency");
    return "unknown";
}

std::optional<buffer> host_buffer(const storage::state_type& state) noexcept
{
    return std::visit(base::overloads{
                          [](const storage::host_only& s) -> std::optional<buffer> {
                              return s.host;
                          },
                          [](const storage::device_only&) -> std::optional<buffer> {
                              return std::nullopt;
                          },
                          [](const storage::mirrored& s) -> std::optional<buffer> {
                              return s.host;
                          },
                          [](const storage::unified& s) -> std::optional<buffer> {
                              return s.both;
                          },
                      },
                      state);
}

std::optional<buffer> device_buffer(const storage::state_type& state) noexcept
{
    return std::visit(base::overloads{
                          [](const storage::host_only&) -> std::optional<buffer> {
                              return std::nullopt;
                          },
                          [](const storage::device_only& s) -> std::optional<buffer> {
                              return s.device;
                          },
                          [](const storage::mirrored& s) -> std::optional<buffer> {
                              return s.device;
                          },
                          [](const storage::unified& s) -> std::optional<buffer> {
                              return s.both;
                          },
                      },
                      state);
}

///////////////////
/// host_mapping
///////////////////
host_mapping::host_mapping(host_mapping&& other) noexcept
    : storage_(std::move(other.storage_))
    , data_(other.data_)
    , access_(other.access_)
{
    other.data_ = {};
}

host_mapping& host_mapping::operator=(host_mapping&& other) noexcept
{
    if (this != &other) {
        end(false);
        storage_ = std::move(other.storage_);
        data_ = other.data_;
        access_ = other.access_;
        other.data_ = {};
    }
    return *this;
}

host_mapping::~host_mapping()
{
    end(false);
}

std::span<uint8_t> host_mapping::writable_data() const
{
    if (access_ == access_mode::read) {
        throw invalid_operation("host mapping was opened for reading only");
    }
    return data_;
}

void host_mapping::release()
{
    end(true);
}

void host_mapping::end(bool propagate_errors)
{
    if (storage_ == nullptr) {
        return;
    }
    auto s = std::move(storage_);
    data_ = {};
    s->end_lease(access_, propagate_errors);
}

///////////////
/// storage
///////////////
storage::storage(private_tag, std::shared_ptr<memory_resource> resource, uint64_t byte_length, state_type state)
    : resource_(std::move(resource))
    , byte_length_(byte_length)
    , state_(std::move(state))
{
}

storage::~storage()
{
    ASSERT(leases_ == 0);
    release_state(*resource_, state_);
    base::log_debug(base::log_channel::storage, "Released storage of {} bytes", byte_length_);
}

std::shared_ptr<storage>
storage::allocate(std::shared_ptr<memory_resource> resource, uint64_t byte_length, enum residency r)
{
    ASSERT(resource != nullptr);
    auto make = [&](state_type state) {
        return std::make_shared<storage>(private_tag{}, resource, byte_length, std::move(state));
    };
    switch (r) {
    case strata::residency::host:
        return make(host_only{resource->allocate(byte_length, memory_kind::host)});
    case strata::residency::device:
        return make(device_only{resource->allocate(byte_length, memory_kind::device)});
    case strata::residency::host_and_device:
        break;
    }
    if (resource->supports(memory_kind::unified)) {
        return make(unified{resource->allocate(byte_length, memory_kind::unified)});
    }
    auto host = resource->allocate(byte_length, memory_kind::host);
    try {
        auto device = resource->allocate(byte_length, memory_kind::device);
        return make(mirrored{host, device});
    } catch (const std::exception&) {
        resource->release(host);
        throw;
    }
}

enum residency storage::residency() const
{
    std::lock_guard lock(lock_);
    return residency_of(state_);
}

bool storage::is_host_accessible() const
{
    std::lock_guard lock(lock_);
    return host_buffer(state_).has_value();
}

bool storage::is_device_accessible() const
{
    std::lock_guard lock(lock_);
    return device_buffer(state_).has_value();
}

uint32_t storage::active_leases() const
{
    std::lock_guard lock(lock_);
    return leases_;
}

storage::state_type storage::snapshot(std::string_view operation) const
{
    std::lock_guard lock(lock_);
    if (transferring_) {
        throw invalid_operation(fmt::format("'{}' while the storage is being transferred", operation));
    }
    return state_;
}

storage& storage::transfer_to(enum residency target, transfer_mode mode)
{
    state_type current;
    {
        std::lock_guard lock(lock_);
        if (leases_ != 0) {
            throw storage_leased(leases_);
        }
        if (transferring_) {
            throw invalid_operation("storage is already being transferred");
        }
        current = state_;
        transferring_ = true;
    }

    struct transfer_guard
    {
        storage& s;

        ~transfer_guard()
        {
            std::lock_guard lock(s.lock_);
            s.transferring_ = false;
        }
    } guard{*this};

    if (std::holds_alternative<unified>(current)) {
        return *this;
    }

    auto host = host_buffer(current);
    auto device = device_buffer(current);
    auto want_host = target != strata::residency::device;
    auto want_device = target != strata::residency::host;
    if (mode == transfer_mode::mirror) {
        want_host = want_host || host.has_value();
        want_device = want_device || device.has_value();
    }
    if (want_host == host.has_value() && want_device == device.has_value()) {
        return *this;
    }

    auto transfer_span = base::log_span(base::log_channel::storage,
                               fmt::format("Transfer of {} bytes from {} to {} ({})",
                                           byte_length_,
                                           residency_to_str(residency_of(current)),
                                           residency_to_str(target),
                                           mode == transfer_mode::move ? "move" : "mirror"));

    // At most one side is missing: mirrored storage only ever drops a side here.
    std::optional<buffer> allocated;
    try {
        if (want_host && !host) {
            allocated = resource_->allocate(byte_length_, memory_kind::host);
            host = allocated;
        } else if (want_device && !device) {
            allocated = resource_->allocate(byte_length_, memory_kind::device);
            device = allocated;
        }
        if (allocated) {
            const auto& src = allocated->kind == memory_kind::host ? *device : *host;
            copy_between(src, *allocated, copy_region{0, 0, byte_length_});
        }
    } catch (const std::exception& e) {
        if (allocated) {
            resource_->release(*allocated);
        }
        transfer_span->fail(e.what());
        throw;
    }

    state_type next;
    if (want_host && want_device) {
        next = mirrored{*host, *device};
    } else if (want_host) {
        next = host_only{*host};
    } else {
        next = device_only{*device};
    }
    {
        std::lock_guard lock(lock_);
        state_ = next;
    }
    if (!want_host && host) {
        resource_->release(*host);
    }
    if (!want_device && device) {
        resource_->release(*device);
    }
    return *this;
}

host_mapping storage::map_for_host(access_mode access)
{
    std::span<uint8_t> data;
    {
        std::lock_guard lock(lock_);
        if (transferring_) {
            throw invalid_operation("'map_for_host' while the storage is being transferred");
        }
        auto host = host_buffer(state_);
        if (!host) {
            throw wrong_residency("map_for_host", residency_to_str(residency_of(state_)));
        }
        data = std::span<uint8_t>(host_bytes(*host), byte_length_);
        ++leases_;
    }
    return host_mapping(shared_from_this(), data, access);
}

void storage::end_lease(access_mode access, bool propagate_errors)
{
    state_type current;
    {
        std::lock_guard lock(lock_);
        ASSERT(leases_ > 0);
        --leases_;
        current = state_;
    }
    if (access == access_mode::read) {
        return;
    }
    const auto* m = std::get_if<mirrored>(&current);
    if (m == nullptr) {
        return;
    }
    try {
        update_device_mirror(*m, copy_region{0, 0, byte_length_});
    } catch (const std::exception&) {
        // Already logged, the storage is consistent again.
        if (propagate_errors) {
            throw;
        }
    }
}

void storage::drop_device_mirror(const buffer& device) noexcept
{
    {
        std::lock_guard lock(lock_);
        auto* m = std::get_if<mirrored>(&state_);
        if (m == nullptr || m->device.data != device.data) {
            return;
        }
        state_ = host_only{m->host};
    }
    resource_->release(device);
}

void storage::update_device_mirror(const mirrored& m, const copy_region& region)
{
    try {
        copy_between(m.host, m.device, region);
    } catch (const exception& e) {
        drop_device_mirror(m.device);
        base::log_exception(base::log_level::warning,
                            base::log_channel::storage,
                            "Device mirror dropped after failed update from host writes",
                            e);
        throw;
    } catch (const std::exception& e) {
        drop_device_mirror(m.device);
        base::log_warning(base::log_channel::storage,
                          "Device mirror dropped after failed update from host writes: {}",
                          e.what());
        throw;
    }
}

void storage::check_range(uint64_t offset, uint64_t length) const
{
    if (offset > byte_length_ || length > byte_length_ - offset) {
        throw out_of_bounds(
            fmt::format("Byte range [{}, {}) exceeds storage of {} bytes.", offset, offset + length, byte_length_));
    }
}

void storage::copy_between(const buffer& src, const buffer& dst, const copy_region& region) const
{
    auto direction = direction_between(src.kind, dst.kind);
    if (direction == copy_direction::host_to_host) {
        check_copy_region(src, dst, region);
        if (region.length != 0) {
            std::memmove(host_bytes(dst) + region.dst_offset, host_bytes(src) + region.src_offset, region.length);
        }
        return;
    }
    resource_->copy(src, dst, region, direction);
}

void storage::write_bytes(uint64_t offset, std::span<const uint8_t> bytes)
{
    check_range(offset, bytes.size());
    auto state = snapshot("write_bytes");
    auto host = host_buffer(state);
    if (!host) {
        throw wrong_residency("write_bytes", residency_to_str(residency_of(state)));
    }
    if (bytes.empty()) {
        return;
    }
    std::memcpy(host_bytes(*host) + offset, bytes.data(), bytes.size());
    if (const auto* m = std::get_if<mirrored>(&state)) {
        update_device_mirror(*m, copy_region{offset, offset, bytes.size()});
    }
}

void storage::read_bytes(uint64_t offset, std::span<uint8_t> out) const
{
    check_range(offset, out.size());
    auto state = snapshot("read_bytes");
    auto host = host_buffer(state);
    if (!host) {
        throw wrong_residency("read_bytes", residency_to_str(residency_of(state)));
    }
    if (!out.empty()) {
        std::memcpy(out.data(), host_bytes(*host) + offset, out.size());
    }
}

void storage::fill(std::span<const uint8_t> pattern)
{
    auto p = pattern.size();
    if (p != 1 && p != 2 && p != 4 && p != 8) {
        throw invalid_operation(fmt::format("fill pattern of {} bytes, expected 1, 2, 4 or 8", p));
    }
    if (byte_length_ % p != 0) {
        throw invalid_operation(fmt::format("fill pattern of {} bytes does not divide {} bytes", p, byte_length_));
    }
    std::vector<uint8_t> staging(byte_length_);
    for (uint64_t i = 0; i < byte_length_; i += p) {
        std::memcpy(staging.data() + i, pattern.data(), p);
    }
    auto state = snapshot("fill");
    buffer source{staging.data(), byte_length_, memory_kind::host};
    std::visit(base::overloads{
                   [&](const host_only& s) {
                       copy_between(source, s.host, copy_region{0, 0, byte_length_});
                   },
                   [&](const device_only& s) {
                       copy_between(source, s.device, copy_region{0, 0, byte_length_});
                   },
                   [&](const mirrored& s) {
                       copy_between(source, s.host, copy_region{0, 0, byte_length_});
                       update_device_mirror(s, copy_region{0, 0, byte_length_});
                   },
                   [&](const unified& s) {
                       copy_between(source, s.both, copy_region{0, 0, byte_length_});
                   },
               },
               state);
}

void storage::copy_from(const storage& source)
{
    if (source.byte_length() != byte_length_) {
        throw invalid_operation(
            fmt::format("copy between storages of {} and {} bytes", source.byte_length(), byte_length_));
    }
    source.copy_region_to(*this, copy_region{0, 0, byte_length_});
}

void storage::copy_region_to(storage& dst, const copy_region& region) const
{
    check_range(region.src_offset, region.length);
    dst.check_range(region.dst_offset, region.length);
    auto src_state = snapshot("copy");
    auto dst_state = dst.snapshot("copy");
    auto src = host_buffer(src_state);
    if (!src) {
        src = device_buffer(src_state);
    }
    ASSERT(src.has_value());
    // Copies involving device memory go through the resource owning the device side.
    auto copy_into = [&](const buffer& target) {
        const auto& owner = is_host_addressable(target.kind) ? *this : dst;
        owner.copy_between(*src, target, region);
    };
    std::visit(base::overloads{
                   [&](const host_only& s) {
                       copy_into(s.host);
                   },
                   [&](const device_only& s) {
                       copy_into(s.device);
                   },
                   [&](const mirrored& s) {
                       copy_into(s.host);
                       dst.update_device_mirror(s, copy_region{region.dst_offset, region.dst_offset, region.length});
                   },
                   [&](const unified& s) {
                       copy_into(s.both);
                   },
               },
               dst_state);
}

std::string storage::to_string() const
{
    std::lock_guard lock(lock_);
    return fmt::format("storage(bytes={}, residency={}, leases={}, resource={})",
                       byte_length_,
                       residency_to_str(residency_of(state_)),
                       leases_,
                       resource_->name());
}

} // namespace strata
