#include "fake_device_resource.hpp"

#include <strata/storage.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <new>
#include <vector>

namespace {

std::vector<uint8_t> read_all(const strata::storage& s)
{
    std::vector<uint8_t> out(s.byte_length());
    s.read_bytes(0, out);
    return out;
}

} // namespace

class StorageTest : public ::testing::Test
{
protected:
    std::shared_ptr<fake_device_resource> resource = std::make_shared<fake_device_resource>();
};

TEST_F(StorageTest, allocate_residencies)
{
    auto host = strata::storage::allocate(resource, 16, strata::residency::host);
    EXPECT_EQ(host->byte_length(), 16u);
    EXPECT_EQ(host->residency(), strata::residency::host);
    EXPECT_TRUE(host->is_host_accessible());
    EXPECT_FALSE(host->is_device_accessible());

    auto device = strata::storage::allocate(resource, 16, strata::residency::device);
    EXPECT_EQ(device->residency(), strata::residency::device);
    EXPECT_FALSE(device->is_host_accessible());

    auto both = strata::storage::allocate(resource, 16, strata::residency::host_and_device);
    EXPECT_EQ(both->residency(), strata::residency::host_and_device);
    EXPECT_TRUE(both->is_host_accessible());
    EXPECT_TRUE(both->is_device_accessible());
    EXPECT_EQ(resource->allocations, 4);
}

TEST_F(StorageTest, unified_memory_uses_one_buffer)
{
    auto unified = std::make_shared<fake_device_resource>(true);
    auto s = strata::storage::allocate(unified, 8, strata::residency::host_and_device);
    EXPECT_EQ(unified->allocations, 1);
    EXPECT_TRUE(s->is_host_accessible());
    EXPECT_TRUE(s->is_device_accessible());
    s->transfer_to(strata::residency::host);
    EXPECT_EQ(s->residency(), strata::residency::host_and_device);
    EXPECT_EQ(unified->allocations, 1);
}

TEST_F(StorageTest, allocation_failure)
{
    resource->failing_kind = strata::memory_kind::device;
    EXPECT_THROW(strata::storage::allocate(resource, 8, strata::residency::device), strata::allocation_failed);
    EXPECT_THROW(strata::storage::allocate(resource, 8, strata::residency::host_and_device),
                 strata::allocation_failed);
    EXPECT_EQ(resource->live(), 0);

    auto host_resource = std::make_shared<strata::host_memory_resource>();
    EXPECT_THROW(strata::storage::allocate(host_resource, 8, strata::residency::device), strata::allocation_failed);
}

TEST_F(StorageTest, mirror_allocation_releases_host_on_any_error)
{
    resource->out_of_memory_kind = strata::memory_kind::device;
    EXPECT_THROW(strata::storage::allocate(resource, 8, strata::residency::host_and_device), std::bad_alloc);
    EXPECT_EQ(resource->allocations, 1);
    EXPECT_EQ(resource->live(), 0);
}

TEST_F(StorageTest, host_memory_limit)
{
    strata::config c;
    c.host_memory_limit = 64;
    auto limited = std::make_shared<strata::host_memory_resource>(c);
    auto first = strata::storage::allocate(limited, 48, strata::residency::host);
    EXPECT_EQ(limited->bytes_in_use(), 48u);
    EXPECT_THROW(strata::storage::allocate(limited, 32, strata::residency::host), strata::allocation_failed);
    first.reset();
    EXPECT_EQ(limited->bytes_in_use(), 0u);
    EXPECT_NO_THROW(strata::storage::allocate(limited, 64, strata::residency::host));
}

TEST_F(StorageTest, released_exactly_once)
{
    auto s = strata::storage::allocate(resource, 32, strata::residency::host_and_device);
    std::vector<std::shared_ptr<strata::storage>> holders(5, s);
    EXPECT_EQ(s->use_count(), 6);
    holders.clear();
    EXPECT_EQ(resource->releases, 0);
    s.reset();
    EXPECT_EQ(resource->releases, 2);
    EXPECT_EQ(resource->live(), 0);
}

TEST_F(StorageTest, write_and_read_bytes)
{
    auto s = strata::storage::allocate(resource, 8, strata::residency::host);
    std::array<uint8_t, 3> bytes{1, 2, 3};
    s->write_bytes(2, bytes);
    EXPECT_EQ(read_all(*s), (std::vector<uint8_t>{0, 0, 1, 2, 3, 0, 0, 0}));
    EXPECT_THROW(s->write_bytes(6, bytes), strata::out_of_bounds);
    std::vector<uint8_t> too_long(9);
    EXPECT_THROW(s->read_bytes(0, too_long), strata::out_of_bounds);
}

TEST_F(StorageTest, device_only_rejects_host_io)
{
    auto s = strata::storage::allocate(resource, 4, strata::residency::device);
    std::array<uint8_t, 4> bytes{9, 9, 9, 9};
    EXPECT_THROW(s->write_bytes(0, bytes), strata::wrong_residency);
    std::array<uint8_t, 4> out{};
    EXPECT_THROW(s->read_bytes(0, out), strata::wrong_residency);
    EXPECT_THROW(s->map_for_host(), strata::wrong_residency);

    s->transfer_to(strata::residency::host);
    EXPECT_EQ(read_all(*s), (std::vector<uint8_t>{0, 0, 0, 0}));
}

TEST_F(StorageTest, transfer_move_round_trip)
{
    auto s = strata::storage::allocate(resource, 4, strata::residency::host);
    std::array<uint8_t, 4> bytes{4, 3, 2, 1};
    s->write_bytes(0, bytes);

    s->transfer_to(strata::residency::device);
    EXPECT_EQ(s->residency(), strata::residency::device);
    EXPECT_EQ(resource->live(), 1);

    s->transfer_to(strata::residency::host);
    EXPECT_EQ(s->residency(), strata::residency::host);
    EXPECT_EQ(read_all(*s), (std::vector<uint8_t>{4, 3, 2, 1}));
    EXPECT_EQ(resource->live(), 1);
    EXPECT_EQ(resource->copies, 2);
}

TEST_F(StorageTest, transfer_mirror_keeps_source)
{
    auto s = strata::storage::allocate(resource, 4, strata::residency::host);
    s->transfer_to(strata::residency::device, strata::transfer_mode::mirror);
    EXPECT_EQ(s->residency(), strata::residency::host_and_device);
    EXPECT_EQ(resource->live(), 2);

    // Already accessible from both sides.
    auto copies = resource->copies;
    s->transfer_to(strata::residency::device, strata::transfer_mode::mirror);
    s->transfer_to(strata::residency::host_and_device);
    EXPECT_EQ(resource->copies, copies);

    // Moving to a single side drops the other without copying.
    s->transfer_to(strata::residency::host);
    EXPECT_EQ(s->residency(), strata::residency::host);
    EXPECT_EQ(resource->live(), 1);
    EXPECT_EQ(resource->copies, copies);
}

TEST_F(StorageTest, transfer_to_same_residency_is_noop)
{
    auto s = strata::storage::allocate(resource, 4, strata::residency::device);
    s->transfer_to(strata::residency::device);
    EXPECT_EQ(resource->allocations, 1);
    EXPECT_EQ(resource->copies, 0);
}

TEST_F(StorageTest, failed_transfer_leaves_state_unchanged)
{
    auto s = strata::storage::allocate(resource, 4, strata::residency::host);
    std::array<uint8_t, 4> bytes{7, 7, 7, 7};
    s->write_bytes(0, bytes);

    resource->fail_copies = true;
    EXPECT_THROW(s->transfer_to(strata::residency::device), strata::transfer_failed);
    EXPECT_EQ(s->residency(), strata::residency::host);
    EXPECT_EQ(resource->live(), 1);

    resource->fail_copies = false;
    resource->failing_kind = strata::memory_kind::device;
    EXPECT_THROW(s->transfer_to(strata::residency::device), strata::allocation_failed);
    EXPECT_EQ(s->residency(), strata::residency::host);
    EXPECT_EQ(read_all(*s), (std::vector<uint8_t>{7, 7, 7, 7}));
}

TEST_F(StorageTest, lease_blocks_transfer)
{
    auto s = strata::storage::allocate(resource, 4, strata::residency::host);
    {
        auto mapping = s->map_for_host(strata::access_mode::read);
        EXPECT_EQ(s->active_leases(), 1u);
        EXPECT_EQ(mapping.data().size(), 4u);
        EXPECT_THROW(mapping.writable_data(), strata::invalid_operation);
        EXPECT_THROW(s->transfer_to(strata::residency::device), strata::storage_leased);
        EXPECT_EQ(s->residency(), strata::residency::host);
    }
    EXPECT_EQ(s->active_leases(), 0u);
    EXPECT_NO_THROW(s->transfer_to(strata::residency::device));
}

TEST_F(StorageTest, lease_keeps_storage_alive)
{
    auto s = strata::storage::allocate(resource, 4, strata::residency::host);
    auto mapping = s->map_for_host();
    s.reset();
    EXPECT_EQ(resource->releases, 0);
    mapping.writable_data()[0] = 42;
    auto moved = std::move(mapping);
    EXPECT_FALSE(mapping);
    EXPECT_TRUE(moved);
    moved.release();
    EXPECT_EQ(resource->releases, 1);
}

TEST_F(StorageTest, write_mapping_updates_device_mirror)
{
    auto s = strata::storage::allocate(resource, 4, strata::residency::host_and_device);
    {
        auto mapping = s->map_for_host(strata::access_mode::write);
        auto data = mapping.writable_data();
        std::fill(data.begin(), data.end(), 5);
    }
    // Drop the host side, then bring the device bytes back.
    s->transfer_to(strata::residency::device);
    s->transfer_to(strata::residency::host);
    EXPECT_EQ(read_all(*s), (std::vector<uint8_t>{5, 5, 5, 5}));
}

TEST_F(StorageTest, failed_mirror_update_drops_mirror)
{
    auto s = strata::storage::allocate(resource, 4, strata::residency::host_and_device);
    auto mapping = s->map_for_host(strata::access_mode::read_write);
    resource->fail_copies = true;
    EXPECT_THROW(mapping.release(), strata::transfer_failed);
    EXPECT_EQ(s->residency(), strata::residency::host);
    EXPECT_EQ(s->active_leases(), 0u);
    EXPECT_EQ(resource->live(), 1);
}

TEST_F(StorageTest, write_through_to_mirror)
{
    auto s = strata::storage::allocate(resource, 4, strata::residency::host_and_device);
    std::array<uint8_t, 2> bytes{1, 2};
    s->write_bytes(1, bytes);
    s->transfer_to(strata::residency::device);
    s->transfer_to(strata::residency::host);
    EXPECT_EQ(read_all(*s), (std::vector<uint8_t>{0, 1, 2, 0}));
}

TEST_F(StorageTest, failed_write_through_drops_mirror)
{
    auto s = strata::storage::allocate(resource, 4, strata::residency::host_and_device);
    std::array<uint8_t, 4> first{1, 2, 3, 4};
    s->write_bytes(0, first);

    resource->fail_copies = true;
    std::array<uint8_t, 4> second{9, 9, 9, 9};
    EXPECT_THROW(s->write_bytes(0, second), strata::transfer_failed);
    EXPECT_EQ(s->residency(), strata::residency::host);
    EXPECT_EQ(resource->live(), 1);
    EXPECT_EQ(read_all(*s), (std::vector<uint8_t>{9, 9, 9, 9}));

    resource->fail_copies = false;
    s->transfer_to(strata::residency::device);
    s->transfer_to(strata::residency::host);
    EXPECT_EQ(read_all(*s), (std::vector<uint8_t>{9, 9, 9, 9}));
}

TEST_F(StorageTest, failed_fill_and_copy_drop_mirror)
{
    auto filled = strata::storage::allocate(resource, 4, strata::residency::host_and_device);
    resource->fail_copies = true;
    std::array<uint8_t, 1> pattern{6};
    EXPECT_THROW(filled->fill(pattern), strata::transfer_failed);
    EXPECT_EQ(filled->residency(), strata::residency::host);
    EXPECT_EQ(read_all(*filled), (std::vector<uint8_t>{6, 6, 6, 6}));

    resource->fail_copies = false;
    auto src = strata::storage::allocate(resource, 4, strata::residency::host);
    std::array<uint8_t, 4> bytes{1, 2, 3, 4};
    src->write_bytes(0, bytes);
    auto dst = strata::storage::allocate(resource, 4, strata::residency::host_and_device);
    resource->fail_copies = true;
    EXPECT_THROW(dst->copy_from(*src), strata::transfer_failed);
    EXPECT_EQ(dst->residency(), strata::residency::host);
    EXPECT_EQ(read_all(*dst), (std::vector<uint8_t>{1, 2, 3, 4}));
    EXPECT_EQ(resource->live(), 3);
}

TEST_F(StorageTest, operations_rejected_during_transfer)
{
    auto s = strata::storage::allocate(resource, 4, strata::residency::host);
    auto* target = s.get();
    int calls = 0;
    resource->on_copy = [&] {
        ++calls;
        std::array<uint8_t, 4> bytes{};
        EXPECT_THROW(target->transfer_to(strata::residency::host), strata::invalid_operation);
        EXPECT_THROW(target->map_for_host(), strata::invalid_operation);
        EXPECT_THROW(target->write_bytes(0, bytes), strata::invalid_operation);
        EXPECT_THROW(target->read_bytes(0, bytes), strata::invalid_operation);
    };
    s->transfer_to(strata::residency::device);
    resource->on_copy = nullptr;

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(s->residency(), strata::residency::device);
    EXPECT_NO_THROW(s->transfer_to(strata::residency::host));
}

TEST_F(StorageTest, discard_write_mapping)
{
    auto s = strata::storage::allocate(resource, 4, strata::residency::host_and_device);
    {
        auto mapping = s->map_for_host(strata::access_mode::discard_write);
        EXPECT_EQ(mapping.access(), strata::access_mode::discard_write);
        auto data = mapping.writable_data();
        std::fill(data.begin(), data.end(), 3);
    }
    EXPECT_EQ(s->residency(), strata::residency::host_and_device);
    s->transfer_to(strata::residency::device);
    s->transfer_to(strata::residency::host);
    EXPECT_EQ(read_all(*s), (std::vector<uint8_t>{3, 3, 3, 3}));
}

TEST_F(StorageTest, fill_any_residency)
{
    auto s = strata::storage::allocate(resource, 8, strata::residency::device);
    std::array<uint8_t, 2> pattern{0xab, 0xcd};
    s->fill(pattern);
    s->transfer_to(strata::residency::host);
    EXPECT_EQ(read_all(*s), (std::vector<uint8_t>{0xab, 0xcd, 0xab, 0xcd, 0xab, 0xcd, 0xab, 0xcd}));

    std::array<uint8_t, 3> odd{1, 2, 3};
    EXPECT_THROW(s->fill(odd), strata::invalid_operation);
}

TEST_F(StorageTest, copy_between_storages)
{
    auto src = strata::storage::allocate(resource, 4, strata::residency::host);
    std::array<uint8_t, 4> bytes{1, 2, 3, 4};
    src->write_bytes(0, bytes);
    src->transfer_to(strata::residency::device);

    auto dst = strata::storage::allocate(resource, 4, strata::residency::host_and_device);
    dst->copy_from(*src);
    EXPECT_EQ(read_all(*dst), (std::vector<uint8_t>{1, 2, 3, 4}));
    dst->transfer_to(strata::residency::device);
    dst->transfer_to(strata::residency::host);
    EXPECT_EQ(read_all(*dst), (std::vector<uint8_t>{1, 2, 3, 4}));

    auto other = strata::storage::allocate(resource, 5, strata::residency::host);
    EXPECT_THROW(other->copy_from(*src), strata::invalid_operation);
}

TEST_F(StorageTest, to_string)
{
    auto s = strata::storage::allocate(resource, 12, strata::residency::device);
    EXPECT_EQ(s->to_string(), "storage(bytes=12, residency=device, leases=0, resource=fake_device)");
}
