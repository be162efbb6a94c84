#include "fake_device_resource.hpp"

#include <strata/array.hpp>

#include <gtest/gtest.h>

#include <complex>
#include <numeric>
#include <vector>

class ArrayTest : public ::testing::Test
{
protected:
    strata::array make_float_2x3()
    {
        auto a = strata::array::for_host(host, strata::dtypes::float32, strata::dims::make({2, 3}));
        a.write<float>({1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f});
        return a;
    }

    std::shared_ptr<strata::host_memory_resource> host = std::make_shared<strata::host_memory_resource>();
    std::shared_ptr<fake_device_resource> device = std::make_shared<fake_device_resource>();
};

TEST_F(ArrayTest, allocate_needs_concrete_dims)
{
    auto partial = strata::dims::make_partial({2, strata::dims::dynamic_extent});
    EXPECT_THROW(strata::array::for_host(host, strata::dtypes::float32, partial), strata::invalid_shape);
    EXPECT_THROW(strata::array::for_device(device, strata::dtypes::float32, partial), strata::invalid_shape);
    EXPECT_EQ(device->allocations, 0);

    auto bound = strata::array::for_host(host, strata::dtypes::float32, partial.bind(strata::dims::make({2, 5})));
    EXPECT_EQ(bound.dims(), strata::dims::make({2, 5}));
    EXPECT_EQ(host->bytes_in_use(), 40u);
}

TEST_F(ArrayTest, unit_axes_keep_exact_stride_contiguity)
{
    auto column = strata::array::for_host(host, strata::dtypes::float32, strata::dims::make({3, 1}));
    auto row = column.transpose();
    EXPECT_EQ(row.dims(), strata::dims::make({1, 3}));
    EXPECT_EQ(row.strides()[0], 4);
    EXPECT_EQ(row.strides()[1], 4);
    EXPECT_FALSE(row.is_contiguous());
    EXPECT_THROW(row.reshape({3}), strata::not_contiguous);
    EXPECT_EQ(row.clone().reshape({3}).dims(), strata::dims::make({3}));
}

TEST_F(ArrayTest, allocate_dense)
{
    auto a = strata::array::for_host(host, strata::dtypes::float32, strata::dims::make({2, 3}));
    EXPECT_EQ(a.dtype(), strata::dtypes::float32);
    EXPECT_EQ(a.dims(), strata::dims::make({2, 3}));
    EXPECT_EQ(a.element_count(), 6);
    EXPECT_EQ(a.byte_size(), 24u);
    EXPECT_EQ(a.byte_offset(), 0u);
    ASSERT_EQ(a.strides().size(), 2u);
    EXPECT_EQ(a.strides()[0], 12);
    EXPECT_EQ(a.strides()[1], 4);
    EXPECT_TRUE(a.is_contiguous());
    EXPECT_EQ(a.residency(), strata::residency::host);
    EXPECT_EQ(a.storage()->byte_length(), 24u);
}

TEST_F(ArrayTest, row_view_clone)
{
    auto a = make_float_2x3();
    auto row = a.view({{1, 2}});
    EXPECT_EQ(row.dims(), strata::dims::make({1, 3}));
    EXPECT_EQ(row.byte_offset(), 12u);
    EXPECT_EQ(row.storage(), a.storage());

    auto c = row.clone();
    EXPECT_EQ(c.dims(), strata::dims::make({1, 3}));
    EXPECT_EQ(c.read<float>(), (std::vector<float>{4.0f, 5.0f, 6.0f}));
    EXPECT_NE(c.storage(), a.storage());
    EXPECT_EQ(c.byte_offset(), 0u);

    c.write<float>({0.0f, 0.0f, 0.0f});
    EXPECT_EQ(a.read<float>(), (std::vector<float>{1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f}));
}

TEST_F(ArrayTest, full_view_clone_matches_clone)
{
    auto a = strata::array::for_host(host, strata::dtypes::sint32, strata::dims::make({3, 4}));
    std::vector<int32_t> values(12);
    std::iota(values.begin(), values.end(), -5);
    a.write<int32_t>(values);

    auto from_view = a.view({{0, 3}, {0, 4}}).clone();
    auto direct = a.clone();
    EXPECT_EQ(from_view.dims(), direct.dims());
    EXPECT_EQ(from_view.read_bytes(), direct.read_bytes());
    EXPECT_EQ(direct.read<int32_t>(), values);
}

TEST_F(ArrayTest, view_bounds)
{
    auto a = make_float_2x3();
    EXPECT_THROW(a.view({{0, 3}}), strata::out_of_bounds);
    EXPECT_THROW(a.view({{2, 1}}), strata::out_of_bounds);
    EXPECT_THROW(a.view({{-1, 1}}), strata::out_of_bounds);
    EXPECT_THROW(a.view({{0, 1}, {0, 1}, {0, 1}}), strata::out_of_bounds);

    auto empty = a.view({{2, 2}});
    EXPECT_EQ(empty.element_count(), 0);
    EXPECT_TRUE(empty.read_bytes().empty());
}

TEST_F(ArrayTest, view_writes_alias_storage)
{
    auto a = make_float_2x3();
    auto column = a.view({{0, 2}, {1, 2}});
    EXPECT_EQ(column.dims(), strata::dims::make({2, 1}));
    EXPECT_FALSE(column.is_contiguous());
    column.write<float>({10.0f, 20.0f});
    EXPECT_EQ(a.read<float>(), (std::vector<float>{1.0f, 10.0f, 3.0f, 4.0f, 20.0f, 6.0f}));
    EXPECT_EQ(column.read<float>(), (std::vector<float>{10.0f, 20.0f}));
}

TEST_F(ArrayTest, reshape_round_trip)
{
    auto a = make_float_2x3();
    auto reshaped = a.reshape({3, 2});
    EXPECT_EQ(reshaped.dims(), strata::dims::make({3, 2}));
    EXPECT_EQ(reshaped.storage(), a.storage());

    auto back = reshaped.reshape({2, 3});
    EXPECT_EQ(back.dims(), a.dims());
    EXPECT_EQ(back.strides(), a.strides());
    EXPECT_EQ(back.byte_offset(), a.byte_offset());
    EXPECT_EQ(back.read_bytes(), a.read_bytes());

    EXPECT_EQ(a.reshape({6}).read<float>(), a.read<float>());
    EXPECT_THROW(a.reshape({4, 2}), strata::shape_mismatch);
    EXPECT_THROW(a.reshape({-6}), strata::invalid_shape);
}

TEST_F(ArrayTest, transpose)
{
    auto a = make_float_2x3();
    auto t = a.transpose();
    EXPECT_EQ(t.dims(), strata::dims::make({3, 2}));
    EXPECT_EQ(t.strides()[0], 4);
    EXPECT_EQ(t.strides()[1], 12);
    EXPECT_FALSE(t.is_contiguous());
    EXPECT_EQ(t.storage(), a.storage());
    EXPECT_EQ(t.read<float>(), (std::vector<float>{1.0f, 4.0f, 2.0f, 5.0f, 3.0f, 6.0f}));
    EXPECT_EQ(t.item<float>({2, 1}), 6.0f);
    EXPECT_THROW(t.reshape({6}), strata::not_contiguous);

    auto c = t.clone();
    EXPECT_TRUE(c.is_contiguous());
    EXPECT_EQ(c.read<float>(), t.read<float>());

    EXPECT_EQ(t.transpose({1, 0}).read<float>(), a.read<float>());
}

TEST_F(ArrayTest, transpose_rank3_is_not_contiguous)
{
    auto a = strata::array::for_host(host, strata::dtypes::uint8, strata::dims::make({2, 3, 4}));
    for (auto permutation : std::vector<std::vector<int64_t>>{{0, 2, 1}, {1, 0, 2}, {2, 1, 0}, {1, 2, 0}}) {
        auto t = a.transpose(permutation);
        EXPECT_FALSE(t.is_contiguous());
    }
    EXPECT_TRUE(a.transpose({0, 1, 2}).is_contiguous());
}

TEST_F(ArrayTest, invalid_permutations)
{
    auto a = make_float_2x3();
    EXPECT_THROW(a.transpose({0, 0}), strata::invalid_permutation);
    EXPECT_THROW(a.transpose({0}), strata::invalid_permutation);
    EXPECT_THROW(a.transpose({0, 2}), strata::invalid_permutation);
    EXPECT_THROW(a.transpose({-1, 0}), strata::invalid_permutation);
}

TEST_F(ArrayTest, cast_view_same_width)
{
    auto a = make_float_2x3();
    auto bits = a.cast_view(strata::dtypes::uint32);
    EXPECT_EQ(bits.dims(), a.dims());
    EXPECT_EQ(bits.strides(), a.strides());
    EXPECT_EQ(bits.item<uint32_t>({0, 0}), 0x3f800000u);

    auto transposed = a.transpose().cast_view(strata::dtypes::sint32);
    EXPECT_EQ(transposed.strides(), a.transpose().strides());
}

TEST_F(ArrayTest, cast_view_changes_innermost_extent)
{
    auto a = make_float_2x3();
    EXPECT_EQ(a.cast_view(strata::dtypes::uint8).dims(), strata::dims::make({2, 12}));
    EXPECT_EQ(a.cast_view(strata::dtypes::float16).dims(), strata::dims::make({2, 6}));
    EXPECT_EQ(a.cast_view(strata::dtypes::int4).dims(), strata::dims::make({2, 24}));
    EXPECT_THROW(a.cast_view(strata::dtypes::float64), strata::incompatible_cast);
    EXPECT_THROW(a.transpose().cast_view(strata::dtypes::uint8), strata::incompatible_cast);

    auto pairs = strata::array::for_host(host, strata::dtypes::float32, strata::dims::make({2, 4}));
    auto complex = pairs.cast_view(strata::dtypes::complex64);
    EXPECT_EQ(complex.dims(), strata::dims::make({2, 2}));
    EXPECT_EQ(complex.strides()[0], 16);
}

TEST_F(ArrayTest, cast_view_to_block_type)
{
    auto raw = strata::array::for_host(host, strata::dtypes::uint8, strata::dims::make({3, 34}));
    auto blocks = raw.cast_view(strata::dtypes::q8_0);
    EXPECT_EQ(blocks.dims(), strata::dims::make({3, 32}));
    EXPECT_TRUE(blocks.strides().empty());
    EXPECT_EQ(blocks.byte_size(), raw.byte_size());
    EXPECT_EQ(blocks.cast_view(strata::dtypes::uint8).dims(), raw.dims());

    auto short_rows = strata::array::for_host(host, strata::dtypes::uint8, strata::dims::make({3, 30}));
    EXPECT_THROW(short_rows.cast_view(strata::dtypes::q8_0), strata::incompatible_cast);
}

TEST_F(ArrayTest, cast_view_scalar)
{
    auto s = strata::array::for_host(host, strata::dtypes::float32, strata::dims());
    EXPECT_EQ(s.cast_view(strata::dtypes::opaque32).dims(), strata::dims());
    EXPECT_THROW(s.cast_view(strata::dtypes::uint16), strata::incompatible_cast);
}

TEST_F(ArrayTest, cast_view_relabels_packed_types)
{
    auto a = strata::array::for_host(host, strata::dtypes::int4, strata::dims::make({3, 3}));
    std::vector<uint8_t> bytes{0x10, 0x32, 0x54, 0x76, 0x08};
    a.write_bytes(bytes);

    auto relabeled = a.cast_view(strata::dtypes::uint4);
    EXPECT_EQ(relabeled.dtype(), strata::dtypes::uint4);
    EXPECT_EQ(relabeled.dims(), a.dims());
    EXPECT_TRUE(relabeled.strides().empty());
    EXPECT_EQ(relabeled.storage(), a.storage());
    EXPECT_EQ(relabeled.read_bytes(), bytes);

    EXPECT_THROW(a.cast_view(strata::dtypes::uint8), strata::incompatible_cast);
}

TEST_F(ArrayTest, packed_arrays_are_dense)
{
    auto a = strata::array::for_host(host, strata::dtypes::uint4, strata::dims::make({2, 3}));
    EXPECT_EQ(a.byte_size(), 3u);
    EXPECT_TRUE(a.strides().empty());
    EXPECT_TRUE(a.is_contiguous());
    EXPECT_THROW(a.view({{0, 1}}), strata::invalid_packing);
    EXPECT_THROW(a.transpose(), strata::invalid_packing);

    std::vector<uint8_t> bytes{0x21, 0x43, 0x65};
    a.write_bytes(bytes);
    EXPECT_EQ(a.read_bytes(), bytes);
    EXPECT_EQ(a.reshape({3, 2}).read_bytes(), bytes);
    EXPECT_EQ(a.clone().read_bytes(), bytes);
    EXPECT_EQ(a.contents_to_string(), "<3 bytes of uint4: 21 43 65>");
    EXPECT_EQ(a.contents_to_string(2), "<3 bytes of uint4: 21 43 ...>");
}

TEST_F(ArrayTest, block_arrays_need_whole_blocks)
{
    EXPECT_THROW(strata::array::for_host(host, strata::dtypes::q4_0, strata::dims::make({2, 15})),
                 strata::invalid_packing);
    auto a = strata::array::for_host(host, strata::dtypes::q4_0, strata::dims::make({2, 32}));
    EXPECT_EQ(a.byte_size(), 36u);
}

TEST_F(ArrayTest, typed_access_errors)
{
    auto a = make_float_2x3();
    EXPECT_THROW(a.write<double>({1.0, 2.0, 3.0, 4.0, 5.0, 6.0}), strata::incompatible_cast);
    EXPECT_THROW(a.write<float>({1.0f, 2.0f}), strata::shape_mismatch);
    EXPECT_THROW(a.read<int32_t>(), strata::incompatible_cast);
    EXPECT_THROW(a.item<float>({2, 0}), strata::out_of_bounds);
    EXPECT_THROW(a.item<float>({0}), strata::out_of_bounds);
    EXPECT_EQ(a.item<float>({1, 2}), 6.0f);

    std::vector<uint8_t> wrong_size(23);
    EXPECT_THROW(a.write_bytes(wrong_size), strata::shape_mismatch);
}

TEST_F(ArrayTest, wrong_residency_write_leaves_bytes)
{
    auto a = strata::array::for_device(device, strata::dtypes::float32, strata::dims::make({2}));
    a.fill(1.5f);
    EXPECT_THROW(a.write<float>({9.0f, 9.0f}), strata::wrong_residency);
    EXPECT_THROW(a.read<float>(), strata::wrong_residency);
    EXPECT_THROW(a.item<float>({0}), strata::wrong_residency);
    EXPECT_THROW(a.view({{0, 1}}).fill(2.0f), strata::wrong_residency);

    a.transfer_to(strata::residency::host);
    EXPECT_EQ(a.read<float>(), (std::vector<float>{1.5f, 1.5f}));
}

TEST_F(ArrayTest, clone_keeps_residency_class)
{
    auto d = strata::array::for_device(device, strata::dtypes::sint16, strata::dims::make({4}));
    d.fill<int16_t>(7);
    auto dc = d.clone();
    EXPECT_EQ(dc.residency(), strata::residency::device);
    EXPECT_NE(dc.storage(), d.storage());

    auto hc = d.clone_to(strata::residency::host);
    EXPECT_EQ(hc.residency(), strata::residency::host);
    EXPECT_EQ(hc.read<int16_t>(), (std::vector<int16_t>{7, 7, 7, 7}));
    EXPECT_EQ(d.residency(), strata::residency::device);

    auto m = strata::array::allocate(device, strata::dtypes::sint16, strata::dims::make({4}),
                                     strata::residency::host_and_device);
    m.write<int16_t>({1, 2, 3, 4});
    auto mc = m.clone();
    EXPECT_EQ(mc.residency(), strata::residency::host_and_device);
    mc.transfer_to(strata::residency::device);
    mc.transfer_to(strata::residency::host);
    EXPECT_EQ(mc.read<int16_t>(), (std::vector<int16_t>{1, 2, 3, 4}));

    dc.transfer_to(strata::residency::host);
    EXPECT_EQ(dc.read<int16_t>(), (std::vector<int16_t>{7, 7, 7, 7}));
}

TEST_F(ArrayTest, mirrored_writes_reach_device)
{
    auto a = strata::array::allocate(device, strata::dtypes::float32, strata::dims::make({2, 2}),
                                     strata::residency::host_and_device);
    a.write<float>({1.0f, 2.0f, 3.0f, 4.0f});
    a.transpose().view({{1, 2}}).write<float>({8.0f, 9.0f});
    a.transfer_to(strata::residency::device);
    a.transfer_to(strata::residency::host);
    EXPECT_EQ(a.read<float>(), (std::vector<float>{1.0f, 8.0f, 3.0f, 9.0f}));
}

TEST_F(ArrayTest, storage_released_with_last_array)
{
    {
        auto a = strata::array::for_host(device, strata::dtypes::uint8, strata::dims::make({4, 4}));
        auto v = a.view({{1, 3}});
        auto r = a.reshape({16});
        auto t = a.transpose();
        auto c = a.cast_view(strata::dtypes::int8);
        EXPECT_EQ(a.storage()->use_count(), 5);
        {
            auto copy = v;
            EXPECT_EQ(a.storage()->use_count(), 6);
        }
        EXPECT_EQ(a.storage()->use_count(), 5);
        EXPECT_EQ(device->releases, 0);
    }
    EXPECT_EQ(device->allocations, 1);
    EXPECT_EQ(device->releases, 1);
}

TEST_F(ArrayTest, fill)
{
    auto a = make_float_2x3();
    a.fill(2.5f);
    a.view({{1, 2}}).fill(7.0f);
    EXPECT_EQ(a.read<float>(), (std::vector<float>{2.5f, 2.5f, 2.5f, 7.0f, 7.0f, 7.0f}));

    auto z = strata::array::for_host(host, strata::dtypes::complex128, strata::dims::make({2}));
    z.fill(std::complex<double>(1.0, -2.0));
    EXPECT_EQ(z.item<std::complex<double>>({1}), std::complex<double>(1.0, -2.0));
    EXPECT_THROW(z.fill(1.0f), strata::incompatible_cast);
}

TEST_F(ArrayTest, for_storage)
{
    auto s = strata::storage::allocate(host, 32, strata::residency::host);
    auto a = strata::array::for_storage(s, strata::dtypes::float32, strata::dims::make({2, 3}), 8);
    EXPECT_EQ(a.byte_offset(), 8u);
    EXPECT_THROW(strata::array::for_storage(s, strata::dtypes::float32, strata::dims::make({2, 3}), 12),
                 strata::out_of_bounds);

    auto strided = strata::array::for_storage(s, strata::dtypes::float32, strata::dims::make({2, 2}), 0, {16, 4});
    EXPECT_FALSE(strided.is_contiguous());
    EXPECT_THROW(strata::array::for_storage(s, strata::dtypes::float32, strata::dims::make({2, 2}), 0, {-4, 4}),
                 strata::invalid_shape);
    EXPECT_THROW(strata::array::for_storage(s, strata::dtypes::float32, strata::dims::make({2, 2}), 0, {32, 4}),
                 strata::out_of_bounds);
    EXPECT_THROW(strata::array::for_storage(s, strata::dtypes::int4, strata::dims::make({2}), 0, {1}),
                 strata::invalid_packing);
}

TEST_F(ArrayTest, contents_to_string)
{
    auto a = make_float_2x3();
    EXPECT_EQ(a.contents_to_string(), "[[1, 2, 3], [4, 5, 6]]");
    EXPECT_EQ(a.contents_to_string(4), "[[1, 2, 3], [4, ...]]");
    EXPECT_EQ(a.transpose().contents_to_string(), "[[1, 4], [2, 5], [3, 6]]");

    auto flags = strata::array::for_host(host, strata::dtypes::bool8, strata::dims::make({2}));
    flags.write<bool>({true, false});
    EXPECT_EQ(flags.contents_to_string(), "[true, false]");

    auto scalar = strata::array::for_host(host, strata::dtypes::float64, strata::dims());
    scalar.fill(3.5);
    EXPECT_EQ(scalar.contents_to_string(), "3.5");

    auto on_device = strata::array::for_device(device, strata::dtypes::float32, strata::dims::make({1}));
    EXPECT_THROW(on_device.contents_to_string(), strata::wrong_residency);
}

TEST_F(ArrayTest, to_string)
{
    auto a = make_float_2x3();
    EXPECT_EQ(a.to_string(),
              "array(dtype=float32, dims=[2, 3], byte_offset=0, strides=[12, 4], "
              "storage(bytes=24, residency=host, leases=0, resource=host))");
}
