#pragma once

/**
 * @file exceptions.hpp
 * @brief Definitions of the exceptions for `strata` module.
 */

#include <base/exception.hpp>
#include <base/format.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace strata {

class exception : public base::exception
{
public:
    exception(std::string&& what, params_t&& params)
        : base::exception(std::move(what), std::move(params))
    {
    }

    explicit exception(std::string&& what)
        : base::exception(std::move(what))
    {
    }
};

class invalid_shape : public exception
{
public:
    explicit invalid_shape(std::string&& message)
        : exception(std::move(message))
    {
    }

    invalid_shape(std::string_view dims, int64_t axis, int64_t extent)
        : exception(fmt::format("Invalid shape {}: axis {} has extent {}.", dims, axis, extent),
                    params_t{{"axis", std::to_string(axis)}, {"extent", std::to_string(extent)}})
    {
    }
};

class shape_mismatch : public exception
{
public:
    explicit shape_mismatch(std::string&& message)
        : exception(std::move(message))
    {
    }

    shape_mismatch(std::string_view from, std::string_view to)
        : exception(fmt::format("Shapes {} and {} do not match.", from, to))
    {
    }
};

class not_contiguous : public exception
{
public:
    explicit not_contiguous(std::string_view operation)
        : exception(fmt::format("Operation '{}' requires a contiguous array.", operation),
                    params_t{{"operation", std::string(operation)}})
    {
    }
};

class out_of_bounds : public exception
{
public:
    explicit out_of_bounds(std::string&& message)
        : exception(std::move(message))
    {
    }

    out_of_bounds(int64_t axis, int64_t start, int64_t stop, int64_t extent)
        : exception(fmt::format("Range [{}, {}) is out of bounds for axis {} with extent {}.", start, stop, axis, extent),
                    params_t{{"axis", std::to_string(axis)}})
    {
    }
};

class invalid_permutation : public exception
{
public:
    invalid_permutation(std::string_view permutation, int64_t rank)
        : exception(fmt::format("{} is not a permutation of {} axes.", permutation, rank))
    {
    }
};

class incompatible_cast : public exception
{
public:
    incompatible_cast(std::string_view from, std::string_view to, std::string_view reason)
        : exception(fmt::format("Cannot reinterpret {} as {}: {}.", from, to, reason),
                    params_t{{"from", std::string(from)}, {"to", std::string(to)}})
    {
    }
};

class unknown_dtype : public exception
{
public:
    explicit unknown_dtype(std::string_view name)
        : exception(fmt::format("Unknown dtype: {}", name), params_t{{"dtype", std::string(name)}})
    {
    }
};

class invalid_packing : public exception
{
public:
    explicit invalid_packing(std::string&& message)
        : exception(std::move(message))
    {
    }

    invalid_packing(std::string_view dtype, int64_t count, int64_t group_size)
        : exception(fmt::format("{} elements do not fill whole {}-element groups of dtype {}.", count, group_size, dtype),
                    params_t{{"dtype", std::string(dtype)}})
    {
    }
};

class allocation_failed : public exception
{
public:
    allocation_failed(std::string_view resource, uint64_t bytes, std::string_view reason)
        : exception(fmt::format("Memory resource '{}' failed to allocate {} bytes: {}", resource, bytes, reason),
                    params_t{{"resource", std::string(resource)}, {"bytes", std::to_string(bytes)}})
    {
    }
};

class transfer_failed : public exception
{
public:
    explicit transfer_failed(std::string&& message)
        : exception(std::move(message))
    {
    }
};

/**
 * @brief Raised when a transfer is requested while host mappings of the storage are open.
 */
class storage_leased : public transfer_failed
{
public:
    explicit storage_leased(uint32_t leases)
        : transfer_failed(fmt::format("Storage has {} open host mapping(s); it can't be transferred.", leases))
    {
    }
};

class wrong_residency : public exception
{
public:
    wrong_residency(std::string_view operation, std::string_view residency)
        : exception(fmt::format("Operation '{}' is not possible for storage resident on {}.", operation, residency),
                    params_t{{"operation", std::string(operation)}, {"residency", std::string(residency)}})
    {
    }
};

class invalid_operation : public exception
{
public:
    explicit invalid_operation(const std::string& what)
        : exception(std::string("Invalid Operation: ") + what)
    {
    }
};

} // namespace strata
