#include "dtype.hpp"

#include <base/base.hpp>

#include <mutex>
#include <string>
#include <unordered_set>

namespace strata {

namespace {

/// Names of registered dtypes live until process exit, so dtype values never outlive their name.
std::string_view intern_name(std::string_view name)
{
    static std::mutex mutex;
    static std::unordered_set<std::string> names;
    std::lock_guard lock(mutex);
    return *names.emplace(name).first;
}

} // namespace

std::string_view dtype_kind_to_str(dtype_kind k)
{
    switch (k) {
    case dtype_kind::boolean:
        return "boolean";
    case dtype_kind::signless_integer:
        return "signless_integer";
    case dtype_kind::signed_integer:
        return "signed_integer";
    case dtype_kind::unsigned_integer:
        return "unsigned_integer";
    case dtype_kind::floating:
        return "floating";
    case dtype_kind::complex:
        return "complex";
    case dtype_kind::opaque:
        return "opaque";
    case dtype_kind::block_quantized:
        return "block_quantized";
    }
    ASSERT_MESSAGE(false, "Unknown dtype kind");
    return "unknown";
}

uint64_t dtype::dense_byte_count(int64_t count) const
{
    if (count < 0) {
        throw invalid_shape(fmt::format("Element count {} of dtype {} is negative.", count, name_));
    }
    auto c = static_cast<uint64_t>(count);
    if (is_block()) {
        if (c % group_size_ != 0) {
            throw invalid_packing(name_, count, group_size_);
        }
        return c / group_size_ * (bit_count_ / 8);
    }
    return (c * bit_count_ + 7) / 8;
}

dtype_registry dtype_registry::create_default()
{
    dtype_registry r;
#define STRATA_DTYPE(id, kind, bits, group) r.register_dtype(dtypes::id);
#include "dtypes.inl"
#undef STRATA_DTYPE
    base::log_debug(base::log_channel::dtype, "Registered {} built-in dtypes", r.size());
    return r;
}

const dtype& dtype_registry::register_dtype(const dtype& d)
{
    if (contains(d.name())) {
        throw invalid_operation(fmt::format("dtype {} is already registered", d.name()));
    }
    if (d.bit_count() == 0 || d.group_size() == 0 || (d.is_block() && d.bit_count() % 8 != 0)) {
        throw invalid_packing(fmt::format(
            "dtype {} has an invalid layout of {} bits per {} element(s)", d.name(), d.bit_count(), d.group_size()));
    }
    const auto& entry = entries_.emplace_back(intern_name(d.name()), d.kind(), d.bit_count(), d.group_size());
    index_.emplace(entry.name(), &entry);
    return entry;
}

const dtype& dtype_registry::lookup(std::string_view name) const
{
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw unknown_dtype(name);
    }
    return *it->second;
}

bool dtype_registry::contains(std::string_view name) const
{
    return index_.contains(name);
}

} // namespace strata
