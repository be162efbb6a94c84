#pragma once

namespace base {

/**
 * @brief Combines several lambdas into one callable, used with `std::visit` to handle every variant alternative.
 */
template <typename... Ts>
struct overloads : Ts...
{
    using Ts::operator()...;
};

template <typename... Ts>
overloads(Ts...) -> overloads<Ts...>;

/**
 * @brief Helper for `static_assert` in the fallthrough branch of an exhaustive `if constexpr` visitor.
 */
template <typename>
inline constexpr bool always_false_v = false;

} // namespace base
