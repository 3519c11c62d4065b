#pragma once

#include <type_traits>

namespace streamavg {

/**
 * @brief Capability trait describing a numeric kind an Accumulator can hold.
 *
 * Specializations provide:
 * - `is_specialized` : true for every supported kind
 * - `is_signed`      : whether the kind can legitimately carry negative values
 * - `to_double(x)`   : conversion of a value to `double`
 *
 * The primary template covers every built-in arithmetic type. User types
 * opt in by specializing it, the same way `std::numeric_limits` is extended.
 */
template <typename T, typename = void>
struct numeric_kind {
    static constexpr bool is_specialized = false;
};

template <typename T>
struct numeric_kind<T, std::enable_if_t<std::is_arithmetic_v<T> && !std::is_same_v<T, bool>>> {
    static constexpr bool is_specialized = true;
    static constexpr bool is_signed = std::is_signed_v<T>;

    static constexpr double to_double(T x) noexcept { return static_cast<double>(x); }
};

template <typename T>
inline constexpr bool is_numeric_kind_v = numeric_kind<T>::is_specialized;

}  // namespace streamavg
