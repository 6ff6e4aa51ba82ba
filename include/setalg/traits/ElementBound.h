/***
 * Name: setalg::maxValues (element bound)
 * Purpose: Upper bound on the number of distinct values an element type can take.
 * Inputs:
 *   - An element type T.
 * Outputs:
 *   - std::size_t bound; kUnboundedValues when T is not known to be bounded.
 * Theory of Operation:
 *   A recursive trait over a closed set of bounded kinds (bool, unit types,
 *   narrow integers, enums, variants, optionals). Sums of alternatives use
 *   saturating addition so the bound never wraps around.
 *   unite_inplace stops inserting once a set holds maxValues<T>() elements.
 */
#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <type_traits>
#include <variant>

namespace setalg {

inline constexpr std::size_t kUnboundedValues = std::numeric_limits<std::size_t>::max();

constexpr std::size_t saturatingAdd(std::size_t lhs, std::size_t rhs) noexcept {
  return lhs > kUnboundedValues - rhs ? kUnboundedValues : lhs + rhs;
}

template <typename T>
struct MaxValues {
  static constexpr std::size_t value = kUnboundedValues;
};

template <typename T>
  requires(std::is_integral_v<T> && sizeof(T) < sizeof(std::size_t))
struct MaxValues<T> {
  static constexpr std::size_t value = std::size_t{1} << (8U * sizeof(T));
};

template <typename T>
  requires std::is_enum_v<T>
struct MaxValues<T> {
  static constexpr std::size_t value = MaxValues<std::underlying_type_t<T>>::value;
};

template <>
struct MaxValues<bool> {
  static constexpr std::size_t value = 2;
};

template <>
struct MaxValues<std::monostate> {
  static constexpr std::size_t value = 1;
};

template <>
struct MaxValues<std::nullptr_t> {
  static constexpr std::size_t value = 1;
};

template <typename... Ts>
struct MaxValues<std::variant<Ts...>> {
  static constexpr std::size_t value = [] {
    std::size_t total = 0;
    ((total = saturatingAdd(total, MaxValues<std::remove_cv_t<Ts>>::value)), ...);
    return total;
  }();
};

// optional<T> is T plus one empty state.
template <typename T>
struct MaxValues<std::optional<T>> {
  static constexpr std::size_t value = saturatingAdd(MaxValues<std::remove_cv_t<T>>::value, 1);
};

template <typename T>
constexpr std::size_t maxValues() noexcept {
  return MaxValues<std::remove_cv_t<T>>::value;
}

} // namespace setalg
