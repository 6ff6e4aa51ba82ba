/***
 * Name: setalg primitives (capability interface)
 * Purpose: The container operations the set-algebra engine consumes:
 *          length, membership, insertion, deletion and size hints.
 * Inputs:
 *   - Collections classified by setalg/traits/Collection.h
 * Outputs:
 *   - length(), contains(), push(), erase_key(), sizehint(), materialize()
 * Theory of Operation:
 *   Each primitive dispatches on the collection kind with if constexpr.
 *   Keyed lookups first check that the probe converts to the key type without
 *   loss (2.5 must not find 2 in a set of int); probes that cannot be keyed
 *   fall back to an equality scan.
 */
#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <ranges>
#include <type_traits>
#include <vector>

#include "setalg/exceptions/conversion_error.h"
#include "setalg/traits/Collection.h"
#include "setalg/traits/Promote.h"

namespace setalg {

template <Collection C>
std::size_t length(const C& c) {
  if constexpr (HasLength<C>) {
    return static_cast<std::size_t>(std::ranges::size(c));
  } else {
    return static_cast<std::size_t>(std::ranges::distance(c));
  }
}

namespace detail {

// Convert `x` to Key only when the conversion round-trips exactly.
template <typename Key, typename X>
std::optional<Key> exactKey(const X& x) {
  if constexpr (std::is_same_v<Key, X> || std::is_same_v<Key, StoredElement<X>>) {
    return Key(x);
  } else if constexpr (std::is_arithmetic_v<Key> && std::is_arithmetic_v<X>) {
    if constexpr (std::is_floating_point_v<X> && std::is_integral_v<Key>) {
      const auto lo = static_cast<long double>(std::numeric_limits<Key>::lowest());
      const auto hi = static_cast<long double>(std::numeric_limits<Key>::max()) + 1.0L;
      const auto wide = static_cast<long double>(x);
      if (!(wide >= lo && wide < hi)) { return std::nullopt; }
    }
    if constexpr (std::is_integral_v<X> && std::is_integral_v<Key>) {
      if ((x < X{}) && !std::numeric_limits<Key>::is_signed) { return std::nullopt; }
    }
    const auto key = static_cast<Key>(x);
    if constexpr (std::is_integral_v<X> && std::is_integral_v<Key>) {
      if (static_cast<X>(key) != x || ((key < Key{}) != (x < X{}))) { return std::nullopt; }
    } else {
      if (static_cast<long double>(key) != static_cast<long double>(x)) { return std::nullopt; }
    }
    return key;
  } else if constexpr (std::is_constructible_v<Key, const X&> && std::equality_comparable_with<Key, X>) {
    Key key(x);
    if (!(key == x)) { return std::nullopt; }
    return key;
  } else {
    return std::nullopt;
  }
}

template <typename Key, typename X>
inline constexpr bool kKeyable = std::is_same_v<Key, X> || std::is_same_v<Key, StoredElement<X>> ||
    (std::is_arithmetic_v<Key> && std::is_arithmetic_v<X>) ||
    (std::is_constructible_v<Key, const X&> && std::equality_comparable_with<Key, X>);

// Element `x` as a T for storage. Integral destinations reject values that do
// not survive the conversion; floating and class destinations convert as usual.
template <typename T, typename X>
T storable(const X& x) {
  if constexpr (std::is_integral_v<T> && std::is_arithmetic_v<X> && !std::is_same_v<T, X>) {
    const auto key = exactKey<T>(x);
    if (!key) {
      std::ostringstream text;
      text << "element " << +x << " does not fit the destination element type exactly";
      throw exceptions::ConversionError(text.str());
    }
    return *key;
  } else {
    return static_cast<T>(x);
  }
}

template <Collection C, typename X>
bool scanFor(const C& c, const X& x) {
  if constexpr (std::equality_comparable_with<ElementOf<C>, X>) {
    return std::ranges::any_of(c, [&x](const auto& elem) { return elem == x; });
  } else if constexpr (std::equality_comparable_with<ElementOf<C>, StoredElement<X>>) {
    const StoredElement<X> probe(x);
    return std::ranges::any_of(c, [&probe](const auto& elem) { return elem == probe; });
  } else {
    return false;
  }
}

} // namespace detail

/***
 * Name: setalg::contains
 * Purpose: Membership test `x in c` using the fastest lookup the kind offers.
 * Theory of Operation:
 *   set-like: keyed find; mapping-like: key find plus value comparison of a
 *   pair probe; types with a contains(x) member (StepRange): the member;
 *   otherwise a linear equality scan.
 */
template <Collection C, typename X>
bool contains(const C& c, const X& x) {
  using D = std::remove_cvref_t<C>;
  if constexpr (SetLike<D>) {
    using Key = typename D::key_type;
    if constexpr (detail::kKeyable<Key, X>) {
      const auto key = detail::exactKey<Key>(x);
      return key.has_value() && c.find(*key) != c.end();
    } else {
      return detail::scanFor(c, x);
    }
  } else if constexpr (MappingLike<D>) {
    using Key = typename D::key_type;
    if constexpr (requires { x.first; x.second; } && detail::kKeyable<Key, std::remove_cvref_t<decltype(x.first)>>) {
      const auto key = detail::exactKey<Key>(x.first);
      if (!key) { return false; }
      const auto it = c.find(*key);
      return it != c.end() && it->second == x.second;
    } else {
      return detail::scanFor(c, x);
    }
  } else if constexpr (requires { { c.contains(x) } -> std::convertible_to<bool>; }) {
    return c.contains(x);
  } else {
    return detail::scanFor(c, x);
  }
}

/***
 * push: insert into a set-like collection, append to a sequence.
 * Throws ConversionError when an integral destination cannot hold `x` exactly.
 */
template <typename C, typename X>
void push(C& c, const X& x) {
  using T = StoredElement<ElementOf<C>>;
  if constexpr (SetLike<C>) {
    c.insert(detail::storable<T>(x));
  } else {
    c.push_back(detail::storable<T>(x));
  }
}

/*** erase_key: delete `x` from a set-like collection if present; returns whether it was. */
template <SetLike C, typename X>
bool erase_key(C& c, const X& x) {
  using Key = typename C::key_type;
  if constexpr (detail::kKeyable<Key, X>) {
    const auto key = detail::exactKey<Key>(x);
    return key.has_value() && c.erase(*key) > 0;
  } else {
    return false;
  }
}

/*** sizehint: advisory capacity reservation; a no-op where the container has no reserve(). */
template <typename C>
C& sizehint(C& c, std::size_t n) {
  if constexpr (requires { c.reserve(n); }) {
    c.reserve(n);
  }
  return c;
}

/***
 * Name: setalg::materializeAs / materialize
 * Purpose: Build an auxiliary set holding the distinct elements of `c`.
 */
template <typename T, Collection C>
AuxSet<T> materializeAs(const C& c) {
  static_assert(Materializable<T>, "setalg: element type must be hashable or totally ordered");
  AuxSet<T> out;
  if constexpr (HasLength<C>) { sizehint(out, length(c)); }
  for (const auto& x : c) { out.insert(static_cast<T>(x)); }
  return out;
}

template <Collection C>
AuxSet<StoredElement<ElementOf<C>>> materialize(const C& c) {
  return materializeAs<StoredElement<ElementOf<C>>>(c);
}

/*** copyMutable: a mutable copy; set-like collections keep their type, others become a vector. */
template <Collection C>
auto copyMutable(const C& c) {
  if constexpr (SetLike<C>) {
    return std::remove_cvref_t<C>(c);
  } else {
    std::vector<StoredElement<ElementOf<C>>> out;
    if constexpr (HasLength<C>) { out.reserve(length(c)); }
    for (const auto& x : c) { out.push_back(x); }
    return out;
  }
}

namespace detail {

template <typename A, typename B>
bool sameObject(const A& a, const B& b) noexcept {
  if constexpr (std::is_same_v<std::remove_cvref_t<A>, std::remove_cvref_t<B>>) {
    return std::addressof(a) == std::addressof(b);
  } else {
    return false;
  }
}

} // namespace detail

} // namespace setalg
