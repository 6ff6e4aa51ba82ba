/***
 * Name: setalg::isdisjoint
 * Purpose: True when two collections share no element.
 * Inputs:
 *   - a, b: collections of any kind.
 * Outputs:
 *   - bool; isdisjoint(x) returns a Fix2 predicate `y -> isdisjoint(y, x)`.
 * Theory of Operation:
 *   The shorter side (when both lengths are known) is iterated and the other
 *   is probed. The probed side is whichever has fast membership; when
 *   neither does, it is used directly up to kFastInSetThreshold elements and
 *   copied into an auxiliary set beyond that.
 *   Two integral StepRanges with the same step magnitude whose bounds
 *   overlap intersect exactly when their starts are congruent modulo the
 *   step, which is decided in O(1).
 */
#pragma once

#include <algorithm>
#include <cstdint>
#include <type_traits>
#include <utility>

#include "setalg/algebra/FastIn.h"
#include "setalg/algebra/Fix2.h"
#include "setalg/range/StepRange.h"
#include "setalg/traits/Collection.h"
#include "setalg/traits/Primitives.h"

namespace setalg {

namespace detail {

template <Collection A, Collection B>
bool noneIn(const A& a, const B& b) {
  return std::ranges::none_of(a, [&b](const auto& x) { return contains(b, x); });
}

// Iterate `a`, probe `b` unless only `a` has fast membership.
template <Collection A, Collection B>
bool disjointScan(const A& a, const B& b) {
  if constexpr (hasFastIn<B>()) {
    return noneIn(a, b);
  } else if constexpr (hasFastIn<A>()) {
    return noneIn(b, a);
  } else {
    return withFastMembership(b, [&a](const auto& probe) { return noneIn(a, probe); });
  }
}

template <Collection A, Collection B>
bool isdisjointGeneric(const A& a, const B& b) {
  if constexpr (HasLength<A> && HasLength<B>) {
    if (length(b) < length(a)) { return disjointScan(b, a); }
  }
  return disjointScan(a, b);
}

// x and y are congruent modulo m; the difference is taken without overflow.
template <typename T>
bool congruent(T x, T y, std::uintmax_t m) noexcept {
  using U = std::uintmax_t;
  const U diff = x >= y ? static_cast<U>(x) - static_cast<U>(y) : static_cast<U>(y) - static_cast<U>(x);
  return diff % m == 0;
}

} // namespace detail

template <Collection A, Collection B>
bool isdisjoint(const A& a, const B& b) {
  return detail::isdisjointGeneric(a, b);
}

template <typename T>
bool isdisjoint(const StepRange<T>& a, const StepRange<T>& b) {
  if (a.empty() || b.empty()) { return true; }
  if (a.maximum() < b.minimum() || b.maximum() < a.minimum()) { return true; }
  if constexpr (std::is_integral_v<T>) {
    if (a.magnitude() == b.magnitude()) { return !detail::congruent(a.minimum(), b.minimum(), a.magnitude()); }
  }
  return detail::isdisjointGeneric(a, b);
}

struct IsDisjointFn {
  template <Collection A, Collection B>
  bool operator()(const A& a, const B& b) const { return isdisjoint(a, b); }
};

template <typename X>
auto isdisjoint(X&& x) {
  return fix2(IsDisjointFn{}, std::forward<X>(x));
}

} // namespace setalg
