/***
 * Name: setalg::intersect / setalg::intersect_inplace
 * Purpose: Elements common to a collection and every further argument.
 * Inputs:
 *   - s: first collection; decides the output kind.
 *   - itr, itrs: further collections, any kind.
 * Outputs:
 *   - intersect: new collection of the promoted element type. Set-like `s`
 *     gives a set; any other `s` gives a vector in the order elements first
 *     appear in `s`, without duplicates.
 *   - intersect_inplace: the destination, reduced to the intersection.
 * Theory of Operation:
 *   With one argument, the shorter side is iterated and probed against the
 *   longer one when the longer one has fast membership. With several
 *   arguments and a large `s`, the shortest argument is intersected first so
 *   the working set shrinks as early as possible; the rest are folded in
 *   their original order. In place, a set-like destination is filtered
 *   against the argument, which is first copied into an auxiliary set when
 *   probing it directly would be linear.
 */
#pragma once

#include <array>
#include <cstddef>
#include <tuple>
#include <vector>

#include "setalg/algebra/Filter.h"
#include "setalg/algebra/Union.h"
#include "setalg/algebra/detail/Sequence.h"
#include "setalg/traits/Collection.h"
#include "setalg/traits/Primitives.h"
#include "setalg/traits/Promote.h"

namespace setalg {

// Below this size of `s` the argument order of intersect(s, itr, itrs...) is kept as given.
inline constexpr std::size_t kIntersectReorderThreshold = 50;

namespace detail {

// Push into `out` the elements common to the set-like `s` and `itr`.
template <typename Out, SetLike S, Collection I>
void intersectInto(Out& out, const S& s, const I& itr) {
  if constexpr (HasLength<I> && hasFastIn<I>()) {
    if (length(s) < length(itr)) {
      mapfilter([&itr](const auto& x) { return contains(itr, x); }, PushFn{}, s, out);
      return;
    }
  }
  mapfilter([&s](const auto& x) { return contains(s, x); }, PushFn{}, itr, out);
}

// Position of the argument to intersect first; ties keep the earliest argument.
template <Collection... Is>
std::size_t leadingIndex(std::size_t sLength, const Is&... itrs) {
  if constexpr ((HasLength<Is> && ...)) {
    if (sLength > kIntersectReorderThreshold) {
      const std::array<std::size_t, sizeof...(Is)> lengths{length(itrs)...};
      std::size_t shortest = 1;
      for (std::size_t i = 2; i < lengths.size(); ++i) {
        if (lengths[i] < lengths[shortest]) { shortest = i; }
      }
      if (lengths[0] > lengths[shortest]) { return shortest; }
    }
  }
  return 0;
}

} // namespace detail

template <SetLike S, Collection I>
S& intersect_inplace(S& s, const I& itr) {
  if (detail::sameObject(s, itr)) { return s; }
  if constexpr (SetLike<I> || hasFastIn<I>() || !Materializable<StoredElement<ElementOf<I>>>) {
    return filter_inplace([&itr](const auto& x) { return contains(itr, x); }, s);
  } else {
    const auto aux = materialize(itr);
    return filter_inplace([&aux](const auto& x) { return contains(aux, x); }, s);
  }
}

template <SetLike S, Collection... Is>
  requires(sizeof...(Is) != 1)
S& intersect_inplace(S& s, const Is&... itrs) {
  (intersect_inplace(s, itrs), ...);
  return s;
}

template <MutableSequence V, Collection... Is>
V& intersect_inplace(V& v, const Is&... itrs) {
  return detail::shrinkInPlace(v, [&itrs...](auto& seen) { intersect_inplace(seen, itrs...); });
}

template <SetLike S>
S intersect(const S& s) {
  return unite(s);
}

template <SetLike S, Collection I>
auto intersect(const S& s, const I& itr) {
  auto out = emptyMutable<PromotedElement<S, I>>(s);
  detail::intersectInto(out, s, itr);
  return out;
}

template <SetLike S, Collection I, Collection... Is>
  requires(sizeof...(Is) > 0)
auto intersect(const S& s, const I& itr, const Is&... itrs) {
  auto out = emptyMutable<PromotedElement<S, I, Is...>>(s);
  auto args = std::forward_as_tuple(itr, itrs...);
  const std::size_t lead = detail::leadingIndex(length(s), itr, itrs...);
  detail::applyAt(args, lead, [&out, &s](const auto& first) { detail::intersectInto(out, s, first); });
  detail::applyExcept(args, lead, [&out](const auto& rest) { intersect_inplace(out, rest); });
  return out;
}

template <Collection C, Collection... Is>
  requires(!SetLike<C>)
std::vector<PromotedElement<C, Is...>> intersect(const C& s, const Is&... itrs) {
  using T = PromotedElement<C, Is...>;
  auto keep = materializeAs<T>(s);
  intersect_inplace(keep, itrs...);
  return detail::emitKept<T>(s, keep);
}

} // namespace setalg
