/***
 * Name: setalg::unite / setalg::unite_inplace
 * Purpose: Union of a collection with any number of further collections.
 * Inputs:
 *   - s: first collection; decides the output kind (set-like stays set-like,
 *        anything else produces a std::vector in first-occurrence order).
 *   - itrs: further collections, any kind.
 * Outputs:
 *   - unite: a new collection holding every distinct element, with the
 *     promoted element type of all arguments.
 *   - unite_inplace: the destination, overwritten with the union.
 * Theory of Operation:
 *   The immutable form builds an empty output of the promoted element type and
 *   delegates to the mutating form. Set-like destinations reserve capacity
 *   when the argument length is known and stop inserting once they hold every
 *   value the element type can represent (see maxValues). Sequence
 *   destinations are first made unique, then extended with unseen elements.
 *   Passing the destination as its own argument is a no-op.
 */
#pragma once

#include <cstddef>
#include <type_traits>

#include "setalg/algebra/Filter.h"
#include "setalg/algebra/detail/Sequence.h"
#include "setalg/traits/Collection.h"
#include "setalg/traits/ElementBound.h"
#include "setalg/traits/Primitives.h"
#include "setalg/traits/Promote.h"

namespace setalg {

namespace detail {

template <SetLike S, Collection I>
void uniteOne(S& dst, const I& itr) {
  if (sameObject(dst, itr)) { return; }
  using T = StoredElement<ElementOf<S>>;
  constexpr std::size_t bound = maxValues<T>();
  if constexpr (HasLength<I>) { sizehint(dst, length(dst) + length(itr)); }
  for (const auto& x : itr) {
    push(dst, x);
    if (length(dst) == bound) { break; }
  }
}

} // namespace detail

template <SetLike S, Collection... Is>
S& unite_inplace(S& s, const Is&... itrs) {
  (detail::uniteOne(s, itrs), ...);
  return s;
}

template <MutableSequence V, Collection... Is>
V& unite_inplace(V& v, const Is&... itrs) {
  using T = StoredElement<ElementOf<V>>;
  AuxSet<T> seen;
  sizehint(seen, length(v));
  auto unseen = detail::firstSightingIn<T>(seen);
  filter_inplace(unseen, v);
  (detail::growFrom(v, itrs, unseen), ...);
  return v;
}

template <Collection C, Collection... Is>
auto unite(const C& s, const Is&... itrs) {
  if constexpr (SetLike<C> && sizeof...(Is) == 0) {
    return std::remove_cvref_t<C>(s);
  } else {
    using T = PromotedElement<C, Is...>;
    auto out = emptyMutable<T>(s);
    unite_inplace(out, s, itrs...);
    return out;
  }
}

/*** copy_into: overwrite the set-like `dst` with the elements of `src`. */
template <SetLike S, Collection C>
S& copy_into(S& dst, const C& src) {
  if (detail::sameObject(dst, src)) { return dst; }
  dst.clear();
  return unite_inplace(dst, src);
}

} // namespace setalg
