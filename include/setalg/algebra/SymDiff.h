/***
 * Name: setalg::symdiff / setalg::symdiff_inplace
 * Purpose: Symmetric difference: elements found in an odd number of the arguments.
 * Inputs:
 *   - s: first collection; decides the output kind.
 *   - itrs: further collections. Each one counts as a set, so repeating an
 *     element inside one argument does not toggle it twice.
 * Outputs:
 *   - symdiff: a new collection of the promoted element type; for a sequence
 *     `s` the result keeps the order in which elements first appear across
 *     all arguments.
 *   - symdiff_inplace: the destination, overwritten with the result.
 * Theory of Operation:
 *   For each argument in turn (coerced to an auxiliary set when it is not
 *   set-like), every element present in the accumulator is removed and every
 *   absent one is inserted. Sequence destinations compute the surviving set
 *   first, then rebuild themselves in encounter order.
 */
#pragma once

#include "setalg/algebra/Filter.h"
#include "setalg/algebra/detail/Sequence.h"
#include "setalg/traits/Collection.h"
#include "setalg/traits/Primitives.h"
#include "setalg/traits/Promote.h"

namespace setalg {

template <SetLike S, Collection I>
S& symdiff_inplace(S& s, const I& itr) {
  if (detail::sameObject(s, itr)) {
    s.clear();
    return s;
  }
  if constexpr (SetLike<I>) {
    for (const auto& x : itr) {
      if (!erase_key(s, x)) { push(s, x); }
    }
    return s;
  } else {
    const auto aux = materialize(itr);
    return symdiff_inplace(s, aux);
  }
}

template <SetLike S, Collection... Is>
  requires(sizeof...(Is) != 1)
S& symdiff_inplace(S& s, const Is&... itrs) {
  (symdiff_inplace(s, itrs), ...);
  return s;
}

template <MutableSequence V, Collection... Is>
V& symdiff_inplace(V& v, const Is&... itrs) {
  using T = StoredElement<ElementOf<V>>;
  AuxSet<T> keep;
  symdiff_inplace(keep, v, itrs...);
  auto take = detail::takeOnceFrom<T>(keep);
  filter_inplace(take, v);
  (detail::growFrom(v, itrs, take), ...);
  return v;
}

template <Collection C, Collection... Is>
auto symdiff(const C& s, const Is&... itrs) {
  auto out = emptyMutable<PromotedElement<C, Is...>>(s);
  symdiff_inplace(out, s, itrs...);
  return out;
}

} // namespace setalg
