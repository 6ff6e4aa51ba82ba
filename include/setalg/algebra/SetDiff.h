/***
 * Name: setalg::setdiff / setalg::setdiff_inplace
 * Purpose: Elements of a collection that appear in none of the further arguments.
 * Inputs:
 *   - s: source collection (left untouched by setdiff).
 *   - itrs: collections whose elements are removed.
 * Outputs:
 *   - setdiff: a copy of a set-like `s` minus the arguments, or a vector of
 *     the surviving elements of `s` in order without duplicates.
 *   - setdiff_inplace: the destination with the elements removed.
 * Theory of Operation: One argument at a time, each element is deleted from
 *   the destination; deleting an absent element is a no-op.
 */
#pragma once

#include <vector>

#include "setalg/algebra/detail/Sequence.h"
#include "setalg/traits/Collection.h"
#include "setalg/traits/Primitives.h"
#include "setalg/traits/Promote.h"

namespace setalg {

template <SetLike S, Collection I>
S& setdiff_inplace(S& s, const I& itr) {
  if (detail::sameObject(s, itr)) {
    s.clear();
    return s;
  }
  for (const auto& x : itr) { erase_key(s, x); }
  return s;
}

template <SetLike S, Collection... Is>
  requires(sizeof...(Is) != 1)
S& setdiff_inplace(S& s, const Is&... itrs) {
  (setdiff_inplace(s, itrs), ...);
  return s;
}

template <MutableSequence V, Collection... Is>
V& setdiff_inplace(V& v, const Is&... itrs) {
  return detail::shrinkInPlace(v, [&itrs...](auto& seen) { setdiff_inplace(seen, itrs...); });
}

template <SetLike S, Collection... Is>
S setdiff(const S& s, const Is&... itrs) {
  auto out = copyMutable(s);
  setdiff_inplace(out, itrs...);
  return out;
}

template <Collection C, Collection... Is>
  requires(!SetLike<C>)
std::vector<PromotedElement<C, Is...>> setdiff(const C& s, const Is&... itrs) {
  using T = PromotedElement<C, Is...>;
  auto keep = materializeAs<T>(s);
  setdiff_inplace(keep, itrs...);
  return detail::emitKept<T>(s, keep);
}

} // namespace setalg
