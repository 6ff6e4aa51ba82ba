/***
 * Name: setalg filtering
 * Purpose: Select elements of a collection by predicate, into a new collection
 *          or in place.
 * Inputs:
 *   - A predicate over elements and a collection.
 * Outputs:
 *   - filter: a new collection of the same kind (vector for sequences).
 *   - filter_inplace: the argument, with failing elements removed.
 * Theory of Operation:
 *   Set-like collections are filtered through the iterator returned by
 *   erase(), so removing the element being visited never disturbs the walk.
 *   Sequences are compacted in order; the predicate sees every element once,
 *   front to back, which the sequence helpers rely on for stateful predicates.
 */
#pragma once

#include <iterator>
#include <utility>

#include "setalg/traits/Collection.h"
#include "setalg/traits/Primitives.h"
#include "setalg/traits/Promote.h"

namespace setalg {

struct PushFn {
  template <typename C, typename X>
  void operator()(C& c, const X& x) const { push(c, x); }
};

struct EraseFn {
  template <typename C, typename X>
  void operator()(C& c, const X& x) const { erase_key(c, x); }
};

/***
 * Name: setalg::mapfilter
 * Purpose: Apply `f(res, x)` to every `x` of `itr` for which `pred(x)` holds.
 */
template <typename Pred, typename F, Collection I, typename Res>
Res& mapfilter(Pred&& pred, F&& f, const I& itr, Res& res) {
  for (const auto& x : itr) {
    if (pred(x)) { f(res, x); }
  }
  return res;
}

template <typename Pred, Collection C>
auto filter(Pred&& pred, const C& s) {
  auto out = emptyMutable<StoredElement<ElementOf<C>>>(s);
  mapfilter(std::forward<Pred>(pred), PushFn{}, s, out);
  return out;
}

template <typename Pred, SetLike S>
S& filter_inplace(Pred&& pred, S& s) {
  for (auto it = s.begin(); it != s.end();) {
    if (pred(*it)) {
      ++it;
    } else {
      it = s.erase(it);
    }
  }
  return s;
}

template <typename Pred, MutableSequence V>
V& filter_inplace(Pred&& pred, V& v) {
  auto out = v.begin();
  for (auto it = v.begin(); it != v.end(); ++it) {
    if (!pred(*it)) { continue; }
    if (out != it) { *out = std::move(*it); }
    ++out;
  }
  v.erase(out, v.end());
  return v;
}

} // namespace setalg
