/***
 * Name: setalg::issetequal
 * Purpose: True when two collections hold the same distinct elements,
 *          ignoring order and multiplicity.
 * Theory of Operation:
 *   Both sides are brought to set-like form before comparing with set_equal.
 *   A sequence compared against a set is rejected without a scan when it
 *   has fewer elements than the set has distinct ones. Between two
 *   sequences, the side with a known length is kept and the other side is
 *   materialized.
 */
#pragma once

#include <utility>

#include "setalg/algebra/Fix2.h"
#include "setalg/algebra/Ordering.h"
#include "setalg/traits/Collection.h"
#include "setalg/traits/Primitives.h"

namespace setalg {

template <Collection A, Collection B>
bool issetequal(const A& a, const B& b) {
  if constexpr (SetLike<A> && SetLike<B>) {
    return set_equal(a, b);
  } else if constexpr (SetLike<A>) {
    return set_equal(a, materialize(b));
  } else if constexpr (SetLike<B>) {
    if constexpr (HasLength<A>) {
      if (length(a) < length(b)) { return false; }
    }
    return set_equal(materialize(a), b);
  } else if constexpr (HasLength<A>) {
    return issetequal(a, materialize(b));
  } else if constexpr (HasLength<B>) {
    return issetequal(b, materialize(a));
  } else {
    return set_equal(materialize(a), materialize(b));
  }
}

struct IsSetEqualFn {
  template <Collection A, Collection B>
  bool operator()(const A& a, const B& b) const { return issetequal(a, b); }
};

template <typename X>
auto issetequal(X&& x) {
  return fix2(IsSetEqualFn{}, std::forward<X>(x));
}

} // namespace setalg
