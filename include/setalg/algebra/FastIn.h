/***
 * Name: setalg fast-membership dispatch
 * Purpose: Decide whether repeated `x in b` tests should probe `b` directly
 *          or first copy `b` into an auxiliary set.
 * Inputs:
 *   - The membership target `b`.
 * Outputs:
 *   - MembershipStrategy::Direct or MembershipStrategy::Materialize.
 * Theory of Operation:
 *   Targets with fast membership are always probed directly. Other targets
 *   are materialized once they hold more than kFastInSetThreshold elements
 *   (or when their length is not known up front), provided their element
 *   type can be stored in an auxiliary set. This is a performance choice
 *   only; both strategies return the same answers.
 */
#pragma once

#include <cstddef>

#include "setalg/traits/Collection.h"
#include "setalg/traits/Primitives.h"
#include "setalg/traits/Promote.h"

namespace setalg {

// Empirically chosen; below it a linear scan beats building a hash set.
inline constexpr std::size_t kFastInSetThreshold = 70;

enum class MembershipStrategy { Direct, Materialize };

template <Collection B>
MembershipStrategy membershipStrategy(const B& b) {
  if constexpr (hasFastIn<B>() || !Materializable<StoredElement<ElementOf<B>>>) {
    return MembershipStrategy::Direct;
  } else if constexpr (HasLength<B>) {
    return length(b) > kFastInSetThreshold ? MembershipStrategy::Materialize : MembershipStrategy::Direct;
  } else {
    return MembershipStrategy::Materialize;
  }
}

namespace detail {

/*** withFastMembership: call `fn` with `b` itself or with an auxiliary set of `b`. */
template <Collection B, typename Fn>
decltype(auto) withFastMembership(const B& b, Fn&& fn) {
  if constexpr (hasFastIn<B>() || !Materializable<StoredElement<ElementOf<B>>>) {
    return fn(b);
  } else {
    if (membershipStrategy(b) == MembershipStrategy::Materialize) {
      const auto aux = materialize(b);
      return fn(aux);
    }
    return fn(b);
  }
}

} // namespace detail

} // namespace setalg
