/***
 * Name: setalg subset predicates
 * Purpose: issubset, issuperset, their strict forms and negations.
 * Inputs:
 *   - a, b: collections of any kind; elements compare by the membership
 *     rules of setalg::contains.
 * Outputs:
 *   - bool. The single-argument forms return a Fix2 predicate `y -> op(y, x)`.
 * Theory of Operation:
 *   issubset walks `a` and probes `b`, stopping at the first miss. When the
 *   length of `b` is known, a set-like `a` with more elements than `b` is
 *   rejected outright, and a `b` without fast membership holding more than
 *   kFastInSetThreshold elements is copied into an auxiliary set first.
 *   The strict forms compare lengths, so their non-set-like sides are
 *   materialized to count distinct elements.
 */
#pragma once

#include <algorithm>
#include <utility>

#include "setalg/algebra/FastIn.h"
#include "setalg/algebra/Fix2.h"
#include "setalg/traits/Collection.h"
#include "setalg/traits/Primitives.h"
#include "setalg/traits/Promote.h"

namespace setalg {

template <Collection A, Collection B>
bool issubset(const A& a, const B& b) {
  if constexpr (HasLength<B> && (SetLike<A> || !hasFastIn<B>())) {
    if constexpr (SetLike<A>) {
      if (length(a) > length(b)) { return false; }
    }
    if constexpr (!hasFastIn<B>() && Materializable<StoredElement<ElementOf<B>>>) {
      if (length(b) > kFastInSetThreshold) { return issubset(a, materialize(b)); }
    }
  }
  return std::ranges::all_of(a, [&b](const auto& x) { return contains(b, x); });
}

template <Collection A, Collection B>
bool issuperset(const A& a, const B& b) {
  return issubset(b, a);
}

template <Collection A, Collection B>
bool is_proper_subset(const A& a, const B& b) {
  if constexpr (SetLike<A> && SetLike<B>) {
    return length(a) < length(b) && issubset(a, b);
  } else if constexpr (SetLike<A>) {
    return is_proper_subset(a, materialize(b));
  } else if constexpr (SetLike<B>) {
    return is_proper_subset(materialize(a), b);
  } else {
    return is_proper_subset(materialize(a), materialize(b));
  }
}

template <Collection A, Collection B>
bool is_proper_superset(const A& a, const B& b) {
  return is_proper_subset(b, a);
}

template <Collection A, Collection B>
bool not_subset(const A& a, const B& b) {
  return !issubset(a, b);
}

template <Collection A, Collection B>
bool not_superset(const A& a, const B& b) {
  return not_subset(b, a);
}

struct IsSubsetFn {
  template <Collection A, Collection B>
  bool operator()(const A& a, const B& b) const { return issubset(a, b); }
};

struct IsSupersetFn {
  template <Collection A, Collection B>
  bool operator()(const A& a, const B& b) const { return issuperset(a, b); }
};

struct IsProperSubsetFn {
  template <Collection A, Collection B>
  bool operator()(const A& a, const B& b) const { return is_proper_subset(a, b); }
};

struct IsProperSupersetFn {
  template <Collection A, Collection B>
  bool operator()(const A& a, const B& b) const { return is_proper_superset(a, b); }
};

struct NotSubsetFn {
  template <Collection A, Collection B>
  bool operator()(const A& a, const B& b) const { return not_subset(a, b); }
};

struct NotSupersetFn {
  template <Collection A, Collection B>
  bool operator()(const A& a, const B& b) const { return not_superset(a, b); }
};

// issubset(x)(y) == issubset(y, x)
template <typename X>
auto issubset(X&& x) {
  return fix2(IsSubsetFn{}, std::forward<X>(x));
}

template <typename X>
auto issuperset(X&& x) {
  return fix2(IsSupersetFn{}, std::forward<X>(x));
}

template <typename X>
auto is_proper_subset(X&& x) {
  return fix2(IsProperSubsetFn{}, std::forward<X>(x));
}

template <typename X>
auto is_proper_superset(X&& x) {
  return fix2(IsProperSupersetFn{}, std::forward<X>(x));
}

template <typename X>
auto not_subset(X&& x) {
  return fix2(NotSubsetFn{}, std::forward<X>(x));
}

template <typename X>
auto not_superset(X&& x) {
  return fix2(NotSupersetFn{}, std::forward<X>(x));
}

} // namespace setalg
