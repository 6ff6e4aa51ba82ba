/**
 * @file
 * @brief Containment order on set-like collections.
 *
 * std::set's operator< is lexicographic, so the subset order is spelled out
 * as named functions. It is a partial order: two sets can be neither less,
 * greater nor equal to each other.
 */
#pragma once

#include "setalg/algebra/Subset.h"
#include "setalg/traits/Collection.h"
#include "setalg/traits/Primitives.h"

namespace setalg {

template <SetLike A, SetLike B>
bool set_equal(const A& a, const B& b) {
  return length(a) == length(b) && issubset(a, b);
}

template <SetLike A, SetLike B>
bool set_less(const A& a, const B& b) {
  return is_proper_subset(a, b);
}

template <SetLike A, SetLike B>
bool set_less_equal(const A& a, const B& b) {
  return issubset(a, b);
}

struct SubsetOrder {
  template <SetLike A, SetLike B>
  bool operator()(const A& a, const B& b) const { return set_less_equal(a, b); }
};

struct ProperSubsetOrder {
  template <SetLike A, SetLike B>
  bool operator()(const A& a, const B& b) const { return set_less(a, b); }
};

} // namespace setalg
