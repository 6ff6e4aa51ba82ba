/**
 * @file
 * @brief Internal helpers shared by the construction operators: growing and
 *        shrinking ordered sequences, and runtime selection of one argument
 *        out of a parameter pack.
 */
#pragma once

#include <cstddef>
#include <tuple>
#include <utility>
#include <vector>

#include "setalg/algebra/Filter.h"
#include "setalg/traits/Collection.h"
#include "setalg/traits/Primitives.h"
#include "setalg/traits/Promote.h"

namespace setalg::detail {

// Predicate that is true the first time it sees an element.
template <typename T>
auto firstSightingIn(AuxSet<T>& seen) {
  return [&seen](const auto& x) { return seen.insert(storable<T>(x)).second; };
}

// Predicate that is true once for each element still held by `keep`, consuming it.
template <typename T>
auto takeOnceFrom(AuxSet<T>& keep) {
  return [&keep](const auto& x) { return erase_key(keep, x); };
}

// Append the elements of `itr` accepted by `pred` to `v`.
template <MutableSequence V, Collection I, typename Pred>
void growFrom(V& v, const I& itr, Pred& pred) {
  if (sameObject(v, itr)) { return; }
  mapfilter(pred, PushFn{}, itr, v);
}

// Elements of `itr` kept by `keep`, in order of first occurrence, each once.
template <typename T, Collection I>
std::vector<T> emitKept(const I& itr, AuxSet<T>& keep) {
  std::vector<T> out;
  auto take = takeOnceFrom<T>(keep);
  mapfilter(take, PushFn{}, itr, out);
  return out;
}

/**
 * Run `shrink(seen)` on the distinct elements of `v`, then keep in `v` only
 * the elements that survived, preserving their order.
 */
template <MutableSequence V, typename Shrink>
V& shrinkInPlace(V& v, Shrink&& shrink) {
  using T = StoredElement<ElementOf<V>>;
  AuxSet<T> seen;
  sizehint(seen, length(v));
  filter_inplace(firstSightingIn<T>(seen), v);
  shrink(seen);
  filter_inplace([&seen](const auto& x) { return contains(seen, x); }, v);
  return v;
}

template <typename Tuple, typename Fn, std::size_t... I>
void applyAtImpl(Tuple& args, std::size_t index, Fn& fn, std::index_sequence<I...> /*unused*/) {
  ((I == index ? fn(std::get<I>(args)) : void()), ...);
}

/*** applyAt: call `fn` with the argument at runtime position `index`. */
template <typename... Args, typename Fn>
void applyAt(std::tuple<Args...>& args, std::size_t index, Fn&& fn) {
  applyAtImpl(args, index, fn, std::index_sequence_for<Args...>{});
}

template <typename Tuple, typename Fn, std::size_t... I>
void applyExceptImpl(Tuple& args, std::size_t skip, Fn& fn, std::index_sequence<I...> /*unused*/) {
  ((I != skip ? fn(std::get<I>(args)) : void()), ...);
}

/*** applyExcept: call `fn` with every argument but the one at `skip`, in order. */
template <typename... Args, typename Fn>
void applyExcept(std::tuple<Args...>& args, std::size_t skip, Fn&& fn) {
  applyExceptImpl(args, skip, fn, std::index_sequence_for<Args...>{});
}

} // namespace setalg::detail
