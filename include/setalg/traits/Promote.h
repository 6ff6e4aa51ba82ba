/***
 * Name: setalg traits (element promotion and output construction)
 * Purpose: Compute the promoted element type across collections and build
 *          empty outputs and auxiliary sets of a matching kind.
 * Theory of Operation:
 *   - StoredElement strips the const from map value types so elements can be
 *     copied into sets and vectors.
 *   - PromotedElement is std::common_type over the stored element types.
 *   - RebindCollection maps an input collection type and an element type to
 *     the output collection type: set templates rebind to the new element
 *     type, everything else becomes std::vector. Specialize it for other
 *     set-like containers.
 *   - AuxSet is the auxiliary set used for fast membership: hash-based when
 *     the element is hashable, ordered when it is only totally ordered.
 */
#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <set>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

#include "setalg/traits/Collection.h"

namespace setalg {

template <typename T>
struct StoredElementOf {
  using type = std::remove_cv_t<T>;
};

template <typename K, typename V>
struct StoredElementOf<std::pair<K, V>> {
  using type = std::pair<std::remove_cv_t<K>, std::remove_cv_t<V>>;
};

template <typename T>
using StoredElement = typename StoredElementOf<T>::type;

template <Collection... Cs>
using PromotedElement = std::common_type_t<StoredElement<ElementOf<Cs>>...>;

template <typename T>
concept Hashable = requires(const T& t) {
  { std::hash<T>{}(t) } -> std::convertible_to<std::size_t>;
} && std::equality_comparable<T>;

template <typename T>
concept Materializable = Hashable<T> || std::totally_ordered<T>;

template <typename T>
using AuxSet = std::conditional_t<Hashable<T>, std::unordered_set<T>, std::set<T>>;

template <typename C, typename T>
struct RebindCollection {
  using type = std::conditional_t<SetLike<C>,
                                  std::conditional_t<std::is_same_v<ElementOf<C>, T>, C, AuxSet<T>>,
                                  std::vector<T>>;
};

template <typename K, typename Cmp, typename A, typename T>
struct RebindCollection<std::set<K, Cmp, A>, T> {
  using type = std::conditional_t<std::is_same_v<K, T>, std::set<K, Cmp, A>, std::set<T>>;
};

template <typename K, typename H, typename Eq, typename A, typename T>
struct RebindCollection<std::unordered_set<K, H, Eq, A>, T> {
  using type = std::conditional_t<std::is_same_v<K, T>, std::unordered_set<K, H, Eq, A>, AuxSet<T>>;
};

template <typename C, typename T>
using RebindCollectionT = typename RebindCollection<std::remove_cvref_t<C>, T>::type;

/*** emptyMutable: new empty collection of the same kind as `c` holding T. */
template <typename T, Collection C>
RebindCollectionT<C, T> emptyMutable(const C& /*unused*/) {
  return RebindCollectionT<C, T>{};
}

} // namespace setalg
