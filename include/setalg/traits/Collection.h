/***
 * Name: setalg traits (collection kinds)
 * Purpose: Classify collection types at compile time for the set-algebra engine.
 * Inputs:
 *   - Any type iterable through a const reference.
 * Outputs:
 *   - Concepts Collection, HasLength, SetLike, MappingLike, Sequence,
 *     MutableSequence and the hasFastIn() query.
 * Theory of Operation:
 *   Kinds are detected structurally (key_type/mapped_type/insert/erase/find).
 *   The trait structs IsSetLike, IsMappingLike and HasFastIn are customization
 *   points: specialize them to opt a type in or out of a kind.
 */
#pragma once

#include <concepts>
#include <ranges>
#include <type_traits>
#include <utility>

namespace setalg {

template <typename C>
concept Collection = std::ranges::forward_range<const std::remove_cvref_t<C>>;

template <typename C>
using ElementOf = std::ranges::range_value_t<const std::remove_cvref_t<C>>;

template <typename C>
concept HasLength = Collection<C> && std::ranges::sized_range<const std::remove_cvref_t<C>>;

namespace detail {

// multiset-like containers are rejected: their insert() has no `.second`.
template <typename C>
concept StructurallySetLike = requires(C& c, const C& cc, const typename C::key_type& k) {
  requires std::same_as<typename C::key_type, typename C::value_type>;
  { c.insert(k).second } -> std::convertible_to<bool>;
  c.erase(k);
  cc.find(k);
  c.clear();
};

// multimap-like containers are rejected: they have no at().
template <typename C>
concept StructurallyMappingLike = requires(const C& c, const typename C::key_type& k) {
  typename C::mapped_type;
  c.find(k);
  c.at(k);
};

} // namespace detail

template <typename C>
struct IsSetLike : std::bool_constant<detail::StructurallySetLike<C>> {};

template <typename C>
struct IsMappingLike : std::bool_constant<detail::StructurallyMappingLike<C>> {};

template <typename C>
concept SetLike = Collection<C> && IsSetLike<std::remove_cvref_t<C>>::value;

template <typename C>
concept MappingLike = Collection<C> && IsMappingLike<std::remove_cvref_t<C>>::value;

// Ordered sequences keep first-occurrence order when used as outputs.
template <typename C>
concept Sequence = Collection<C> && !SetLike<C> && !MappingLike<C>;

template <typename C>
concept MutableSequence = Sequence<C> && requires(std::remove_cvref_t<C>& c, const ElementOf<C>& x) {
  c.push_back(x);
  c.erase(c.begin(), c.end());
  c.clear();
};

/***
 * Name: setalg::HasFastIn
 * Purpose: Declare that `x in c` is O(1) or O(log n) for collections of type C.
 * Theory of Operation: True for set-like and mapping-like kinds by default.
 *   StepRange specializes it in its own header.
 */
template <typename C>
struct HasFastIn : std::bool_constant<IsSetLike<C>::value || IsMappingLike<C>::value> {};

template <typename C>
constexpr bool hasFastIn() noexcept {
  return HasFastIn<std::remove_cvref_t<C>>::value;
}

template <typename C>
constexpr bool hasFastIn(const C& /*unused*/) noexcept {
  return hasFastIn<C>();
}

} // namespace setalg
