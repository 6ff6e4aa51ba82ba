/***
 * Name: setalg::StepRange
 * Purpose: Arithmetic range collection `start:step:stop` with O(1) length and membership.
 * Inputs:
 *   - start, step (non-zero), stop; stop is inclusive when reachable.
 * Outputs:
 *   - A forward, sized range of T; contains(x) in O(1).
 * Theory of Operation:
 *   The element count is computed once at construction. Integral element
 *   values are computed in uintmax_t and narrowed back, so element access
 *   never overflows; a progression with more elements than std::size_t can
 *   count (every value of a 64-bit T) is rejected with RangeError.
 *   Floating ranges use start + i * step. When stop lies within a few ULP of
 *   a whole number of steps it is the last element, returned exactly, so
 *   0:0.1:0.3 has four elements ending in 0.3.
 */
#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <type_traits>

#include "setalg/exceptions/range_error.h"
#include "setalg/traits/Collection.h"
#include "setalg/traits/Primitives.h"

namespace setalg {

template <typename T>
class StepRange {
  static_assert(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>, "StepRange requires an arithmetic element type");

 public:
  using value_type = T;
  using size_type = std::size_t;

  class iterator {
   public:
    using iterator_concept = std::forward_iterator_tag;
    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using reference = T;

    iterator() = default;
    iterator(const StepRange* range, std::size_t index) : range_(range), index_(index) {}

    T operator*() const { return range_->at(index_); }
    iterator& operator++() {
      ++index_;
      return *this;
    }
    iterator operator++(int) {
      auto copy = *this;
      ++index_;
      return copy;
    }
    bool operator==(const iterator& other) const { return index_ == other.index_; }

   private:
    const StepRange* range_{nullptr};
    std::size_t index_{0};
  };
  using const_iterator = iterator;

  StepRange(T start, T step, T stop) : start_(start), step_(step), stop_(stop) {
    if (step == T{0}) { throw exceptions::RangeError("StepRange: step cannot be zero"); }
    size_ = countElements();
  }

  iterator begin() const { return iterator(this, 0); }
  iterator end() const { return iterator(this, size_); }

  std::size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }

  T first() const noexcept { return start_; }
  T last() const noexcept { return size_ == 0 ? start_ : at(size_ - 1); }
  T step() const noexcept { return step_; }
  T minimum() const noexcept { return step_ > T{0} ? first() : last(); }
  T maximum() const noexcept { return step_ > T{0} ? last() : first(); }

  T operator[](std::size_t index) const noexcept { return at(index); }

  template <typename X>
  bool contains(const X& x) const {
    if (size_ == 0) { return false; }
    if constexpr (!std::is_arithmetic_v<X>) {
      return false;
    } else {
      const auto key = detail::exactKey<T>(x);
      if (!key || *key < minimum() || *key > maximum()) { return false; }
      if constexpr (std::is_integral_v<T>) {
        using U = std::uintmax_t;
        const U offset = step_ > T{0} ? static_cast<U>(*key) - static_cast<U>(start_)
                                      : static_cast<U>(start_) - static_cast<U>(*key);
        return offset % magnitude() == 0;
      } else {
        const T steps = std::round((*key - start_) / step_);
        if (!(steps >= T{0}) || steps >= static_cast<T>(size_)) { return false; }
        return at(static_cast<std::size_t>(steps)) == *key;
      }
    }
  }

  // |step| without overflow for the most negative step.
  std::uintmax_t magnitude() const noexcept {
    static_assert(std::is_integral_v<T>);
    const auto raw = static_cast<std::uintmax_t>(step_);
    return step_ < T{0} ? std::uintmax_t{0} - raw : raw;
  }

 private:
  T at(std::size_t index) const noexcept {
    if constexpr (std::is_integral_v<T>) {
      using U = std::uintmax_t;
      return static_cast<T>(static_cast<U>(start_) + static_cast<U>(index) * static_cast<U>(step_));
    } else {
      if (endsAtStop_ && index + 1 == size_) { return stop_; }
      return static_cast<T>(start_ + static_cast<T>(index) * step_);
    }
  }

  std::size_t countElements() {
    if ((step_ > T{0} && stop_ < start_) || (step_ < T{0} && stop_ > start_)) { return 0; }
    if constexpr (std::is_integral_v<T>) {
      using U = std::uintmax_t;
      const U span = step_ > T{0} ? static_cast<U>(stop_) - static_cast<U>(start_)
                                  : static_cast<U>(start_) - static_cast<U>(stop_);
      const U steps = span / magnitude();
      if (steps >= std::numeric_limits<std::size_t>::max()) {
        throw exceptions::RangeError("StepRange: too many elements to count");
      }
      return static_cast<std::size_t>(steps) + 1;
    } else {
      constexpr T kSnapUlps = 4;
      const T steps = (stop_ - start_) / step_;
      const T whole = std::round(steps);
      const T scale = std::max({std::abs(start_), std::abs(stop_), std::abs(step_)});
      const T reached = start_ + whole * step_;
      endsAtStop_ = std::abs(reached - stop_) <= kSnapUlps * std::numeric_limits<T>::epsilon() * scale;
      const T count = (endsAtStop_ ? whole : std::floor(steps)) + T{1};
      if (!(count < static_cast<T>(std::numeric_limits<std::size_t>::max()))) {
        throw exceptions::RangeError("StepRange: too many elements to count");
      }
      return static_cast<std::size_t>(count);
    }
  }

  T start_;
  T step_;
  T stop_;
  std::size_t size_{0};
  bool endsAtStop_{false};
};

/*** unitRange: start:stop with step one. */
template <typename T>
StepRange<T> unitRange(T start, T stop) {
  return StepRange<T>(start, T{1}, stop);
}

template <typename T>
struct HasFastIn<StepRange<T>> : std::true_type {};

} // namespace setalg
