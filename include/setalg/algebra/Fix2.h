/**
 * @file
 * @brief Fix2: a binary callable with its second argument bound.
 *
 * fix2(fn, x)(y) calls fn(y, x). The bound value is copied, unless it is
 * passed through std::ref/std::cref, in which case only a reference is kept
 * and the caller keeps the referent alive.
 */
#pragma once

#include <functional>
#include <utility>

namespace setalg {

template <typename Fn, typename X>
class Fix2 {
 public:
  Fix2(Fn fn, X x) : fn_(std::move(fn)), x_(std::move(x)) {}

  template <typename Y>
  decltype(auto) operator()(const Y& y) const {
    return fn_(y, static_cast<const X&>(x_));
  }

  const X& bound() const noexcept { return x_; }

 private:
  Fn fn_;
  X x_;
};

template <typename Fn, typename X>
Fix2<std::decay_t<Fn>, std::unwrap_ref_decay_t<X>> fix2(Fn&& fn, X&& x) {
  return {std::forward<Fn>(fn), std::forward<X>(x)};
}

} // namespace setalg
