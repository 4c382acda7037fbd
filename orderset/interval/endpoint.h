/**
 * @file   orderset/interval/endpoint.h
 *
 * @section LICENSE
 *
 * The MIT License
 *
 * @copyright Copyright (c) 2024 TileDB, Inc.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 *
 * @section DESCRIPTION
 *
 * This file defines class Endpoint, one side of an interval.
 *
 * An endpoint is one of three things:
 *      Open(v)     the interval extends up to `v` but excludes it
 *      Closed(v)   the interval extends up to `v` and includes it
 *      Unbounded   the interval extends without limit on this side
 *
 * An endpoint by itself doesn't know whether it's the lower or the upper side
 * of an interval. The order between two endpoints depends on that role. As
 * lower bounds, `[3` is less than `(3`, since `[3,...` contains everything
 * that `(3,...` does and more. As upper bounds the opposite holds: `...,3)` is
 * less than `...,3]`. An unbounded endpoint is least as a lower bound and
 * greatest as an upper bound. These two orders are provided by the free
 * functions `compare_as_lower` and `compare_as_upper`.
 *
 * @section Requirements on the domain type
 *
 * The domain type must be totally ordered (`std::totally_ordered`) and
 * copyable. Floating-point types are totally ordered only after removing NaN;
 * the traits class `TypeTraits` identifies types with such unordered elements
 * so that interval constructors can reject them as bounds.
 */

#pragma once
#ifndef ORDERSET_ENDPOINT_H
#define ORDERSET_ENDPOINT_H

#include <cmath>
#include <concepts>
#include <type_traits>
#include <utility>

#include "orderset/common/common.h"

namespace orderset::interval {

/**
 * A type usable as the domain of an interval.
 */
template <class T>
concept IntervalDomain = std::totally_ordered<T> && std::copy_constructible<T>;

namespace detail {

/**
 * Traits of the domain type that the ordering alone doesn't reveal.
 *
 * The default traits class is for types all of whose values are ordered.
 * Specializations may declare `has_unordered_elements` true, and in that case
 * must define `is_ordered`.
 *
 * @tparam T The domain type
 * @tparam Enable Allows specializations with enable_if
 */
template <class T, typename Enable = T>
struct TypeTraits {
  /**
   * Predicate constant that T contains unordered elements.
   *
   * Used as a `if constexpr` guard for calling `is_ordered`.
   */
  static constexpr bool has_unordered_elements = false;
};

/**
 * Specialization of TypeTraits for floating-point types. NaN values are not
 * ordered and thus unsuitable as interval bounds. Infinite values are ordered
 * and are treated as ordinary elements.
 */
template <class T>
struct TypeTraits<
    T,
    typename std::enable_if<std::is_floating_point<T>::value, T>::type> {
  static constexpr bool has_unordered_elements = true;

  /**
   * An extended number is either finite or infinite, but must not be NaN.
   */
  static bool is_ordered(T x) {
    return !std::isnan(x);
  }
};

/**
 * Predicate that a value of T may be used as a bound.
 */
template <class T>
bool is_ordered_element(const T& x) {
  if constexpr (TypeTraits<T>::has_unordered_elements) {
    return TypeTraits<T>::is_ordered(x);
  } else {
    (void)x;
    return true;
  }
}

}  // namespace detail

/**
 * @class Endpoint
 *
 * Endpoints are immutable values. They are only constructed through the
 * factories `open`, `closed` and `unbounded`.
 *
 * @tparam T The domain type
 */
template <IntervalDomain T>
class Endpoint {
 public:
  /** The three kinds of endpoint */
  enum class Kind : char { OPEN, CLOSED, UNBOUNDED };

 private:
  /**
   * @var Bound value, if one exists.
   *
   * @invariant value_.has_value() \iff kind_ != Kind::UNBOUNDED
   */
  optional<T> value_;

  /** Kind of the endpoint */
  Kind kind_;

  Endpoint(optional<T> value, Kind kind)
      : value_(std::move(value))
      , kind_(kind) {
  }

 public:
  /**
   * Default constructor is disabled.
   */
  Endpoint() = delete;

  /** An endpoint that excludes its value. */
  static Endpoint open(T value) {
    return Endpoint(optional<T>(std::move(value)), Kind::OPEN);
  }

  /** An endpoint that includes its value. */
  static Endpoint closed(T value) {
    return Endpoint(optional<T>(std::move(value)), Kind::CLOSED);
  }

  /** An endpoint that imposes no limit. */
  static Endpoint unbounded() {
    return Endpoint(nullopt, Kind::UNBOUNDED);
  }

  [[nodiscard]] Kind kind() const noexcept {
    return kind_;
  }
  [[nodiscard]] bool is_open() const noexcept {
    return kind_ == Kind::OPEN;
  }
  [[nodiscard]] bool is_closed() const noexcept {
    return kind_ == Kind::CLOSED;
  }
  [[nodiscard]] bool is_unbounded() const noexcept {
    return kind_ == Kind::UNBOUNDED;
  }
  [[nodiscard]] bool has_value() const noexcept {
    return value_.has_value();
  }

  /**
   * Accessor for the bound value. Throws std::bad_optional_access if the
   * endpoint is unbounded.
   *
   * @precondition has_value()
   */
  const T& value() const {
    return value_.value();
  }

  /**
   * Accessor for the bound value as an optional.
   */
  const optional<T>& value_if_bounded() const noexcept {
    return value_;
  }

  /**
   * The same bound with the opposite inclusion. An unbounded endpoint is its
   * own flip.
   *
   * This is the endpoint of the neighboring gap: the complement of `[a,...`
   * ends with `...,a)`.
   */
  [[nodiscard]] Endpoint flip() const {
    switch (kind_) {
      case Kind::OPEN:
        return Endpoint(value_, Kind::CLOSED);
      case Kind::CLOSED:
        return Endpoint(value_, Kind::OPEN);
      default:
        return *this;
    }
  }

  /**
   * Endpoints are equal if they are of the same kind and have equal values.
   */
  bool operator==(const Endpoint& y) const {
    if (kind_ != y.kind_) {
      return false;
    }
    return kind_ == Kind::UNBOUNDED || value_.value() == y.value_.value();
  }
};

/**
 * Compare two endpoints as lower bounds. Comparing `[a` and `(b` as lower
 * bounds compares the sets `[a,+infinity)` and `(b,+infinity)`; a lesser lower
 * bound is a superset.
 *
 * @return -1 if `a` extends further down than `b`, 0 if they are the same
 * bound, +1 otherwise.
 */
template <IntervalDomain T>
int compare_as_lower(const Endpoint<T>& a, const Endpoint<T>& b) {
  if (a.is_unbounded() || b.is_unbounded()) {
    return a.is_unbounded() ? (b.is_unbounded() ? 0 : -1) : +1;
  }
  // Assert: Both bounds have values.
  if (a.value() < b.value()) {
    return -1;
  }
  if (b.value() < a.value()) {
    return +1;
  }
  if (a.kind() == b.kind()) {
    return 0;
  }
  // Equal values: a closed lower bound includes its value, so it's lesser.
  return a.is_closed() ? -1 : +1;
}

/**
 * Compare two endpoints as upper bounds. Comparing `a]` and `b)` as upper
 * bounds compares the sets `(-infinity,a]` and `(-infinity,b)`; a lesser
 * upper bound is a subset.
 *
 * @return -1 if `a` stops short of `b`, 0 if they are the same bound, +1
 * otherwise.
 */
template <IntervalDomain T>
int compare_as_upper(const Endpoint<T>& a, const Endpoint<T>& b) {
  if (a.is_unbounded() || b.is_unbounded()) {
    return a.is_unbounded() ? (b.is_unbounded() ? 0 : +1) : -1;
  }
  // Assert: Both bounds have values.
  if (a.value() < b.value()) {
    return -1;
  }
  if (b.value() < a.value()) {
    return +1;
  }
  if (a.kind() == b.kind()) {
    return 0;
  }
  // Equal values: an open upper bound excludes its value, so it's lesser.
  return a.is_open() ? -1 : +1;
}

/**
 * Predicate that there are points strictly between an upper bound and a
 * lower bound, that is, that the interval ending at `upper` lies entirely
 * below the interval starting at `lower` and is not adjacent to it.
 *
 *      ...,a)  (b,...      separated iff a <= b
 *      ...,a]  (b,...      separated iff a < b
 *      ...,a)  [b,...      separated iff a < b
 *      ...,a]  [b,...      separated iff a < b
 *
 * An unbounded side reaches every point, so it's never separated.
 */
template <IntervalDomain T>
bool is_gap_between(const Endpoint<T>& upper, const Endpoint<T>& lower) {
  if (upper.is_unbounded() || lower.is_unbounded()) {
    return false;
  }
  if (upper.is_open() && lower.is_open()) {
    return !(lower.value() < upper.value());
  }
  return upper.value() < lower.value();
}

}  // namespace orderset::interval

#endif  // ORDERSET_ENDPOINT_H
