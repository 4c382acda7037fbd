/**
 * @file   orderset/interval/interval.h
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
 * This file defines class Interval, a contiguous range of a totally ordered
 * set. No arithmetic on the domain type is assumed; everything here follows
 * from the ordering alone, and the domain is treated as if it were dense.
 * See
 *      https://en.wikipedia.org/wiki/Interval_(mathematics)
 *
 * @subsection Definition of an interval
 *
 * An interval is given by a left and a right endpoint. Here's the list of the
 * possible defining inequalities:
 *      a < x < b           open, open              (a, b)
 *      a < x <= b          open, closed            (a, b]
 *      a <= x < b          closed, open            [a, b)
 *      a <= x <= b         closed, closed          [a, b]
 *      x < b               unbounded, open         (-∞, b)
 *      x <= b              unbounded, closed       (-∞, b]
 *      a < x               open, unbounded         (a, +∞)
 *      a <= x              closed, unbounded       [a, +∞)
 *      <no constraint>     unbounded, unbounded    (-∞, +∞)
 *
 * Unlike a general set of points, an `Interval` is never empty. Construction
 * requires `a < b` for bounded endpoints, relaxed to `a <= b` when both are
 * closed. The closed interval `[a, a]` is a single point, called degenerate,
 * and is displayed as `[a]`. Empty results are expressed elsewhere, as
 * `nullopt` from `intersection` or as an empty `IntervalSet`.
 *
 * @subsection Separation
 *
 * Two intervals are separated if some point lies strictly between them. For
 * example, `(0, 1)` and `(1, 2)` are separated by the point 1. Intervals that
 * are not separated either overlap or are adjacent, as `(0, 1)` and `[1, 2)`
 * are, and in both cases their union is an interval: their convex hull. This
 * is the basis of `merge` and of the canonical form of `IntervalSet`.
 */

#pragma once
#ifndef ORDERSET_INTERVAL_H
#define ORDERSET_INTERVAL_H

#include <ostream>
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>

#include "orderset/common/common.h"
#include "orderset/interval/endpoint.h"

namespace orderset::interval {

/**
 * Base class of the exceptions of the interval module.
 */
class IntervalException : public common::OrdersetException {
 public:
  explicit IntervalException(const std::string& message);
};

/**
 * Exception thrown when the endpoints given to a constructor violate the
 * ordering constraint.
 */
class InvalidIntervalException : public IntervalException {
 public:
  explicit InvalidIntervalException(const std::string& message);
};

/**
 * Exception thrown when merging separated intervals, whose union is not an
 * interval.
 */
class MergeSeparatedIntervalsException : public IntervalException {
 public:
  explicit MergeSeparatedIntervalsException(const std::string& message);
};

/**
 * Exception thrown when a bound is an unordered element, such as NaN.
 */
class IncomparableEndpointsException : public IntervalException {
 public:
  explicit IncomparableEndpointsException(const std::string& message);
};

/**
 * @class Interval
 *
 * Intervals are immutable upon construction. That is to say that intervals are
 * a value class. The value of an Interval variable changes by assignment, not
 * by manipulating its innards in any other way.
 *
 * @invariant left_ and right_ form a valid pair, that is, `is_valid(left_,
 * right_)`.
 *
 * @tparam T A totally ordered type
 */
template <IntervalDomain T>
class Interval {
  using Traits = detail::TypeTraits<T>;

  /** Left (lower) endpoint */
  Endpoint<T> left_;

  /** Right (upper) endpoint */
  Endpoint<T> right_;

  /**
   * Rejects unordered elements as bounds. This is the only check that applies
   * regardless of the relation between the two bounds.
   */
  static void check_ordered(const Endpoint<T>& x) {
    if constexpr (Traits::has_unordered_elements) {
      if (x.has_value() && !Traits::is_ordered(x.value())) {
        throw IncomparableEndpointsException(
            "Interval::constructor - "
            "Unordered member is invalid as an interval bound");
      }
    }
  }

  /**
   * Describes a pair of endpoints for an error message, if T can be formatted.
   */
  static std::string describe(
      const Endpoint<T>& left, const Endpoint<T>& right) {
    if constexpr (fmt::is_formattable<T>::value) {
      auto side = [](const Endpoint<T>& x, std::string_view unbounded) {
        return x.has_value() ? fmt::format("{}", x.value()) :
                               std::string(unbounded);
      };
      return fmt::format(
          "; left endpoint {} {} is not below right endpoint {} {}",
          left.is_open() ? "open" : left.is_closed() ? "closed" : "unbounded",
          side(left, "-∞"),
          right.is_open()   ? "open" :
          right.is_closed() ? "closed" :
                              "unbounded",
          side(right, "+∞"));
    } else {
      (void)left;
      (void)right;
      return {};
    }
  }

 public:
  /**
   * Empty constructor is disabled. There is no empty interval.
   */
  Interval() = delete;

  /**
   * General constructor from a pair of endpoints.
   *
   * @throws IncomparableEndpointsException if a bound is an unordered element
   * @throws InvalidIntervalException if the bounds are out of order
   */
  Interval(Endpoint<T> left, Endpoint<T> right)
      : left_(std::move(left))
      , right_(std::move(right)) {
    check_ordered(left_);
    check_ordered(right_);
    if (!is_valid(left_, right_)) {
      throw InvalidIntervalException(
          "Interval::constructor - Invalid endpoints" +
          describe(left_, right_));
    }
  }

  /** Default copy constructor */
  Interval(const Interval&) = default;

  /** Default move constructor */
  Interval(Interval&&) noexcept = default;

  /** Default copy assignment */
  Interval& operator=(const Interval&) = default;

  /** Default move assignment */
  Interval& operator=(Interval&&) noexcept = default;

  /**
   * Predicate that a pair of endpoints would construct an interval. Does not
   * throw for unordered elements; they're simply not valid.
   */
  static bool is_valid(const Endpoint<T>& left, const Endpoint<T>& right) {
    if (left.is_unbounded() || right.is_unbounded()) {
      // No constraint between the sides, only on the bounded one
      const Endpoint<T>& x = left.is_unbounded() ? right : left;
      return x.is_unbounded() || detail::is_ordered_element(x.value());
    }
    const T& low = left.value();
    const T& high = right.value();
    if (!detail::is_ordered_element(low) || !detail::is_ordered_element(high)) {
      return false;
    }
    if (left.is_closed() && right.is_closed()) {
      return !(high < low);
    }
    return low < high;
  }

  /* ********************************* */
  /*             FACTORIES             */
  /* ********************************* */

  /** Finite interval: open `(a, b)` */
  static Interval open(T a, T b) {
    return Interval(
        Endpoint<T>::open(std::move(a)), Endpoint<T>::open(std::move(b)));
  }

  /** Finite interval: closed `[a, b]` */
  static Interval closed(T a, T b) {
    return Interval(
        Endpoint<T>::closed(std::move(a)), Endpoint<T>::closed(std::move(b)));
  }

  /** Finite interval: half-open, half-closed `(a, b]` */
  static Interval open_closed(T a, T b) {
    return Interval(
        Endpoint<T>::open(std::move(a)), Endpoint<T>::closed(std::move(b)));
  }

  /** Finite interval: half-closed, half-open `[a, b)` */
  static Interval closed_open(T a, T b) {
    return Interval(
        Endpoint<T>::closed(std::move(a)), Endpoint<T>::open(std::move(b)));
  }

  /** Lower-unbounded interval: upper half-open `(-∞, b)` */
  static Interval unbounded_open(T b) {
    return Interval(Endpoint<T>::unbounded(), Endpoint<T>::open(std::move(b)));
  }

  /** Lower-unbounded interval: upper half-closed `(-∞, b]` */
  static Interval unbounded_closed(T b) {
    return Interval(
        Endpoint<T>::unbounded(), Endpoint<T>::closed(std::move(b)));
  }

  /** Upper-unbounded interval: lower half-open `(a, +∞)` */
  static Interval open_unbounded(T a) {
    return Interval(Endpoint<T>::open(std::move(a)), Endpoint<T>::unbounded());
  }

  /** Upper-unbounded interval: lower half-closed `[a, +∞)` */
  static Interval closed_unbounded(T a) {
    return Interval(
        Endpoint<T>::closed(std::move(a)), Endpoint<T>::unbounded());
  }

  /** The whole domain `(-∞, +∞)` */
  static Interval universe() {
    return Interval(Endpoint<T>::unbounded(), Endpoint<T>::unbounded());
  }

  /* ********************************* */
  /*             ACCESSORS             */
  /* ********************************* */

  [[nodiscard]] const Endpoint<T>& left() const noexcept {
    return left_;
  }
  [[nodiscard]] const Endpoint<T>& right() const noexcept {
    return right_;
  }
  /**
   * Value of the left endpoint, or `nullopt` if unbounded below.
   */
  [[nodiscard]] const optional<T>& low() const noexcept {
    return left_.value_if_bounded();
  }
  /**
   * Value of the right endpoint, or `nullopt` if unbounded above.
   */
  [[nodiscard]] const optional<T>& high() const noexcept {
    return right_.value_if_bounded();
  }
  [[nodiscard]] bool is_universe() const noexcept {
    return left_.is_unbounded() && right_.is_unbounded();
  }
  /**
   * Predicate that the interval consists of a single point `[a, a]`.
   */
  [[nodiscard]] bool is_degenerate() const {
    return left_.is_closed() && right_.is_closed() &&
           left_.value() == right_.value();
  }
  /**
   * Predicate that both endpoints have values.
   */
  [[nodiscard]] bool is_bounded() const noexcept {
    return !left_.is_unbounded() && !right_.is_unbounded();
  }
  /**
   * Predicate that at least one endpoint is unbounded.
   */
  [[nodiscard]] bool is_unbounded() const noexcept {
    return !is_bounded();
  }

  /* ********************************* */
  /*            SEPARATION             */
  /* ********************************* */

  /**
   * Predicate that `y` lies entirely below this interval with at least one
   * point between them.
   */
  [[nodiscard]] bool is_separated_on_left_from(const Interval& y) const {
    return is_gap_between(y.right_, left_);
  }

  /**
   * Predicate that `y` lies entirely above this interval with at least one
   * point between them.
   */
  [[nodiscard]] bool is_separated_on_right_from(const Interval& y) const {
    return is_gap_between(right_, y.left_);
  }

  /**
   * Predicate that some point lies strictly between this interval and `y`.
   * Symmetric. Intervals that are not separated either share a point or are
   * adjacent.
   */
  [[nodiscard]] bool is_separated_from(const Interval& y) const {
    return is_separated_on_left_from(y) || is_separated_on_right_from(y);
  }

  /* ********************************* */
  /*            OPERATIONS             */
  /* ********************************* */

  /**
   * Convex hull of this interval and `y`: the smallest interval containing
   * both. For non-separated intervals it's also their union.
   *
   * @throws MergeSeparatedIntervalsException if the intervals are separated
   */
  [[nodiscard]] Interval merge(const Interval& y) const {
    if (is_separated_from(y)) {
      throw MergeSeparatedIntervalsException(
          "Interval::merge - "
          "Separated intervals cannot be merged");
    }
    // Least lower bound; on a tie, closed is the lesser one.
    const Endpoint<T>& left =
        compare_as_lower(left_, y.left_) <= 0 ? left_ : y.left_;
    // Greatest upper bound; on a tie, closed is the greater one.
    const Endpoint<T>& right =
        compare_as_upper(right_, y.right_) >= 0 ? right_ : y.right_;
    return Interval(left, right);
  }

  /**
   * Calculate the intersection of another interval with this one.
   *
   * The greatest lower bound and the least upper bound form the result, which
   * prefers open bounds on ties and a bound over no bound. Intervals that are
   * adjacent, like `(0, 1)` and `[1, 2)`, are not separated but share no
   * point. The candidate endpoints are then not a valid pair.
   *
   * @return The common part, or `nullopt` if there is none
   */
  [[nodiscard]] optional<Interval> intersection(const Interval& y) const {
    const Endpoint<T>& left =
        compare_as_lower(left_, y.left_) >= 0 ? left_ : y.left_;
    const Endpoint<T>& right =
        compare_as_upper(right_, y.right_) <= 0 ? right_ : y.right_;
    if (!is_valid(left, right)) {
      return nullopt;
    }
    return Interval(left, right);
  }

  /**
   * Membership predicate that the argument is an element of the interval.
   */
  [[nodiscard]] bool contains(const T& x) const {
    if constexpr (Traits::has_unordered_elements) {
      if (!Traits::is_ordered(x)) {
        // An unordered element is not a member of any interval.
        return false;
      }
    }
    // Check that the lower bound is satisfied.
    if (left_.is_open() && !(left_.value() < x)) {
      return false;
    }
    if (left_.is_closed() && x < left_.value()) {
      return false;
    }
    // Check that the upper bound is satisfied.
    if (right_.is_open() && !(x < right_.value())) {
      return false;
    }
    if (right_.is_closed() && right_.value() < x) {
      return false;
    }
    return true;
  }

  /**
   * Intervals are equal if both endpoints are of the same kind and value.
   */
  bool operator==(const Interval& y) const {
    return left_ == y.left_ && right_ == y.right_;
  }

  /**
   * Renders the interval in bracket notation, e.g. `[0, 1)`, `(-∞, 2]` or
   * `[3]` for a single point. Requires a `fmt` formatter for T.
   */
  [[nodiscard]] std::string to_string() const {
    if (is_degenerate()) {
      return fmt::format("[{}]", left_.value());
    }
    std::string s;
    if (left_.is_unbounded()) {
      s = "(-∞";
    } else {
      s = fmt::format("{}{}", left_.is_open() ? "(" : "[", left_.value());
    }
    s += ", ";
    if (right_.is_unbounded()) {
      s += "+∞)";
    } else {
      s += fmt::format("{}{}", right_.value(), right_.is_open() ? ")" : "]");
    }
    return s;
  }
};

template <IntervalDomain T>
std::ostream& operator<<(std::ostream& os, const Interval<T>& x) {
  return os << x.to_string();
}

}  // namespace orderset::interval

template <orderset::interval::IntervalDomain T>
struct fmt::formatter<orderset::interval::Interval<T>>
    : fmt::formatter<fmt::string_view> {
  auto format(
      const orderset::interval::Interval<T>& x,
      fmt::format_context& ctx) const {
    return fmt::formatter<fmt::string_view>::format(x.to_string(), ctx);
  }
};

#endif  // ORDERSET_INTERVAL_H
