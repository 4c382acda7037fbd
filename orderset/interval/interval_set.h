/**
 * @file   orderset/interval/interval_set.h
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
 * This file defines class IntervalSet, a subset of a totally ordered set
 * represented as a union of intervals.
 *
 * Every such subset has a canonical representation as a sequence of intervals
 * in ascending order, each one separated from the next. Separation, rather
 * than mere disjointness, is what makes the representation unique: `[0, 1)`
 * and `[1, 2]` are disjoint but must be stored as the single interval
 * `[0, 2]`. The empty set is the empty sequence.
 *
 * All operations produce canonical sets. Operands are never modified.
 */

#pragma once
#ifndef ORDERSET_INTERVAL_SET_H
#define ORDERSET_INTERVAL_SET_H

#include <algorithm>
#include <initializer_list>
#include <ostream>
#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>

#include "orderset/common/common.h"
#include "orderset/common/logger.h"
#include "orderset/interval/interval.h"

namespace orderset::interval {

/**
 * @class IntervalSet
 *
 * A value class. There is no public mutation; the set operations return new
 * sets.
 *
 * @invariant `is_canonical()`
 *
 * @tparam T A totally ordered type
 */
template <IntervalDomain T>
class IntervalSet {
 public:
  using value_type = Interval<T>;
  using container_type = std::vector<Interval<T>>;
  using const_iterator = typename container_type::const_iterator;

 private:
  /**
   * The intervals of the set, in ascending order and pairwise separated.
   */
  container_type intervals_;

  /**
   * Adds an interval to this set, keeping the canonical form. Only ever
   * applied to a set under construction.
   *
   * The stored intervals lying below `x` with a gap form a prefix; binary
   * search finds its end. From there, every stored interval not separated
   * from the growing hull is merged into it. The run of merged intervals is
   * replaced by the hull.
   */
  void insert(const Interval<T>& x) {
    auto first = std::partition_point(
        intervals_.begin(), intervals_.end(), [&x](const Interval<T>& a) {
          return x.is_separated_on_left_from(a);
        });
    Interval<T> hull{x};
    auto last = first;
    while (last != intervals_.end() && !last->is_separated_from(hull)) {
      hull = hull.merge(*last);
      ++last;
    }
    if (first == last) {
      intervals_.insert(first, hull);
    } else {
      *first = hull;
      intervals_.erase(first + 1, last);
    }
  }

 public:
  /* ********************************* */
  /*     CONSTRUCTORS & DESTRUCTORS    */
  /* ********************************* */

  /**
   * Default constructor is the empty set.
   */
  IntervalSet() = default;

  /**
   * Set of a single interval.
   */
  explicit IntervalSet(const Interval<T>& x)
      : intervals_{x} {
  }

  /**
   * Union of a list of intervals, in any order and possibly overlapping.
   */
  IntervalSet(std::initializer_list<Interval<T>> xs) {
    for (const auto& x : xs) {
      insert(x);
    }
  }

  /* ********************************* */
  /*             FACTORIES             */
  /* ********************************* */

  /** The set `{(a, b)}` */
  static IntervalSet open(T a, T b) {
    return IntervalSet(Interval<T>::open(std::move(a), std::move(b)));
  }

  /** The set `{[a, b]}` */
  static IntervalSet closed(T a, T b) {
    return IntervalSet(Interval<T>::closed(std::move(a), std::move(b)));
  }

  /** The set `{(a, b]}` */
  static IntervalSet open_closed(T a, T b) {
    return IntervalSet(Interval<T>::open_closed(std::move(a), std::move(b)));
  }

  /** The set `{[a, b)}` */
  static IntervalSet closed_open(T a, T b) {
    return IntervalSet(Interval<T>::closed_open(std::move(a), std::move(b)));
  }

  /** The set `{(-∞, b)}` */
  static IntervalSet unbounded_open(T b) {
    return IntervalSet(Interval<T>::unbounded_open(std::move(b)));
  }

  /** The set `{(-∞, b]}` */
  static IntervalSet unbounded_closed(T b) {
    return IntervalSet(Interval<T>::unbounded_closed(std::move(b)));
  }

  /** The set `{(a, +∞)}` */
  static IntervalSet open_unbounded(T a) {
    return IntervalSet(Interval<T>::open_unbounded(std::move(a)));
  }

  /** The set `{[a, +∞)}` */
  static IntervalSet closed_unbounded(T a) {
    return IntervalSet(Interval<T>::closed_unbounded(std::move(a)));
  }

  /** The whole domain */
  static IntervalSet universe() {
    return IntervalSet(Interval<T>::universe());
  }

  /* ********************************* */
  /*              QUERIES              */
  /* ********************************* */

  [[nodiscard]] bool empty() const noexcept {
    return intervals_.empty();
  }
  /**
   * The number of separated intervals, not the number of points.
   */
  [[nodiscard]] size_t size() const noexcept {
    return intervals_.size();
  }
  [[nodiscard]] const_iterator begin() const noexcept {
    return intervals_.begin();
  }
  [[nodiscard]] const_iterator end() const noexcept {
    return intervals_.end();
  }
  [[nodiscard]] const container_type& intervals() const noexcept {
    return intervals_;
  }
  [[nodiscard]] bool is_universe() const noexcept {
    return intervals_.size() == 1 && intervals_.front().is_universe();
  }

  /**
   * Membership predicate that the argument is an element of some interval of
   * the set.
   */
  [[nodiscard]] bool contains(const T& x) const {
    // The intervals lying wholly below `x` form a prefix.
    auto it = std::partition_point(
        intervals_.begin(), intervals_.end(), [&x](const Interval<T>& a) {
          const auto& r = a.right();
          if (r.is_unbounded()) {
            return false;
          }
          return r.is_open() ? !(x < r.value()) : r.value() < x;
        });
    return it != intervals_.end() && it->contains(x);
  }

  /**
   * Predicate that the intervals are in ascending order and that each one is
   * separated from its successor.
   */
  [[nodiscard]] bool is_canonical() const {
    for (size_t i = 1; i < intervals_.size(); ++i) {
      if (!intervals_[i].is_separated_on_left_from(intervals_[i - 1])) {
        return false;
      }
    }
    return true;
  }

  /* ********************************* */
  /*          SET OPERATIONS           */
  /* ********************************* */

  /**
   * Union of this set with a single interval.
   */
  [[nodiscard]] IntervalSet set_union(const Interval<T>& x) const {
    IntervalSet result{*this};
    result.insert(x);
    return result;
  }

  /**
   * Union of this set with another one. The intervals of the smaller set are
   * added to a copy of the larger.
   */
  [[nodiscard]] IntervalSet set_union(const IntervalSet& y) const {
    const IntervalSet& larger = size() >= y.size() ? *this : y;
    const IntervalSet& smaller = size() >= y.size() ? y : *this;
    IntervalSet result{larger};
    for (const auto& x : smaller.intervals_) {
      result.insert(x);
    }
    common::global_logger().trace(
        "IntervalSet::set_union: {} | {} -> {} intervals",
        size(),
        y.size(),
        result.size());
    return result;
  }

  /**
   * Intersection of this set with another one.
   *
   * Both sequences are scanned together. Each step intersects the current
   * pair and then moves past whichever interval ends first; when they end at
   * the same bound, past both. The pieces come out in ascending order, and
   * each is a subset of a different interval of one of the operands, so they
   * are separated from one another.
   */
  [[nodiscard]] IntervalSet intersection(const IntervalSet& y) const {
    IntervalSet result;
    size_t i = 0;
    size_t j = 0;
    while (i < intervals_.size() && j < y.intervals_.size()) {
      const Interval<T>& a = intervals_[i];
      const Interval<T>& b = y.intervals_[j];
      auto piece = a.intersection(b);
      if (piece.has_value()) {
        result.intervals_.push_back(std::move(piece.value()));
      }
      int c = compare_as_upper(a.right(), b.right());
      if (c <= 0) {
        ++i;
      }
      if (c >= 0) {
        ++j;
      }
    }
    common::global_logger().trace(
        "IntervalSet::intersection: {} & {} -> {} intervals",
        size(),
        y.size(),
        result.size());
    return result;
  }

  /**
   * Complement of this set within the whole domain.
   *
   * The result consists of the gaps: below the first interval, between each
   * pair of neighbors, and above the last. Each gap endpoint is the flip of
   * the neighboring interval's endpoint, since a point excluded from one is
   * included in the other.
   */
  [[nodiscard]] IntervalSet complement() const {
    IntervalSet result;
    if (intervals_.empty()) {
      result.intervals_.push_back(Interval<T>::universe());
      return result;
    }
    const Endpoint<T>& first = intervals_.front().left();
    if (!first.is_unbounded()) {
      result.intervals_.emplace_back(Endpoint<T>::unbounded(), first.flip());
    }
    for (size_t k = 1; k < intervals_.size(); ++k) {
      result.intervals_.emplace_back(
          intervals_[k - 1].right().flip(), intervals_[k].left().flip());
    }
    const Endpoint<T>& last = intervals_.back().right();
    if (!last.is_unbounded()) {
      result.intervals_.emplace_back(last.flip(), Endpoint<T>::unbounded());
    }
    common::global_logger().trace(
        "IntervalSet::complement: ~{} -> {} intervals",
        size(),
        result.size());
    return result;
  }

  /**
   * Points of this set that are not in `y`.
   */
  [[nodiscard]] IntervalSet difference(const IntervalSet& y) const {
    return intersection(y.complement());
  }

  IntervalSet operator|(const IntervalSet& y) const {
    return set_union(y);
  }
  IntervalSet operator|(const Interval<T>& x) const {
    return set_union(x);
  }
  IntervalSet operator&(const IntervalSet& y) const {
    return intersection(y);
  }
  IntervalSet operator-(const IntervalSet& y) const {
    return difference(y);
  }
  IntervalSet operator~() const {
    return complement();
  }

  /**
   * Sets are equal if they consist of the same intervals. Because the
   * representation is canonical, this is equality as sets of points.
   */
  bool operator==(const IntervalSet& y) const {
    return intervals_ == y.intervals_;
  }

  /**
   * Renders the set as `{I1, I2, ...}`, or `∅` if empty.
   */
  [[nodiscard]] std::string to_string() const {
    if (intervals_.empty()) {
      return "∅";
    }
    std::string s{"{"};
    for (size_t k = 0; k < intervals_.size(); ++k) {
      if (k > 0) {
        s += ", ";
      }
      s += intervals_[k].to_string();
    }
    s += "}";
    return s;
  }
};

template <IntervalDomain T>
std::ostream& operator<<(std::ostream& os, const IntervalSet<T>& x) {
  return os << x.to_string();
}

}  // namespace orderset::interval

template <orderset::interval::IntervalDomain T>
struct fmt::formatter<orderset::interval::IntervalSet<T>>
    : fmt::formatter<fmt::string_view> {
  auto format(
      const orderset::interval::IntervalSet<T>& x,
      fmt::format_context& ctx) const {
    return fmt::formatter<fmt::string_view>::format(x.to_string(), ctx);
  }
};

#endif  // ORDERSET_INTERVAL_SET_H
