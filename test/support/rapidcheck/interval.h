/**
 * @file   test/support/rapidcheck/interval.h
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
 * This file defines rapidcheck generators for intervals and interval sets.
 *
 * Values are drawn from a narrow range so that generated intervals often share
 * endpoints, which is where the open/closed distinctions matter.
 */

#ifndef ORDERSET_RAPIDCHECK_INTERVAL_H
#define ORDERSET_RAPIDCHECK_INTERVAL_H

#include <test/support/orderset_rapidcheck.h>

#include "orderset/interval/interval_set.h"

#include <tuple>
#include <utility>
#include <vector>

namespace rc {
using orderset::interval::Endpoint;
using orderset::interval::Interval;
using orderset::interval::IntervalSet;

namespace detail {
/**
 * Endpoint from a kind code: 0 open, 1 closed, anything else unbounded.
 */
inline Endpoint<int> make_endpoint(int kind, int value) {
  switch (kind) {
    case 0:
      return Endpoint<int>::open(value);
    case 1:
      return Endpoint<int>::closed(value);
    default:
      return Endpoint<int>::unbounded();
  }
}
}  // namespace detail

template <>
struct Arbitrary<Interval<int>> {
  static Gen<Interval<int>> arbitrary() {
    auto kind = gen::weightedElement<int>({{4, 0}, {4, 1}, {1, 2}});
    return gen::map(
        gen::tuple(gen::inRange(-10, 11), gen::inRange(-10, 11), kind, kind),
        [](const std::tuple<int, int, int, int>& t) {
          auto [a, b, left_kind, right_kind] = t;
          if (b < a) {
            std::swap(a, b);
          }
          if (a == b && left_kind != 2 && right_kind != 2) {
            // The only bounded interval with equal values is a single point.
            left_kind = 1;
            right_kind = 1;
          }
          return Interval<int>(
              detail::make_endpoint(left_kind, a),
              detail::make_endpoint(right_kind, b));
        });
  }
};

template <>
struct Arbitrary<IntervalSet<int>> {
  static Gen<IntervalSet<int>> arbitrary() {
    return gen::map(
        gen::resize(
            12,
            gen::container<std::vector<Interval<int>>>(
                gen::arbitrary<Interval<int>>())),
        [](const std::vector<Interval<int>>& xs) {
          IntervalSet<int> s;
          for (const auto& x : xs) {
            s = s.set_union(x);
          }
          return s;
        });
  }
};

}  // namespace rc

#endif  // ORDERSET_RAPIDCHECK_INTERVAL_H
