/**
 * @file   test/support/orderset_catch.h
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
 * This file wraps the Catch2 headers used by the unit tests and adds string
 * conversions for the types that appear in test assertions.
 */

#ifndef ORDERSET_TEST_SUPPORT_ORDERSET_CATCH_H
#define ORDERSET_TEST_SUPPORT_ORDERSET_CATCH_H

#include <catch2/catch_all.hpp>

#include <optional>
#include <string>

namespace Catch {
template <typename T>
struct StringMaker<std::optional<T>> {
  static std::string convert(std::optional<T> const& value) {
    if (value.has_value()) {
      return "Some(" + StringMaker<T>::convert(value.value()) + ")";
    } else {
      return "None";
    }
  }
};
}  // namespace Catch

#endif  // ORDERSET_TEST_SUPPORT_ORDERSET_CATCH_H
