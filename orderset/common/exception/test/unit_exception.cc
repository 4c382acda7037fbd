/**
 * @file   orderset/common/exception/test/unit_exception.cc
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
 * This file tests class OrdersetException.
 */

#include <test/support/orderset_catch.h>

#include "orderset/common/exception/exception.h"

#include <string>

using namespace orderset::common;

namespace {
class DerivedException : public OrdersetException {
 public:
  explicit DerivedException(const std::string& message)
      : OrdersetException("Derived", message) {
  }
};
}  // namespace

TEST_CASE("OrdersetException - construct and what", "[exception]") {
  OrdersetException e{"Origin", "message"};
  CHECK(e.origin() == "Origin");
  CHECK(e.message() == "message");
  CHECK(std::string(e.what()) == "Origin: message");
}

TEST_CASE("OrdersetException - copy keeps text", "[exception]") {
  OrdersetException e{"Origin", "message"};
  OrdersetException e2{e};
  CHECK(std::string(e2.what()) == "Origin: message");
}

TEST_CASE("OrdersetException - subclass fixes origin", "[exception]") {
  CHECK_THROWS_AS(throw DerivedException("bad"), OrdersetException);
  CHECK_THROWS_WITH(throw DerivedException("bad"), "Derived: bad");
  try {
    throw DerivedException("bad");
  } catch (const std::exception& e) {
    CHECK(std::string(e.what()) == "Derived: bad");
  }
}
