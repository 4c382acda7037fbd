/**
 * @file   orderset/common/exception/exception.h
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
 * This file defines the base exception class of the library.
 */

#ifndef ORDERSET_COMMON_EXCEPTION_H
#define ORDERSET_COMMON_EXCEPTION_H

#include <exception>
#include <string>

namespace orderset::common {

/**
 * Base class of the exceptions thrown by the library.
 *
 * An exception carries the vicinity where it originated separately from its
 * message so that subclasses can fix the origin and vary only the message.
 * `what()` reads "origin: message".
 */
class OrdersetException : public std::exception {
  /** Vicinity where the exception originated */
  std::string origin_;

  /** Specific error message */
  std::string message_;

  /**
   * Text returned by `what()`. Built on construction so that the pointer
   * returned by `what()` stays valid for the lifetime of the exception.
   */
  std::string what_;

 public:
  OrdersetException() = delete;

  /**
   * @param origin Vicinity where the exception originated
   * @param message Error message
   */
  OrdersetException(const std::string& origin, const std::string& message);

  [[nodiscard]] const std::string& origin() const noexcept {
    return origin_;
  }

  [[nodiscard]] const std::string& message() const noexcept {
    return message_;
  }

  const char* what() const noexcept override;
};

}  // namespace orderset::common

#endif  // ORDERSET_COMMON_EXCEPTION_H
