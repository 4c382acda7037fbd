/**
 * @file   orderset/common/logger.h
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
 * This file defines class Logger, a thin front for an spdlog logger, and the
 * process-wide logger used by the library.
 *
 * Formatted log calls check the level first, so arguments are only formatted
 * for messages that will be written.
 */

#pragma once
#ifndef ORDERSET_LOGGER_H
#define ORDERSET_LOGGER_H

#include <spdlog/fmt/fmt.h>
#include <string>
#include <utility>

#include "orderset/common/common.h"

namespace spdlog {
class logger;
}

namespace orderset::common {

class Logger {
 public:
  /** Verbosity level, from least to most verbose. */
  enum class Level : char {
    FATAL,
    ERR,
    WARN,
    INFO,
    DBG,
    TRACE,
  };

  /**
   * Constructor. Loggers with the same name share one spdlog logger.
   *
   * @param name Name of the logger, shown in each message
   * @param level Initial verbosity
   */
  explicit Logger(const std::string& name, Level level = Level::ERR);

  ~Logger();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void trace(const std::string& msg);

  template <typename... Args>
  void trace(fmt::format_string<Args...> fmt, Args&&... args) {
    if (should_log(Level::TRACE)) {
      trace(fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  void debug(const std::string& msg);

  template <typename... Args>
  void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    if (should_log(Level::DBG)) {
      debug(fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  void error(const std::string& msg);

  template <typename... Args>
  void error(fmt::format_string<Args...> fmt, Args&&... args) {
    if (should_log(Level::ERR)) {
      error(fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  /** Predicate that messages of level `lvl` are written. */
  [[nodiscard]] bool should_log(Level lvl) const;

  [[nodiscard]] Level level() const noexcept {
    return level_;
  }

  /**
   * Set the verbosity. TRACE writes everything, FATAL only fatal messages.
   */
  void set_level(Level lvl);

  [[nodiscard]] const std::string& name() const noexcept {
    return name_;
  }

 private:
  shared_ptr<spdlog::logger> logger_;
  std::string name_;
  Level level_;
};

/**
 * The logger of the library. It is created on first use at level ERR; raise
 * it with `global_logger().set_level(Logger::Level::TRACE)` to see the
 * interval-set diagnostics.
 */
Logger& global_logger();

}  // namespace orderset::common

#endif  // ORDERSET_LOGGER_H
