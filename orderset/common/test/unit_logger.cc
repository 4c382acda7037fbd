/**
 * @file   orderset/common/test/unit_logger.cc
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
 * This file tests class Logger and the library's global logger.
 */

#include <test/support/orderset_catch.h>

#include "orderset/common/logger.h"

using namespace orderset::common;

TEST_CASE("Logger - level", "[logger]") {
  Logger log{"unit-logger-level", Logger::Level::WARN};
  CHECK(log.name() == "unit-logger-level");
  CHECK(log.level() == Logger::Level::WARN);
  CHECK(log.should_log(Logger::Level::FATAL));
  CHECK(log.should_log(Logger::Level::ERR));
  CHECK(log.should_log(Logger::Level::WARN));
  CHECK(!log.should_log(Logger::Level::INFO));
  CHECK(!log.should_log(Logger::Level::TRACE));

  log.set_level(Logger::Level::TRACE);
  CHECK(log.level() == Logger::Level::TRACE);
  CHECK(log.should_log(Logger::Level::DBG));
  CHECK(log.should_log(Logger::Level::TRACE));

  log.set_level(Logger::Level::FATAL);
  CHECK(!log.should_log(Logger::Level::ERR));

  // Below the level; not formatted, not written
  log.trace("trace {}", 1);
  log.debug("debug {} {}", "a", 2);
  log.error("error {}", 3.5);
}

TEST_CASE("Logger - global", "[logger]") {
  Logger& g = global_logger();
  CHECK(&g == &global_logger());
  CHECK(g.name() == "orderset");
  CHECK(g.level() == Logger::Level::ERR);
  CHECK(!g.should_log(Logger::Level::TRACE));

  SECTION("level set directly") {
    g.set_level(Logger::Level::TRACE);
    CHECK(global_logger().should_log(Logger::Level::TRACE));
    global_logger().trace("trace {}", "enabled");
    g.set_level(Logger::Level::ERR);
    CHECK(!global_logger().should_log(Logger::Level::TRACE));
  }
}
