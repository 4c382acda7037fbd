/**
 * @file   orderset/common/logger.cc
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
 * This file defines class Logger.
 */

#include <spdlog/spdlog.h>

#ifdef _WIN32
#include <spdlog/sinks/stdout_sinks.h>
#else
#include <spdlog/sinks/stdout_color_sinks.h>
#endif

#include "orderset/common/logger.h"

namespace orderset::common {

namespace {
spdlog::level::level_enum to_spdlog_level(Logger::Level lvl) {
  switch (lvl) {
    case Logger::Level::FATAL:
      return spdlog::level::critical;
    case Logger::Level::ERR:
      return spdlog::level::err;
    case Logger::Level::WARN:
      return spdlog::level::warn;
    case Logger::Level::INFO:
      return spdlog::level::info;
    case Logger::Level::DBG:
      return spdlog::level::debug;
    case Logger::Level::TRACE:
      return spdlog::level::trace;
  }
  return spdlog::level::trace;
}
}  // namespace

Logger::Logger(const std::string& name, Level level)
    : name_(name)
    , level_(level) {
  logger_ = spdlog::get(name_);
  if (logger_ == nullptr) {
#ifdef _WIN32
    logger_ = spdlog::stdout_logger_mt(name_);
#else
    logger_ = spdlog::stdout_color_mt(name_);
#endif
    // [date time.ms] [level] [name] message
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
  }
  set_level(level);
}

Logger::~Logger() {
  spdlog::drop(name_);
}

void Logger::trace(const std::string& msg) {
  logger_->trace(msg);
}

void Logger::debug(const std::string& msg) {
  logger_->debug(msg);
}

void Logger::error(const std::string& msg) {
  logger_->error(msg);
}

bool Logger::should_log(Level lvl) const {
  return logger_->should_log(to_spdlog_level(lvl));
}

void Logger::set_level(Level lvl) {
  level_ = lvl;
  logger_->set_level(to_spdlog_level(lvl));
}

Logger& global_logger() {
  // Never deallocated, so that logging stays valid during static destruction.
  static Logger* l = new Logger("orderset", Logger::Level::ERR);
  return *l;
}

}  // namespace orderset::common
