/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
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
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */


#ifndef TASKD_LOG_HPP_
#define TASKD_LOG_HPP_

#include <atomic>
#include <cstring>
#include <iostream>
#include <mutex>
#include <string>

namespace taskd {

class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

  static void set_level(Level level) { min_level().store(level, std::memory_order_relaxed); }

  static bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(min_level().load(std::memory_order_relaxed));
  }

  static void log(Level level, const std::string& msg) {
    if (!enabled(level)) return;
    const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};
    std::lock_guard<std::mutex> lock(output_mutex());
    std::cerr << prefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

  // Accepts "debug", "info", "warn", "error"; anything else keeps the default.
  static Level parse_level(const char* name, Level fallback = Level::kInfo) {
    if (name == nullptr) return fallback;
    if (std::strcmp(name, "debug") == 0) return Level::kDebug;
    if (std::strcmp(name, "info") == 0) return Level::kInfo;
    if (std::strcmp(name, "warn") == 0) return Level::kWarn;
    if (std::strcmp(name, "error") == 0) return Level::kError;
    return fallback;
  }

 private:
  static std::atomic<Level>& min_level() {
    static std::atomic<Level> level{Level::kInfo};
    return level;
  }

  static std::mutex& output_mutex() {
    static std::mutex mtx;
    return mtx;
  }
};

#define TASKD_LOG_INFO(msg) ::taskd::Logger::log(::taskd::Logger::Level::kInfo, msg)
#define TASKD_LOG_WARN(msg) ::taskd::Logger::log(::taskd::Logger::Level::kWarn, msg)
#define TASKD_LOG_ERROR(msg) ::taskd::Logger::log(::taskd::Logger::Level::kError, msg)
#define TASKD_LOG_DEBUG(msg)                                         \
  do {                                                               \
    if (::taskd::Logger::enabled(::taskd::Logger::Level::kDebug)) {  \
      ::taskd::Logger::log(::taskd::Logger::Level::kDebug, msg);     \
    }                                                                \
  } while (0)

}  // namespace taskd

#endif  // TASKD_LOG_HPP_
