#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>

namespace proctask::log {

enum class Level : std::uint8_t {
  Trace,
  Debug,
  Info,
  Warn,
  Error
};

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto level_color(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view colors[] = {
      "\033[90m",  // trace: gray
      "\033[36m",  // debug: cyan
      "\033[32m",  // info: green
      "\033[33m",  // warn: yellow
      "\033[31m"   // error: red
  };
  return colors[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace")
    return Level::Trace;
  if (name == "debug")
    return Level::Debug;
  if (name == "warn")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  return Level::Info;
}

// Writes on the calling thread. Tasks are polled from caller threads and the
// engine owns no threads of its own, so there is no background writer.
class Logger {
  struct FileCloser {
    auto operator()(std::FILE* f) const noexcept -> void {
      if (f) {
        std::fclose(f);
      }
    }
  };

  std::mutex mutex_;
  Level level_{Level::Info};
  std::unique_ptr<std::FILE, FileCloser> file_;
  bool color_{true};

public:
  Logger() = default;

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto set_level(Level level) noexcept -> void {
    std::lock_guard lock(mutex_);
    level_ = level;
  }

  [[nodiscard]] auto level() noexcept -> Level {
    std::lock_guard lock(mutex_);
    return level_;
  }

  // Empty path restores stderr.
  [[nodiscard]] auto set_file(const std::string& path) -> bool {
    std::lock_guard lock(mutex_);
    if (path.empty()) {
      file_.reset();
      color_ = true;
      return true;
    }
    std::FILE* f = std::fopen(path.c_str(), "a");
    if (!f) {
      return false;
    }
    file_.reset(f);
    color_ = false;
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    std::lock_guard lock(mutex_);
    if (level < level_)
      return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    std::FILE* out = file_ ? file_.get() : stderr;

    if (color_) {
      std::print(out, "[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                 level_color(level), level_name(level), "\033[0m", tid,
                 std::format(fmt, std::forward<Args>(args)...));
    } else {
      std::print(out, "[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", time,
                 level_name(level), tid,
                 std::format(fmt, std::forward<Args>(args)...));
    }
    std::fflush(out);
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

[[nodiscard]] inline auto set_file(const std::string& path) -> bool {
  return logger().set_file(path);
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace proctask::log
