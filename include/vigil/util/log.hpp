#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <format>
#include <mutex>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace vigil::log {

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

[[nodiscard]] inline auto parse_level(std::string_view name) noexcept
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

// Async logger: producers append to a bounded deque, one writer thread
// drains it to stdout or to the configured file.
class Logger {
  static constexpr std::size_t QUEUE_CAPACITY = 8192;

  std::atomic<Level> level_{Level::Info};
  bool running_{false};
  bool accepting_{false};
  std::deque<std::string> queue_;
  std::FILE* file_{nullptr};
  std::mutex mu_;
  std::condition_variable cv_;
  std::thread writer_;

  auto write_line(std::FILE* out, const std::string& line) -> void {
    std::print(out, "{}", line);
  }

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(64);

    std::unique_lock lock(mu_);
    while (true) {
      cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
      while (!queue_.empty() && batch.size() < 64) {
        batch.push_back(std::move(queue_.front()));
        queue_.pop_front();
      }
      auto* out = file_ ? file_ : stdout;
      bool done = !running_ && queue_.empty();
      lock.unlock();

      for (const auto& msg : batch) {
        write_line(out, msg);
      }
      std::fflush(out);
      batch.clear();

      lock.lock();
      if (done) {
        break;
      }
    }
  }

  [[nodiscard]] auto format_line(Level level, bool color,
                                 std::string_view message) const
      -> std::string {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::floor<std::chrono::milliseconds>(now);
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    if (color) {
      return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}{}] [{}] {}\n", time,
                         level_color(level), level_name(level), "\033[0m",
                         tid, message);
    }
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", time,
                       level_name(level), tid, message);
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    std::lock_guard lock(mu_);
    if (running_)
      return;
    running_ = true;
    accepting_ = true;
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    {
      std::lock_guard lock(mu_);
      accepting_ = false;
      if (!running_)
        return;
      running_ = false;
    }
    cv_.notify_all();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  // Appends to path; the previous file, if any, is closed.
  [[nodiscard]] auto set_output_file(const std::string& path) -> bool {
    auto* f = std::fopen(path.c_str(), "a");
    if (!f) {
      return false;
    }
    std::lock_guard lock(mu_);
    if (file_) {
      std::fclose(file_);
    }
    file_ = f;
    return true;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire))
      return;

    auto message = std::format(fmt, std::forward<Args>(args)...);

    std::unique_lock lock(mu_);
    bool color = file_ == nullptr;
    if (!accepting_ || queue_.size() >= QUEUE_CAPACITY) {
      // Synchronous fallback before start, during shutdown or when full
      auto* out = file_ ? file_ : stdout;
      write_line(out, format_line(level, color, message));
      return;
    }
    queue_.push_back(format_line(level, color, message));
    lock.unlock();
    cv_.notify_one();
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

[[nodiscard]] inline auto set_output_file(const std::string& path) -> bool {
  return logger().set_output_file(path);
}

inline auto start() -> void {
  logger().start();
}
inline auto stop() -> void {
  logger().stop();
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

}  // namespace vigil::log
