#pragma once

#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <functional>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace gemframe::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

[[nodiscard]] inline auto parse_level(std::string_view name)
    -> std::optional<Level> {
  const auto *it = std::ranges::find(level_names, name);
  if (it == level_names.end()) {
    return std::nullopt;
  }
  return static_cast<Level>(std::distance(level_names.begin(), it));
}

// Process-wide logger. Lines are written synchronously until start() spawns
// the writer thread; afterwards they are queued on a Boost.Asio channel and
// written in batches. A full queue falls back to a synchronous write.
class Logger {
  static constexpr std::size_t kQueueCapacity = 4096;
  static constexpr std::size_t kBatchSize = 64;
  using LogChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::mutex out_mu_;
  FILE *output_{stdout};
  FILE *file_{nullptr};
  boost::asio::io_context queue_ctx_{1};
  std::atomic<std::shared_ptr<LogChannel>> queue_;
  std::jthread writer_;

  auto write(std::string_view line) -> void {
    std::lock_guard lock(out_mu_);
    std::fwrite(line.data(), 1, line.size(), output_);
    std::fflush(output_);
  }

  // Runs until the channel is closed and empty; lines buffered before close()
  // are still received, so stop() loses nothing and order is kept.
  auto writer_loop(std::shared_ptr<LogChannel> queue) -> void {
    for (;;) {
      std::optional<std::string> first;
      boost::system::error_code recv_ec;
      queue->async_receive(
          [&](const boost::system::error_code &ec, std::string item) {
            recv_ec = ec;
            if (!ec) {
              first = std::move(item);
            }
          });
      queue_ctx_.restart();
      (void)queue_ctx_.run_one();
      if (recv_ec || !first) {
        break;
      }

      std::string batch = std::move(*first);
      for (std::size_t n = 1; n < kBatchSize; ++n) {
        if (!queue->try_receive(
                [&](const boost::system::error_code &ec, std::string item) {
                  if (!ec) {
                    batch += item;
                  }
                })) {
          break;
        }
      }
      write(batch);
    }
  }

  auto replace_output(FILE *out, FILE *owned) -> void {
    std::lock_guard lock(out_mu_);
    if (file_) {
      std::fclose(file_);
    }
    file_ = owned;
    output_ = out;
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) {
      std::fclose(file_);
    }
  }

  Logger(const Logger &) = delete;
  auto operator=(const Logger &) -> Logger & = delete;

  auto start() -> void {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    queue_ctx_.restart();
    auto queue = std::make_shared<LogChannel>(queue_ctx_.get_executor(),
                                              kQueueCapacity);
    queue_.store(queue, std::memory_order_release);
    writer_ = std::jthread([this, queue] { writer_loop(queue); });
  }

  auto stop() -> void {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    auto queue = queue_.exchange(nullptr, std::memory_order_acq_rel);
    if (!queue) {
      return;
    }
    queue->close();
    if (writer_.joinable()) {
      writer_.join();
    }
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto enabled(Level level) const noexcept -> bool {
    return level >= level_.load(std::memory_order_acquire);
  }

  auto set_output_stdout() -> void { replace_output(stdout, nullptr); }
  auto set_output_stderr() -> void { replace_output(stderr, nullptr); }

  // Empty path restores stdout.
  auto set_output_file(std::string_view path) -> bool {
    if (path.empty()) {
      set_output_stdout();
      return true;
    }
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (!f) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    replace_output(f, f);
    return true;
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (!enabled(level)) {
      return;
    }

    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    auto line = std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", now,
                            level_name(level), tid,
                            std::format(fmt, std::forward<Args>(args)...));

    auto queue = queue_.load(std::memory_order_acquire);
    if (queue && queue->try_send(boost::system::error_code{}, line)) {
      return;
    }
    write(line);
  }
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

// Unknown names leave the level unchanged.
inline auto set_level(std::string_view name) -> bool {
  auto level = parse_level(name);
  if (!level) {
    return false;
  }
  logger().set_level(*level);
  return true;
}

inline auto set_output_file(std::string_view path) -> bool {
  return logger().set_output_file(path);
}

inline auto set_output_stderr() -> void { logger().set_output_stderr(); }

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args &&...args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

} // namespace gemframe::log
