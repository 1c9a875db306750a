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
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace lockstep::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

inline constexpr std::array<std::string_view, 5> level_names = {
    "trace", "debug", "info", "warn", "error"};

inline constexpr std::array<std::string_view, 5> level_colors = {
    "\o{33}[90m", "\o{33}[36m", "\o{33}[32m", "\o{33}[33m", "\o{33}[31m"};

[[nodiscard]] inline auto level_name(Level level) -> std::string_view {
  return level_names.at(std::to_underlying(level));
}

// Where formatted lines end up. Guarded by a mutex because both the writer
// thread and synchronous fallbacks write through it.
class Sink {
public:
  Sink() = default;
  ~Sink() { close_file(); }

  Sink(const Sink &) = delete;
  auto operator=(const Sink &) -> Sink & = delete;

  auto use_stream(FILE *stream) -> void {
    std::scoped_lock lock(mu_);
    close_file();
    out_ = stream;
  }

  auto use_file(std::string_view path) -> bool {
    FILE *f = std::fopen(std::string(path).c_str(), "a");
    if (f == nullptr) {
      return false;
    }
    std::setvbuf(f, nullptr, _IOLBF, 0);
    std::scoped_lock lock(mu_);
    close_file();
    file_ = f;
    out_ = f;
    return true;
  }

  auto write(std::span<const std::string> lines) -> void {
    std::scoped_lock lock(mu_);
    for (const auto &line : lines) {
      std::fwrite(line.data(), 1, line.size(), out_);
    }
    std::fflush(out_);
  }

  [[nodiscard]] auto colored() const noexcept -> bool {
    return file_ == nullptr;
  }

private:
  auto close_file() -> void {
    if (file_ != nullptr) {
      std::fclose(file_);
      file_ = nullptr;
    }
  }

  std::mutex mu_;
  FILE *out_{stdout};
  FILE *file_{nullptr};
};

// Producers format on their own thread and hand the line to a channel; a
// single writer thread batches lines into the sink. Before start() and after
// stop() lines are written synchronously.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;
  using LineChannel = boost::asio::experimental::concurrent_channel<
      boost::asio::io_context::executor_type,
      void(boost::system::error_code, std::string)>;

public:
  Logger() = default;
  ~Logger() { stop(); }

  Logger(const Logger &) = delete;
  auto operator=(const Logger &) -> Logger & = delete;

  auto start() -> void {
    std::scoped_lock lock(lifecycle_mu_);
    if (channel_) {
      return;
    }
    writer_ctx_.restart();
    channel_ =
        std::make_shared<LineChannel>(writer_ctx_.get_executor(), kQueueCapacity);
    active_.store(channel_, std::memory_order_release);
    writer_ = std::jthread([this, ch = channel_] { drain(ch); });
  }

  auto stop() -> void {
    std::scoped_lock lock(lifecycle_mu_);
    if (!channel_) {
      return;
    }
    active_.store(nullptr, std::memory_order_release);
    channel_->close();
    if (writer_.joinable()) {
      writer_.join();
    }
    channel_.reset();
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  auto sink() noexcept -> Sink & { return sink_; }

  [[nodiscard]] auto dropped() const noexcept -> std::uint64_t {
    return dropped_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args &&...args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) {
      return;
    }
    auto line = render(level, std::format(fmt, std::forward<Args>(args)...));

    auto ch = active_.load(std::memory_order_acquire);
    if (!ch) {
      sink_.write(std::span{&line, 1});
      return;
    }
    if (!ch->try_send(boost::system::error_code{}, std::move(line))) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
  }

private:
  [[nodiscard]] auto render(Level level, std::string message) const
      -> std::string {
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;
    if (sink_.colored()) {
      return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}{}\o{33}[0m] [{}] {}\n",
                         now, level_colors.at(std::to_underlying(level)),
                         level_name(level), tid, message);
    }
    return std::format("[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] {}\n", now,
                       level_name(level), tid, message);
  }

  auto drain(std::shared_ptr<LineChannel> ch) -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatchSize);
    bool open = true;

    while (open) {
      batch.clear();
      ch->async_receive(
          [&](const boost::system::error_code &ec, std::string line) {
            if (ec) {
              open = false;
              return;
            }
            batch.push_back(std::move(line));
          });
      writer_ctx_.restart();
      writer_ctx_.run();

      while (batch.size() < kBatchSize &&
             ch->try_receive(
                 [&](const boost::system::error_code &ec, std::string line) {
                   if (!ec) {
                     batch.push_back(std::move(line));
                   }
                 })) {
      }
      if (!batch.empty()) {
        sink_.write(batch);
      }
    }
  }

  std::atomic<Level> level_{Level::Info};
  std::atomic<std::uint64_t> dropped_{0};
  Sink sink_;
  std::mutex lifecycle_mu_;
  boost::asio::io_context writer_ctx_{1};
  std::shared_ptr<LineChannel> channel_;
  std::atomic<std::shared_ptr<LineChannel>> active_;
  std::jthread writer_;
};

inline auto logger() -> Logger & {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

// Unknown names fall back to info.
inline auto set_level(std::string_view name) noexcept -> void {
  const auto *it = std::ranges::find(level_names, name);
  logger().set_level(
      it != level_names.end()
          ? static_cast<Level>(std::distance(level_names.begin(), it))
          : Level::Info);
}

inline auto set_output_stderr() -> void { logger().sink().use_stream(stderr); }

inline auto set_output_file(std::string_view path) -> bool {
  if (path.empty()) {
    logger().sink().use_stream(stdout);
    return true;
  }
  return logger().sink().use_file(path);
}

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

} // namespace lockstep::log
