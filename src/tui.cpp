#include "tui.h"


#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

using hijack::tui::level;

constexpr std::size_t kSeverityLabelWidth{ 3 };
constexpr std::chrono::milliseconds kFlushIntervalMs{ 50 };

struct log_event {
  std::chrono::system_clock::time_point timestamp;
  level severity;
  std::string message;
};

struct tui {
  std::queue<log_event> messages;
  std::function<void(std::string_view)> output_handler;
  std::thread worker;
  std::mutex mutex;         // protects messages queue and cv
  std::mutex stdout_mutex;  // protects raw stdout writes in print_stdout()
  std::condition_variable cv;
  std::atomic_bool stop_requested{ false };
  std::optional<level> level_threshold;
  bool decorated{ false };
  bool initialized{ false };
} s_tui{};

namespace {

std::string_view level_to_string(level value) {
  switch (value) {
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "UNKNOWN";
}

std::string format_prefix(log_event const &ev) {
  if (!s_tui.decorated) { return {}; }

  auto const seconds{ std::chrono::time_point_cast<std::chrono::seconds>(ev.timestamp) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(ev.timestamp - seconds).count()
  };

  std::time_t const timestamp{ std::chrono::system_clock::to_time_t(ev.timestamp) };
  std::tm local_tm{};
  localtime_r(&timestamp, &local_tm);

  char timestamp_buf[32]{};
  if (std::strftime(timestamp_buf, sizeof timestamp_buf, "%Y-%m-%d %H:%M:%S", &local_tm) ==
      0) {
    return {};
  }

  std::ostringstream oss;
  oss << '[' << timestamp_buf << '.' << std::setfill('0') << std::setw(3) << millis
      << "] [" << std::left << std::setfill(' ') << std::setw(kSeverityLabelWidth)
      << level_to_string(ev.severity) << "] ";
  return oss.str();
}

void flush_messages(std::queue<log_event> &pending,
                    std::function<void(std::string_view)> const &handler) {
  bool wrote_to_stderr{ false };

  while (!pending.empty()) {
    auto ev{ std::move(pending.front()) };
    pending.pop();

    std::string output{ format_prefix(ev) };
    output.reserve(output.size() + ev.message.size() + 1);
    output.append(ev.message);
    output.push_back('\n');

    if (handler) {
      handler(output);
    } else {
      std::fwrite(output.data(), 1, output.size(), stderr);
      wrote_to_stderr = true;
    }
  }

  if (wrote_to_stderr) { std::fflush(stderr); }
}

void worker_thread() {
  std::unique_lock<std::mutex> lock{ s_tui.mutex };

  while (!s_tui.stop_requested) {
    std::queue<log_event> pending;
    pending.swap(s_tui.messages);
    lock.unlock();

    try {
      flush_messages(pending, s_tui.output_handler);
    } catch (std::exception const &e) {
      std::fprintf(stderr, "[TUI worker thread exception: %s]\n", e.what());
      std::fflush(stderr);
    }

    lock.lock();
    s_tui.cv.wait_until(lock, std::chrono::steady_clock::now() + kFlushIntervalMs, [] {
      return s_tui.stop_requested.load() || !s_tui.messages.empty();
    });
  }

  // Final flush on shutdown
  std::queue<log_event> pending;
  pending.swap(s_tui.messages);
  lock.unlock();

  try {
    flush_messages(pending, s_tui.output_handler);
  } catch (std::exception const &e) {
    std::fprintf(stderr, "[TUI final flush exception: %s]\n", e.what());
    std::fflush(stderr);
  }
}

void log_formatted(level severity, char const *fmt, va_list args) {
  if (!s_tui.initialized || fmt == nullptr) { return; }
  if (s_tui.level_threshold && severity < *s_tui.level_threshold) { return; }

  std::string buffer(1024, '\0');

  va_list args_copy;
  va_copy(args_copy, args);
  int written{ std::vsnprintf(buffer.data(), buffer.size(), fmt, args) };
  if (written <= 0) {
    va_end(args_copy);
    return;
  }

  if (static_cast<std::size_t>(written) >= buffer.size()) {
    buffer.resize(static_cast<std::size_t>(written) + 1);
    written = std::vsnprintf(buffer.data(), buffer.size(), fmt, args_copy);
  }
  va_end(args_copy);

  if (written <= 0) { return; }
  buffer.resize(static_cast<std::size_t>(written));

  log_event ev{ .timestamp = std::chrono::system_clock::now(),
                .severity = severity,
                .message = std::move(buffer) };

  {
    std::lock_guard<std::mutex> lock{ s_tui.mutex };
    s_tui.messages.push(std::move(ev));
  }

  s_tui.cv.notify_one();
}

}  // namespace

namespace hijack::tui {

void init() {
  if (s_tui.initialized) {
    throw std::logic_error{ "hijack::tui::init called more than once" };
  }

  s_tui.level_threshold = level::TUI_INFO;
  s_tui.decorated = false;
  s_tui.initialized = true;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  if (!s_tui.initialized) {
    throw std::logic_error{ "hijack::tui::set_output_handler called before init" };
  }

  if (s_tui.worker.joinable()) {
    throw std::logic_error{ "hijack::tui::set_output_handler called while running" };
  }

  std::lock_guard<std::mutex> lock{ s_tui.mutex };
  s_tui.output_handler = std::move(handler);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  if (!s_tui.initialized) {
    throw std::logic_error{ "hijack::tui::run called before init" };
  }

  if (s_tui.worker.joinable()) {
    throw std::logic_error{ "hijack::tui::run called while already running" };
  }

  s_tui.level_threshold = std::move(threshold);
  s_tui.decorated = decorated_logging;
  s_tui.stop_requested = false;
  s_tui.worker = std::thread{ worker_thread };
}

void shutdown() {
  if (!s_tui.worker.joinable()) {
    throw std::logic_error{ "hijack::tui::shutdown called while not running" };
  }

  s_tui.stop_requested = true;
  s_tui.cv.notify_all();
  s_tui.worker.join();
  s_tui.worker = std::thread{};
  s_tui.stop_requested = false;
}

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_DEBUG, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_INFO, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_WARN, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_formatted(level::TUI_ERROR, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  std::lock_guard<std::mutex> lock{ s_tui.stdout_mutex };

  va_list args;
  va_start(args, fmt);
  int const written{ std::vprintf(fmt, args) };
  va_end(args);

  if (written > 0) { std::fflush(stdout); }
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!s_tui.initialized) { return; }
  run(std::move(threshold), decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace hijack::tui
