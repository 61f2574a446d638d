/* @file Logger.cpp
 * @brief asynchronous CSV run log: producers enqueue, one worker thread writes
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <vector>

// Reveille headers
#include "core/Logger.hpp"
#include "core/RingBuffer.hpp"

using namespace reveille::core;

const char* reveille::core::toString(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

std::optional<LogLevel> reveille::core::parseLogLevel(std::string_view name) {
  std::string key(name);
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (key == "debug")
    return LogLevel::Debug;
  if (key == "info")
    return LogLevel::Info;
  if (key == "warn" || key == "warning")
    return LogLevel::Warn;
  if (key == "error")
    return LogLevel::Error;
  return std::nullopt;
}

Logger::Logger(LogLevel minLevel, std::size_t capacity)
    : buffer_(std::make_unique<RingBuffer<LogEvent>>(capacity)), minLevel_(minLevel) {}

Logger::~Logger() { stop(); }

bool Logger::start(const std::string& path) {
  if (running_)
    return true;

  csvFile_.open(path, std::ios::out | std::ios::app);
  if (!csvFile_.is_open()) {
    std::cerr << "[Logger] cannot open run log " << path << ", logging to stderr only\n";
    return false;
  }

  running_ = true;
  worker_ = std::thread(&Logger::workerLoop, this);
  return true;
}

void Logger::log(LogEvent event) {
  if (event.level < minLevel_.load())
    return;
  if (event.timestamp == std::chrono::system_clock::time_point{})
    event.timestamp = std::chrono::system_clock::now();

  if (!running_) {
    write(event);
    return;
  }

  {
    std::lock_guard lock(mtx_);
    if (buffer_->push(std::move(event)))
      ++dropped_;
  }
  cv_.notify_one();
}

void Logger::stop() {
  {
    // flipped under mtx_ so the worker cannot miss the wake-up
    std::lock_guard lock(mtx_);
    if (!running_.exchange(false))
      return;
  }

  cv_.notify_one();
  if (worker_.joinable())
    worker_.join();

  // anything enqueued between the last wake-up and the exchange above
  std::lock_guard lock(mtx_);
  while (auto ev = buffer_->pop())
    write(*ev);

  std::lock_guard ioLock(ioMtx_);
  csvFile_.flush();
  csvFile_.close();
}

void Logger::debug(std::string component, std::string message) {
  log(LogEvent{ {}, LogLevel::Debug, std::move(component), std::move(message) });
}

void Logger::info(std::string component, std::string message) {
  log(LogEvent{ {}, LogLevel::Info, std::move(component), std::move(message) });
}

void Logger::warn(std::string component, std::string message) {
  log(LogEvent{ {}, LogLevel::Warn, std::move(component), std::move(message) });
}

void Logger::error(std::string component, std::string message) {
  log(LogEvent{ {}, LogLevel::Error, std::move(component), std::move(message) });
}

std::string Logger::formatCsv(const LogEvent& event) {
  const auto tt = std::chrono::system_clock::to_time_t(event.timestamp);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      event.timestamp.time_since_epoch())
                      .count() %
                  1000;

  std::tm tm{};
  localtime_r(&tt, &tm);
  char stamp[32];
  const auto n = std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%S", &tm);
  std::snprintf(stamp + n, sizeof(stamp) - n, ".%03lld", static_cast<long long>(ms));

  std::string quoted;
  quoted.reserve(event.message.size() + 2);
  quoted += '"';
  for (char c : event.message) {
    if (c == '"')
      quoted += '"'; // CSV escapes a quote by doubling it
    quoted += c;
  }
  quoted += '"';

  return std::string(stamp) + ',' + toString(event.level) + ',' + event.component + ',' + quoted;
}

// -------------------------------------------------------------------
// Logger::workerLoop
// Sleeps until events arrive, swaps them out under the lock and writes
// them without holding it so producers never wait on the disk.
// -------------------------------------------------------------------
void Logger::workerLoop() {
  std::vector<LogEvent> batch;

  while (true) {
    {
      std::unique_lock lock(mtx_);
      cv_.wait(lock, [this] { return !buffer_->empty() || !running_; });
      while (auto ev = buffer_->pop())
        batch.push_back(std::move(*ev));
    }

    for (const auto& ev : batch)
      write(ev);
    batch.clear();

    {
      std::lock_guard ioLock(ioMtx_);
      csvFile_.flush();
    }

    if (!running_)
      break;
  }
}

void Logger::write(const LogEvent& event) {
  const auto line = formatCsv(event);

  std::lock_guard ioLock(ioMtx_);
  if (csvFile_.is_open())
    csvFile_ << line << '\n';
  std::cerr << line << '\n';
}
