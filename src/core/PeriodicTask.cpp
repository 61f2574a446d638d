/* @file PeriodicTask.cpp
 * @brief stop_token driven ticker used for the alarm poll loop
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <exception>

// Reveille headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/PeriodicTask.hpp"

using namespace reveille::core;

PeriodicTask::PeriodicTask(std::string name, std::shared_ptr<Logger> log,
                           std::shared_ptr<ErrorMonitor> errors)
    : name_(std::move(name)), log_(std::move(log)), errors_(std::move(errors)) {}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::start(std::function<std::chrono::seconds()> interval, Callback cb) {
  if (worker_.joinable())
    return;

  worker_ = std::jthread([this, interval = std::move(interval), cb = std::move(cb)](
                             std::stop_token st) { loop(st, interval, cb); });
  log_->info(name_, "Thread started");
}

void PeriodicTask::stop() {
  if (!worker_.joinable())
    return;

  worker_.request_stop();
  cv_.notify_all();
  worker_.join();
  worker_ = std::jthread{};
  log_->info(name_, "Thread stopped");
}

void PeriodicTask::loop(std::stop_token st, std::function<std::chrono::seconds()> interval,
                        Callback cb) {
  while (!st.stop_requested()) {
    runOnce(cb);

    // wait out the interval in slices; a stop request wakes us immediately
    const auto deadline = std::chrono::steady_clock::now() + interval();
    std::unique_lock lock(mtx_);
    while (!st.stop_requested()) {
      const auto left = deadline - std::chrono::steady_clock::now();
      if (left <= std::chrono::steady_clock::duration::zero())
        break;
      const auto slice = std::min<std::chrono::steady_clock::duration>(left, kWaitSlice);
      cv_.wait_for(lock, st, slice, [] { return false; });
    }
  }
}

void PeriodicTask::runOnce(const Callback& cb) {
  try {
    cb();
  } catch (const std::exception& e) {
    const std::string msg = std::string("tick failed: ") + e.what();
    log_->error(name_, msg);
    errors_->notifyFailure("[" + name_ + "] " + msg);
  }
}
