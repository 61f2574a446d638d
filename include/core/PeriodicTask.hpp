#pragma once
/** @file  PeriodicTask.hpp
 *  @brief Cancellable fixed-interval ticker on a std::jthread.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace reveille::core {

  class Logger;
  class ErrorMonitor;

  /**
 * @class PeriodicTask
 * @brief Runs a callback immediately and then once per interval until stopped.
 *
 *  * Waits on the thread's stop_token in ≤ 1 s slices, so `stop()` returns
 *    within one slice even with a long interval.
 *  * An exception escaping the callback is logged and reported; the ticker
 *    keeps going on the next interval.
 *  * Non-copyable; the destructor stops and joins.
 */
  class PeriodicTask {
  public:
    using Callback = std::function<void()>;

    PeriodicTask(std::string name, std::shared_ptr<Logger> log,
                 std::shared_ptr<ErrorMonitor> errors);
    ~PeriodicTask();

    /// Interval is re-read before every wait, so it can follow a live setting.
    void start(std::function<std::chrono::seconds()> interval, Callback cb);
    void stop();
    bool running() const { return worker_.joinable(); }

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    static constexpr std::chrono::seconds kWaitSlice{ 1 };

  private:
    void loop(std::stop_token st, std::function<std::chrono::seconds()> interval, Callback cb);
    void runOnce(const Callback& cb);

    std::string name_;
    std::shared_ptr<Logger> log_;
    std::shared_ptr<ErrorMonitor> errors_;
    std::mutex mtx_;
    std::condition_variable_any cv_;
    std::jthread worker_;
  };

} // namespace reveille::core
