#pragma once
/** @file  Logger.hpp
 *  @brief Asynchronous CSV logger (runs its own worker thread).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace reveille {
  namespace core {

    enum class LogLevel : std::uint8_t { Debug, Info, Warn, Error };

    const char* toString(LogLevel level);
    std::optional<LogLevel> parseLogLevel(std::string_view name);

    struct LogEvent {
      std::chrono::system_clock::time_point timestamp{};
      LogLevel level{ LogLevel::Info };
      std::string component;
      std::string message;
    };

    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /**
 * @class Logger
 * @brief Producers enqueue events; a worker thread formats them as CSV lines
 *        into the run log and mirrors them to stderr.
 *
 *  * `log()` never blocks on I/O; when the buffer is full the oldest event is
 *    overwritten and counted in `dropped()`.
 *  * Before `start()` and after `stop()` events are written synchronously to
 *    stderr so nothing is lost during boot or shutdown.
 *  * Shared between components as `std::shared_ptr<Logger>`.
 */
    class Logger {

    public:
      explicit Logger(LogLevel minLevel = LogLevel::Info, std::size_t capacity = 1024);
      ~Logger(); ///< stop() if still running

      // --- public API ---
      bool start(const std::string& path); ///< open file + launch worker thread
      void log(LogEvent event);            ///< enqueue event (non-blocking)
      void stop();                         ///< flush + join worker thread

      void debug(std::string component, std::string message);
      void info(std::string component, std::string message);
      void warn(std::string component, std::string message);
      void error(std::string component, std::string message);

      void setMinLevel(LogLevel level) { minLevel_.store(level); }
      LogLevel minLevel() const { return minLevel_.load(); }
      bool running() const { return running_.load(); }
      std::size_t dropped() const { return dropped_.load(); }

      /// `timestamp,LEVEL,component,"message"` with CSV quote escaping.
      static std::string formatCsv(const LogEvent& event);

      Logger(const Logger&) = delete;
      Logger& operator=(const Logger&) = delete;

    private:
      void workerLoop();
      void write(const LogEvent& event);

      std::ofstream csvFile_;
      std::unique_ptr<RingBuffer<LogEvent>> buffer_;
      std::thread worker_;
      std::mutex mtx_;      ///< guards buffer_
      std::mutex ioMtx_;    ///< serialises file/stderr writes
      std::condition_variable cv_;
      std::atomic<bool> running_{ false };
      std::atomic<LogLevel> minLevel_;
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace reveille
