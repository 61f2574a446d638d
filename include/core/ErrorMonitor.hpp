#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Collects daemon faults and escalates each distinct one to the coordinator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace reveille::core {

  /// One distinct failure message and how often it has been reported.
  struct Fault {
    std::string message;
    std::chrono::system_clock::time_point firstSeen{};
    std::size_t occurrences{ 0 };
  };

  /**
 * @class ErrorMonitor
 * @brief The store, the poll ticker and device negotiation report here;
 *        the escalation callback runs once per distinct message.
 *
 * * Thread-safe.
 * * A fault that repeats every poll tick (e.g. a read-only data directory)
 *   is escalated once and afterwards only counted.
 */
  class ErrorMonitor {
  public:
    using Escalation = std::function<void(const std::string&)>;

    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    void registerEscalation(Escalation cb);

    virtual void notifyFailure(const std::string& message);

    /// Forget every recorded fault so the next occurrence escalates again.
    void reset();

    std::size_t faultCount() const; ///< distinct messages since the last reset()
    std::vector<Fault> faults() const; ///< oldest first

  private:
    Escalation escalation_{};
    std::vector<Fault> faults_;
    mutable std::mutex mtx_;
  };

} // namespace reveille::core
