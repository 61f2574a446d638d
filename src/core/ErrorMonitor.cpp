/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault aggregator; escalates each distinct failure once
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// Reveille headers
#include "core/ErrorMonitor.hpp"

using namespace reveille::core;

void ErrorMonitor::registerEscalation(Escalation cb) {
  std::lock_guard lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) {
  Escalation cb;
  {
    std::lock_guard lock(mtx_);
    const auto it = std::find_if(faults_.begin(), faults_.end(),
                                 [&](const Fault& f) { return f.message == message; });
    if (it != faults_.end()) {
      ++it->occurrences;
      return;
    }
    faults_.push_back(Fault{ message, std::chrono::system_clock::now(), 1 });
    cb = escalation_;
  }

  // outside the lock: the escalation logs and may report again
  if (cb)
    cb(message);
}

void ErrorMonitor::reset() {
  std::lock_guard lock(mtx_);
  faults_.clear();
}

std::size_t ErrorMonitor::faultCount() const {
  std::lock_guard lock(mtx_);
  return faults_.size();
}

std::vector<Fault> ErrorMonitor::faults() const {
  std::lock_guard lock(mtx_);
  return faults_;
}
