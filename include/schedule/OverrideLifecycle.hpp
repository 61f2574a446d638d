#pragma once
/** @file  OverrideLifecycle.hpp
 *  @brief Expiry and referential-integrity sweeps over stored overrides.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <memory>
#include <string>

#include "core/Result.hpp"
#include "schedule/Calendar.hpp"

namespace reveille::core {
  class Logger;
}

namespace reveille::schedule {

  class ScheduleStore;

  /**
 * @class OverrideLifecycle
 * @brief Deletes overrides that can no longer apply.
 *
 *  * Each sweep is a single store write; the Result value is the number removed.
 *  * Caller holds the store's owning lock.
 */
  class OverrideLifecycle {
  public:
    OverrideLifecycle(ScheduleStore& store, std::shared_ptr<core::Logger> log);

    /// Drop overrides dated yesterday or earlier. Today's survive until dismissed.
    core::Result<std::size_t> cleanupExpired(LocalTime now);

    /// Part of alarm deletion; never scheduled on its own.
    core::Result<std::size_t> cascadeDeleteForAlarm(const std::string& alarmId);

    /// Drop overrides whose alarm no longer exists (e.g. hand-edited store files).
    core::Result<std::size_t> purgeOrphans();

  private:
    ScheduleStore& store_;
    std::shared_ptr<core::Logger> log_;
  };

} // namespace reveille::schedule
