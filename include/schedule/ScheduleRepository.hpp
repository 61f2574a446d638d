#pragma once
/** @file  ScheduleRepository.hpp
 *  @brief Durable load-all / save-all seam for alarm and override records.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <stdexcept>
#include <string>

#include "schedule/AlarmRecords.hpp"

namespace reveille::schedule {

  class PersistenceError : public std::runtime_error {
  public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
  };

  /**
 * @class ScheduleRepository
 * @brief Whatever keeps the records across restarts (JSON files, embedded DB …).
 *
 *  * Every call replaces or returns the whole collection.
 *  * Implementations throw PersistenceError; ScheduleStore decides what to do with it.
 */
  class ScheduleRepository {
  public:
    virtual ~ScheduleRepository() = default;

    virtual AlarmMap loadAlarms() = 0;
    virtual OverrideMap loadOverrides() = 0;
    virtual void saveAlarms(const AlarmMap& alarms) = 0;
    virtual void saveOverrides(const OverrideMap& overrides) = 0;
  };

} // namespace reveille::schedule
