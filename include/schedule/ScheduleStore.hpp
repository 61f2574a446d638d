#pragma once
/** @file  ScheduleStore.hpp
 *  @brief In-memory alarm/override maps with save-on-write to a ScheduleRepository.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <functional>
#include <memory>
#include <random>
#include <string>

// Reveille headers
#include "core/Result.hpp"
#include "schedule/AlarmRecords.hpp"
#include "schedule/ScheduleRepository.hpp"

namespace reveille::core {
  class Logger;
  class ErrorMonitor;
} // namespace reveille::core

namespace reveille::schedule {

  /**
 * @class ScheduleStore
 * @brief Owns every AlarmDefinition and Override and keeps the repository in step.
 *
 *  * Not synchronised. The owning AlarmService holds its lock around each call.
 *  * Every mutation is persisted before returning. A failed write keeps the
 *    in-memory change and reports `Status::NotPersisted`.
 *  * Enforces at most one Override per (alarmId, targetDate), and that an
 *    Override only ever points at an existing alarm.
 */
  class ScheduleStore {
  public:
    using OverridePredicate = std::function<bool(const Override&)>;

    ScheduleStore(std::shared_ptr<ScheduleRepository> repo, std::shared_ptr<core::Logger> log,
                  std::shared_ptr<core::ErrorMonitor> errors);

    /// Replace the in-memory maps with the repository's. @returns false if it could not be read.
    bool load();

    //---queries---------------------------------------------------------
    const AlarmMap& alarms() const { return alarms_; }
    const OverrideMap& overrides() const { return overrides_; }

    const AlarmDefinition* findAlarm(const std::string& id) const;
    const Override* findOverride(const std::string& id) const;
    const Override* findOverrideFor(const std::string& alarmId, const Date& date) const;

    //---alarms------------------------------------------------------------
    /// Assigns a fresh id to \p draft; any id it carries is ignored.
    core::Result<AlarmDefinition> createAlarm(AlarmDefinition draft);
    core::Result<AlarmDefinition> updateAlarm(const std::string& id, const AlarmPatch& patch);
    core::Result<AlarmDefinition> toggleAlarm(const std::string& id);
    /// Removes the alarm only; dependent overrides are the caller's (OverrideLifecycle) job.
    core::Status deleteAlarm(const std::string& id);

    //---overrides---------------------------------------------------------
    /// NotFound if the alarm is unknown, Conflict if (alarmId, targetDate) is taken.
    core::Result<Override> createOverride(Override draft);
    core::Result<Override> updateOverride(const std::string& id, const OverridePatch& patch);
    core::Status deleteOverride(const std::string& id);
    /// Bulk delete with a single write. Value is the number removed.
    core::Result<std::size_t> eraseOverridesIf(const OverridePredicate& pred);

  private:
    template <typename Map> std::string nextId(const Map& taken);

    bool persistAlarms();
    bool persistOverrides();
    void reportFailure(const std::string& what);

    std::shared_ptr<ScheduleRepository> repo_;
    std::shared_ptr<core::Logger> log_;
    std::shared_ptr<core::ErrorMonitor> errors_;

    AlarmMap alarms_;
    OverrideMap overrides_;
    std::mt19937 rng_;
  };

} // namespace reveille::schedule
