#pragma once
/** @file  TriggerEngine.hpp
 *  @brief Ringing / snoozed / timed-out state machine driven by the poll loop.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <optional>
#include <string>

// Reveille headers
#include "schedule/Calendar.hpp"
#include "schedule/OccurrenceResolver.hpp"

namespace reveille::schedule {
  class ScheduleStore;
}
namespace reveille::io {
  class DeviceHub;
}

namespace reveille::core {

  class Logger;
  class SettingsStore;

  /**
 * @struct RingingState
 * @brief Process-wide ringing bookkeeping. Never persisted; "not ringing" at boot.
 *
 *  Idle      : !ringing && !snoozeUntil
 *  Ringing   :  ringing
 *  Snoozed   : !ringing &&  snoozeUntil  (alarmId/overrideId/sound kept for the re-ring)
 */
  struct RingingState {
    bool ringing{ false };
    std::optional<std::string> alarmId;
    std::optional<std::string> overrideId;
    std::optional<schedule::LocalTime> ringingSince;
    std::optional<schedule::LocalTime> snoozeUntil;
    std::string sound; ///< captured at first trigger, reused on every re-ring

    bool snoozed() const { return !ringing && snoozeUntil.has_value(); }
    bool idle() const { return !ringing && !snoozeUntil.has_value(); }
  };

  /// What a single poll() decided; used for logging and by tests.
  enum class TickOutcome { Idle, Triggered, Retriggered, TimedOut, StillRinging, StillSnoozed };

  const char* toString(TickOutcome o);

  /**
 * @class TriggerEngine
 * @brief Owns RingingState and turns "now" into play/stop/indicator calls.
 *
 *  * Not synchronised: AlarmService holds its lock for each call so a poll tick
 *    and a snooze/dismiss from a button or handler never interleave.
 *  * Exactly one alarm is triggered per tick. Alarms are tried in ascending id
 *    order, so the lowest id wins when several share a minute.
 *  * A dismissed (or timed-out) instance consumes its override. A snoozed
 *    instance keeps it. Skip overrides never ring, so they are never consumed.
 */
  class TriggerEngine {
  public:
    TriggerEngine(schedule::ScheduleStore& store, io::DeviceHub& devices,
                  const SettingsStore& settings, std::shared_ptr<Logger> log);

    /// One poll cycle at instant \p now.
    TickOutcome poll(schedule::LocalTime now);

    /// No-op (returns false) unless ringing.
    bool snooze(schedule::LocalTime now);

    /// No-op (returns false) unless ringing.
    bool dismiss();

    /// Shutdown path: dismiss if ringing, abandon a pending snooze, release devices.
    void forceIdle();

    /// The alarm is gone; silence it if it is ringing or snoozed.
    void onAlarmDeleted(const std::string& alarmId);

    bool isRinging() const { return state_.ringing; }
    const RingingState& state() const { return state_; }

  private:
    void trigger(const std::string& alarmId, std::optional<std::string> overrideId,
                 std::string sound, schedule::LocalTime now);
    std::optional<std::string> firstDueAlarm(schedule::LocalTime now,
                                             std::optional<std::string>& overrideId,
                                             std::string& sound);
    void release();

    schedule::ScheduleStore& store_;
    io::DeviceHub& devices_;
    const SettingsStore& settings_;
    std::shared_ptr<Logger> log_;
    schedule::OccurrenceResolver resolver_;
    RingingState state_;

    // the alarm and minute of the last trigger; a dismissal inside that same
    // minute must not make it fire again on the next tick
    std::string lastFiredId_;
    schedule::LocalTime lastFiredMinute_{};
  };

} // namespace reveille::core
