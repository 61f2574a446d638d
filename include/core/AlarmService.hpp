#pragma once
/** @file  AlarmService.hpp
 *  @brief Public boundary of the alarm core: CRUD, control, status and the poll loop.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Reveille headers
#include "core/PeriodicTask.hpp"
#include "core/Result.hpp"
#include "core/TriggerEngine.hpp"
#include "schedule/AlarmRecords.hpp"
#include "schedule/OverrideLifecycle.hpp"
#include "schedule/ScheduleStore.hpp"

namespace reveille::io {
  class DeviceHub;
}

namespace reveille::core {

  class ErrorMonitor;
  class Logger;
  class SettingsStore;

  /// Caller-supplied fields for a new alarm; strings are validated here.
  struct AlarmRequest {
    std::string time;              ///< "HH:MM"
    std::vector<std::string> days; ///< "monday" / "mon", any case
    std::string sound{ schedule::kDefaultSound };
    bool enabled{ true };
    std::string label;
  };

  struct AlarmUpdate {
    std::optional<std::string> time;
    std::optional<std::vector<std::string>> days;
    std::optional<std::string> sound;
    std::optional<bool> enabled;
    std::optional<std::string> label;
  };

  struct OverrideRequest {
    std::string alarmId;
    std::string targetDate; ///< "YYYY-MM-DD"
    std::optional<std::string> overrideTime;
    std::optional<std::string> overrideSound;
    bool skip{ false };
  };

  /// A supplied empty string clears that field back to the alarm's own value.
  struct OverrideUpdate {
    std::optional<std::string> overrideTime;
    std::optional<std::string> overrideSound;
    std::optional<bool> skip;
  };

  struct SettingsPatch {
    std::optional<int> snoozeMinutes;
    std::optional<int> timeoutMinutes;
    std::optional<int> volume;
    std::optional<int> displayBrightness;
  };

  struct SystemStatus {
    schedule::LocalTime now{};
    bool ringing{ false };
    bool snoozed{ false };
    std::optional<std::string> ringingAlarmId;
    std::optional<schedule::Occurrence> nextAlarm;
  };

  /**
 * @class AlarmService
 * @brief The explicit context object: owns the store, engine and poll ticker
 *        behind one mutex.
 *
 *  * Every public call holds `mtx_` for its whole read-modify-write, and so
 *    does each poll tick. Store writes happen under the lock and are assumed
 *    to be fast local I/O.
 *  * Rejections come back as `Status`, never as exceptions.
 *  * `stop()` halts the ticker and then forces the engine idle, so no sound or
 *    indicator outlives the service.
 */
  class AlarmService {
  public:
    AlarmService(std::shared_ptr<schedule::ScheduleRepository> repo,
                 std::shared_ptr<io::DeviceHub> devices, std::shared_ptr<SettingsStore> settings,
                 std::shared_ptr<Logger> log, std::shared_ptr<ErrorMonitor> errors);
    ~AlarmService();

    //---lifecycle--------------------------------------------------------
    /// Load records, drop orphaned and stale overrides. Call before start().
    bool load();
    void start(); ///< begin the poll loop
    void stop();  ///< halt the poll loop and force dismiss
    bool running() const { return task_.running(); }

    //---alarms------------------------------------------------------------
    Result<schedule::AlarmDefinition> createAlarm(const AlarmRequest& req);
    std::optional<schedule::AlarmDefinition> getAlarm(const std::string& id) const;
    std::vector<schedule::AlarmDefinition> listAlarms() const;
    Result<schedule::AlarmDefinition> updateAlarm(const std::string& id, const AlarmUpdate& upd);
    Status deleteAlarm(const std::string& id); ///< cascades to the alarm's overrides
    Result<schedule::AlarmDefinition> toggleAlarm(const std::string& id);

    //---overrides---------------------------------------------------------
    Result<schedule::Override> createOverride(const OverrideRequest& req);
    std::optional<schedule::Override> getOverride(const std::string& id) const;
    std::optional<schedule::Override> getOverrideFor(const std::string& alarmId,
                                                     const std::string& date) const;
    std::vector<schedule::Override> listOverrides() const;
    Result<schedule::Override> updateOverride(const std::string& id, const OverrideUpdate& upd);
    Status deleteOverride(const std::string& id);

    //---control & status---------------------------------------------------
    bool snooze();  ///< false if nothing was ringing
    bool dismiss(); ///< false if nothing was ringing
    bool isRinging() const;
    RingingState ringingState() const;
    std::optional<schedule::Occurrence> nextAlarmInfo() const;
    SystemStatus status() const;

    /// One synchronous poll cycle (what the ticker runs every interval).
    TickOutcome pollOnce();

    /// Clamp, store and apply to devices. Returns the values actually stored.
    SettingsPatch updateSettings(const SettingsPatch& patch);

  private:
    std::shared_ptr<io::DeviceHub> devices_;
    std::shared_ptr<SettingsStore> settings_;
    std::shared_ptr<Logger> log_;
    std::shared_ptr<ErrorMonitor> errors_;

    mutable std::mutex mtx_; ///< guards store_ and engine_
    schedule::ScheduleStore store_;
    schedule::OverrideLifecycle lifecycle_;
    TriggerEngine engine_;
    PeriodicTask task_;
  };

} // namespace reveille::core
