/* @file TriggerEngine.cpp
 * @brief poll-cycle decisions: re-ring after snooze, timeout, trigger on match
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>

// Reveille headers
#include "core/Logger.hpp"
#include "core/SettingsStore.hpp"
#include "core/TriggerEngine.hpp"
#include "io/DeviceHub.hpp"
#include "schedule/ScheduleStore.hpp"

using namespace reveille::core;
using reveille::schedule::LocalTime;

namespace {
  constexpr const char* kTag = "engine";
}

const char* reveille::core::toString(TickOutcome o) {
  switch (o) {
  case TickOutcome::Idle:
    return "idle";
  case TickOutcome::Triggered:
    return "triggered";
  case TickOutcome::Retriggered:
    return "retriggered";
  case TickOutcome::TimedOut:
    return "timed out";
  case TickOutcome::StillRinging:
    return "still ringing";
  case TickOutcome::StillSnoozed:
    return "still snoozed";
  default:
    return "unknown";
  }
}

TriggerEngine::TriggerEngine(schedule::ScheduleStore& store, io::DeviceHub& devices,
                             const SettingsStore& settings, std::shared_ptr<Logger> log)
    : store_(store), devices_(devices), settings_(settings), log_(std::move(log)),
      resolver_(store) {}

// -------------------------------------------------------------------
// TriggerEngine::poll
//  1. snooze elapsed      → re-ring the captured alarm/override/sound
//  2. ringing too long    → forced dismiss
//  3. already ringing     → nothing (the matching minute is still "now")
//  4. otherwise           → trigger the first alarm due this minute
// -------------------------------------------------------------------
TickOutcome TriggerEngine::poll(LocalTime now) {
  if (state_.snoozeUntil) {
    if (now < *state_.snoozeUntil)
      return TickOutcome::StillSnoozed;

    state_.snoozeUntil.reset();
    const auto alarmId = *state_.alarmId;
    if (!store_.findAlarm(alarmId)) {
      log_->warn(kTag, "Snoozed alarm " + alarmId + " no longer exists, not ringing again");
      release();
      return TickOutcome::Idle;
    }
    log_->info(kTag, "Snooze over, ringing alarm " + alarmId + " again");
    trigger(alarmId, state_.overrideId, state_.sound, now);
    return TickOutcome::Retriggered;
  }

  if (state_.ringing && state_.ringingSince) {
    const auto timeout = std::chrono::minutes{ settings_.get(Setting::TimeoutMinutes) };
    if (now - *state_.ringingSince >= timeout) {
      log_->info(kTag, "Alarm timed out after " + std::to_string(timeout.count()) +
                           " minutes, auto-dismissing");
      dismiss();
      return TickOutcome::TimedOut;
    }
  }

  if (state_.ringing)
    return TickOutcome::StillRinging;

  std::optional<std::string> overrideId;
  std::string sound;
  if (auto alarmId = firstDueAlarm(now, overrideId, sound)) {
    trigger(*alarmId, std::move(overrideId), std::move(sound), now);
    return TickOutcome::Triggered;
  }
  return TickOutcome::Idle;
}

bool TriggerEngine::snooze(LocalTime now) {
  if (!state_.ringing)
    return false;

  const auto minutes = settings_.get(Setting::SnoozeMinutes);
  state_.snoozeUntil = now + std::chrono::minutes{ minutes };
  state_.ringing = false;
  devices_.stop();
  devices_.setIndicator(false);
  log_->info(kTag, "Alarm snoozed until " + schedule::formatLocalTime(*state_.snoozeUntil));
  return true;
}

bool TriggerEngine::dismiss() {
  if (!state_.ringing)
    return false;

  // the instance this override modified has now rung; the next week reverts
  if (state_.overrideId) {
    const auto st = store_.deleteOverride(*state_.overrideId);
    if (st == Status::NotFound)
      log_->debug(kTag, "Override " + *state_.overrideId + " was already gone at dismiss");
  }

  release();
  log_->info(kTag, "Alarm dismissed");
  return true;
}

void TriggerEngine::forceIdle() {
  if (dismiss())
    return;
  if (!state_.idle()) {
    log_->info(kTag, "Abandoning pending snooze");
    release();
  }
}

void TriggerEngine::onAlarmDeleted(const std::string& alarmId) {
  if (state_.idle() || state_.alarmId != alarmId)
    return;
  log_->info(kTag, "Silencing deleted alarm " + alarmId);
  release();
}

void TriggerEngine::trigger(const std::string& alarmId, std::optional<std::string> overrideId,
                            std::string sound, LocalTime now) {
  std::string what = alarmId;
  if (const auto* alarm = store_.findAlarm(alarmId))
    what += ": " + (alarm->label.empty() ? alarm->time.toString() : alarm->label);
  log_->info(kTag, "Triggering alarm " + what + " (" + sound + ")");

  state_.ringing = true;
  state_.alarmId = alarmId;
  state_.overrideId = std::move(overrideId);
  state_.ringingSince = now;
  state_.sound = std::move(sound);
  lastFiredId_ = alarmId;
  lastFiredMinute_ = std::chrono::floor<std::chrono::minutes>(now);
  devices_.setIndicator(true);
  devices_.play(state_.sound, true);
}

std::optional<std::string> TriggerEngine::firstDueAlarm(LocalTime now,
                                                        std::optional<std::string>& overrideId,
                                                        std::string& sound) {
  const auto today = schedule::dateOf(now);
  const auto minute = std::chrono::floor<std::chrono::minutes>(now);

  for (const auto& [id, alarm] : store_.alarms()) {
    if (id == lastFiredId_ && minute == lastFiredMinute_)
      continue;
    try {
      auto match = resolver_.matchesNow(alarm, now);
      if (!match.matched)
        continue;
      overrideId = std::move(match.overrideId);
      sound = resolver_.effectiveOccurrence(alarm, today).sound;
      return id;
    } catch (const std::exception& e) {
      // one bad record must not stop the rest from being evaluated
      log_->error(kTag, "Skipping alarm " + id + ": " + e.what());
    }
  }
  return std::nullopt;
}

void TriggerEngine::release() {
  state_ = RingingState{};
  devices_.stop();
  devices_.setIndicator(false);
}
