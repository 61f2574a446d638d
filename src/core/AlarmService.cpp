/* @file AlarmService.cpp
 * @brief boundary validation, locking and wiring of store, lifecycle, engine and ticker
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <string>

// Reveille headers
#include "core/AlarmService.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/SettingsStore.hpp"
#include "io/DeviceHub.hpp"
#include "schedule/OccurrenceResolver.hpp"

using namespace reveille::core;
using reveille::schedule::AlarmDefinition;
using reveille::schedule::Override;
using reveille::schedule::ValidationError;

namespace {

  constexpr const char* kTag = "service";

  // "" clears the field; anything else must be HH:MM
  std::optional<reveille::schedule::TimeOfDay> optionalTime(const std::optional<std::string>& s) {
    if (!s || s->empty())
      return std::nullopt;
    return reveille::schedule::TimeOfDay::parse(*s);
  }

  void requireText(const std::optional<std::string>& s, const char* field) {
    if (s && !reveille::schedule::isStorableText(*s))
      throw ValidationError(std::string(field) + " is not valid UTF-8");
  }

  template <typename Map>
  std::vector<typename Map::mapped_type> valuesOf(const Map& m) {
    std::vector<typename Map::mapped_type> out;
    out.reserve(m.size());
    for (const auto& [id, v] : m)
      out.push_back(v);
    return out;
  }

} // namespace

AlarmService::AlarmService(std::shared_ptr<schedule::ScheduleRepository> repo,
                           std::shared_ptr<io::DeviceHub> devices,
                           std::shared_ptr<SettingsStore> settings, std::shared_ptr<Logger> log,
                           std::shared_ptr<ErrorMonitor> errors)
    : devices_(std::move(devices)), settings_(std::move(settings)), log_(std::move(log)),
      errors_(std::move(errors)), store_(std::move(repo), log_, errors_), lifecycle_(store_, log_),
      engine_(store_, *devices_, *settings_, log_), task_("poller", log_, errors_) {
  assert(devices_ && settings_ && "[AlarmService] devices/settings are nullptr");
}

AlarmService::~AlarmService() { stop(); }

// ---------------------------------------------------------------------------
// lifecycle
// ---------------------------------------------------------------------------
bool AlarmService::load() {
  std::lock_guard lock(mtx_);
  const bool ok = store_.load();
  lifecycle_.purgeOrphans();
  lifecycle_.cleanupExpired(devices_->now());
  return ok;
}

void AlarmService::start() {
  if (task_.running())
    return;

  auto settings = settings_;
  task_.start([settings] { return std::chrono::seconds{ settings->get(Setting::CheckIntervalSeconds) }; },
              [this] { pollOnce(); });
  log_->info(kTag, "Alarm service started on " + devices_->describe());
}

void AlarmService::stop() {
  task_.stop();

  std::lock_guard lock(mtx_);
  engine_.forceIdle();
}

// ---------------------------------------------------------------------------
// alarms
// ---------------------------------------------------------------------------
Result<AlarmDefinition> AlarmService::createAlarm(const AlarmRequest& req) {
  AlarmDefinition draft;
  try {
    draft.time = schedule::TimeOfDay::parse(req.time);
    draft.days = schedule::DaySet::parse(req.days);
    requireText(req.sound, "sound");
    requireText(req.label, "label");
  } catch (const ValidationError& e) {
    return Result<AlarmDefinition>::failure(Status::Invalid, e.what());
  }
  draft.sound = req.sound.empty() ? schedule::kDefaultSound : req.sound;
  draft.enabled = req.enabled;
  draft.label = req.label;

  std::lock_guard lock(mtx_);
  return store_.createAlarm(std::move(draft));
}

std::optional<AlarmDefinition> AlarmService::getAlarm(const std::string& id) const {
  std::lock_guard lock(mtx_);
  if (const auto* a = store_.findAlarm(id))
    return *a;
  return std::nullopt;
}

std::vector<AlarmDefinition> AlarmService::listAlarms() const {
  std::lock_guard lock(mtx_);
  return valuesOf(store_.alarms());
}

Result<AlarmDefinition> AlarmService::updateAlarm(const std::string& id, const AlarmUpdate& upd) {
  schedule::AlarmPatch patch;
  try {
    if (upd.time)
      patch.time = schedule::TimeOfDay::parse(*upd.time);
    if (upd.days)
      patch.days = schedule::DaySet::parse(*upd.days);
    requireText(upd.sound, "sound");
    requireText(upd.label, "label");
  } catch (const ValidationError& e) {
    return Result<AlarmDefinition>::failure(Status::Invalid, e.what());
  }
  patch.sound = upd.sound;
  patch.enabled = upd.enabled;
  patch.label = upd.label;

  std::lock_guard lock(mtx_);
  return store_.updateAlarm(id, patch);
}

Status AlarmService::deleteAlarm(const std::string& id) {
  std::lock_guard lock(mtx_);

  auto st = store_.deleteAlarm(id);
  if (st == Status::NotFound)
    return st;

  const auto cascade = lifecycle_.cascadeDeleteForAlarm(id);
  engine_.onAlarmDeleted(id);

  if (cascade.status == Status::NotPersisted)
    st = Status::NotPersisted;
  return st;
}

Result<AlarmDefinition> AlarmService::toggleAlarm(const std::string& id) {
  std::lock_guard lock(mtx_);
  return store_.toggleAlarm(id);
}

// ---------------------------------------------------------------------------
// overrides
// ---------------------------------------------------------------------------
Result<Override> AlarmService::createOverride(const OverrideRequest& req) {
  Override draft;
  try {
    draft.targetDate = schedule::parseDate(req.targetDate);
    draft.overrideTime = optionalTime(req.overrideTime);
    requireText(req.overrideSound, "override_sound");
  } catch (const ValidationError& e) {
    return Result<Override>::failure(Status::Invalid, e.what());
  }
  draft.alarmId = req.alarmId;
  draft.overrideSound = schedule::normalised(req.overrideSound);
  draft.skip = req.skip;

  std::lock_guard lock(mtx_);
  return store_.createOverride(std::move(draft));
}

std::optional<Override> AlarmService::getOverride(const std::string& id) const {
  std::lock_guard lock(mtx_);
  if (const auto* o = store_.findOverride(id))
    return *o;
  return std::nullopt;
}

std::optional<Override> AlarmService::getOverrideFor(const std::string& alarmId,
                                                     const std::string& date) const {
  const auto day = schedule::tryParseDate(date);
  if (!day)
    return std::nullopt;

  std::lock_guard lock(mtx_);
  if (const auto* o = store_.findOverrideFor(alarmId, *day))
    return *o;
  return std::nullopt;
}

std::vector<Override> AlarmService::listOverrides() const {
  std::lock_guard lock(mtx_);
  return valuesOf(store_.overrides());
}

Result<Override> AlarmService::updateOverride(const std::string& id, const OverrideUpdate& upd) {
  schedule::OverridePatch patch;
  try {
    if (upd.overrideTime)
      patch.overrideTime.emplace(optionalTime(upd.overrideTime));
    requireText(upd.overrideSound, "override_sound");
  } catch (const ValidationError& e) {
    return Result<Override>::failure(Status::Invalid, e.what());
  }
  if (upd.overrideSound)
    patch.overrideSound.emplace(schedule::normalised(upd.overrideSound));
  patch.skip = upd.skip;

  std::lock_guard lock(mtx_);
  return store_.updateOverride(id, patch);
}

Status AlarmService::deleteOverride(const std::string& id) {
  std::lock_guard lock(mtx_);
  return store_.deleteOverride(id);
}

// ---------------------------------------------------------------------------
// control & status
// ---------------------------------------------------------------------------
bool AlarmService::snooze() {
  std::lock_guard lock(mtx_);
  return engine_.snooze(devices_->now());
}

bool AlarmService::dismiss() {
  std::lock_guard lock(mtx_);
  return engine_.dismiss();
}

bool AlarmService::isRinging() const {
  std::lock_guard lock(mtx_);
  return engine_.isRinging();
}

RingingState AlarmService::ringingState() const {
  std::lock_guard lock(mtx_);
  return engine_.state();
}

std::optional<reveille::schedule::Occurrence> AlarmService::nextAlarmInfo() const {
  std::lock_guard lock(mtx_);
  return schedule::OccurrenceResolver{ store_ }.nextOccurrence(devices_->now());
}

SystemStatus AlarmService::status() const {
  std::lock_guard lock(mtx_);
  SystemStatus s;
  s.now = devices_->now();
  s.ringing = engine_.state().ringing;
  s.snoozed = engine_.state().snoozed();
  s.ringingAlarmId = engine_.state().alarmId;
  s.nextAlarm = schedule::OccurrenceResolver{ store_ }.nextOccurrence(s.now);
  return s;
}

TickOutcome AlarmService::pollOnce() {
  std::lock_guard lock(mtx_);
  const auto outcome = engine_.poll(devices_->now());
  if (outcome != TickOutcome::Idle && outcome != TickOutcome::StillRinging &&
      outcome != TickOutcome::StillSnoozed)
    log_->debug(kTag, std::string("Poll: ") + toString(outcome));
  return outcome;
}

SettingsPatch AlarmService::updateSettings(const SettingsPatch& patch) {
  SettingsPatch stored;
  if (patch.snoozeMinutes)
    stored.snoozeMinutes = settings_->set(Setting::SnoozeMinutes, *patch.snoozeMinutes);
  if (patch.timeoutMinutes)
    stored.timeoutMinutes = settings_->set(Setting::TimeoutMinutes, *patch.timeoutMinutes);

  std::lock_guard lock(mtx_);
  if (patch.volume) {
    stored.volume = settings_->set(Setting::Volume, *patch.volume);
    devices_->setVolume(*stored.volume);
  }
  if (patch.displayBrightness) {
    stored.displayBrightness = settings_->set(Setting::DisplayBrightness, *patch.displayBrightness);
    devices_->setBrightness(*stored.displayBrightness);
  }
  log_->info(kTag, "Settings updated");
  return stored;
}
