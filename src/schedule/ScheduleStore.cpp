/* @file ScheduleStore.cpp
 * @brief CRUD over alarms and overrides with write-through persistence
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <cstdio>

// Reveille headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "schedule/ScheduleStore.hpp"

using namespace reveille::schedule;
using reveille::core::Result;
using reveille::core::Status;

namespace {
  constexpr const char* kTag = "store";
}

ScheduleStore::ScheduleStore(std::shared_ptr<ScheduleRepository> repo,
                             std::shared_ptr<core::Logger> log,
                             std::shared_ptr<core::ErrorMonitor> errors)
    : repo_(std::move(repo)), log_(std::move(log)), errors_(std::move(errors)),
      rng_(std::random_device{}()) {
  assert(repo_ && "[ScheduleStore] repository is nullptr");
  assert(log_ && "[ScheduleStore] logger is nullptr");
  assert(errors_ && "[ScheduleStore] error monitor is nullptr");
}

bool ScheduleStore::load() {
  bool ok = true;

  try {
    alarms_ = repo_->loadAlarms();
    log_->info(kTag, "Loaded " + std::to_string(alarms_.size()) + " alarms");
  } catch (const PersistenceError& e) {
    alarms_.clear();
    reportFailure(std::string("failed to load alarms: ") + e.what());
    ok = false;
  }

  try {
    overrides_ = repo_->loadOverrides();
    log_->info(kTag, "Loaded " + std::to_string(overrides_.size()) + " overrides");
  } catch (const PersistenceError& e) {
    overrides_.clear();
    reportFailure(std::string("failed to load overrides: ") + e.what());
    ok = false;
  }

  return ok;
}

// ---------------------------------------------------------------------------
// queries
// ---------------------------------------------------------------------------
const AlarmDefinition* ScheduleStore::findAlarm(const std::string& id) const {
  auto it = alarms_.find(id);
  return it == alarms_.end() ? nullptr : &it->second;
}

const Override* ScheduleStore::findOverride(const std::string& id) const {
  auto it = overrides_.find(id);
  return it == overrides_.end() ? nullptr : &it->second;
}

const Override* ScheduleStore::findOverrideFor(const std::string& alarmId,
                                               const Date& date) const {
  for (const auto& [id, ovr] : overrides_) {
    if (ovr.alarmId == alarmId && ovr.targetDate == date)
      return &ovr;
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// alarms
// ---------------------------------------------------------------------------
Result<AlarmDefinition> ScheduleStore::createAlarm(AlarmDefinition draft) {
  draft.id = nextId(alarms_);
  auto& stored = alarms_.emplace(draft.id, std::move(draft)).first->second;

  const bool durable = persistAlarms();
  log_->info(kTag, "Created alarm " + stored.id + ": " + stored.time.toString() + " on " +
                       std::to_string(stored.days.days().size()) + " day(s)");
  return Result<AlarmDefinition>::success(stored, durable);
}

Result<AlarmDefinition> ScheduleStore::updateAlarm(const std::string& id,
                                                   const AlarmPatch& patch) {
  auto it = alarms_.find(id);
  if (it == alarms_.end())
    return Result<AlarmDefinition>::failure(Status::NotFound, "alarm " + id + " not found");

  applyPatch(it->second, patch);
  const bool durable = persistAlarms();
  log_->info(kTag, "Updated alarm " + id);
  return Result<AlarmDefinition>::success(it->second, durable);
}

Result<AlarmDefinition> ScheduleStore::toggleAlarm(const std::string& id) {
  auto it = alarms_.find(id);
  if (it == alarms_.end())
    return Result<AlarmDefinition>::failure(Status::NotFound, "alarm " + id + " not found");

  it->second.enabled = !it->second.enabled;
  const bool durable = persistAlarms();
  log_->info(kTag, "Toggled alarm " + id + " to " + (it->second.enabled ? "enabled" : "disabled"));
  return Result<AlarmDefinition>::success(it->second, durable);
}

Status ScheduleStore::deleteAlarm(const std::string& id) {
  if (alarms_.erase(id) == 0)
    return Status::NotFound;

  const bool durable = persistAlarms();
  log_->info(kTag, "Deleted alarm " + id);
  return durable ? Status::Ok : Status::NotPersisted;
}

// ---------------------------------------------------------------------------
// overrides
// ---------------------------------------------------------------------------
Result<Override> ScheduleStore::createOverride(Override draft) {
  if (!findAlarm(draft.alarmId))
    return Result<Override>::failure(Status::NotFound, "alarm " + draft.alarmId + " not found");

  if (const auto* existing = findOverrideFor(draft.alarmId, draft.targetDate)) {
    return Result<Override>::failure(Status::Conflict, "override " + existing->id +
                                                           " already exists for alarm " +
                                                           draft.alarmId + " on " +
                                                           toString(draft.targetDate));
  }

  draft.id = nextId(overrides_);
  draft.overrideSound = normalised(std::move(draft.overrideSound));
  auto& stored = overrides_.emplace(draft.id, std::move(draft)).first->second;

  const bool durable = persistOverrides();
  log_->info(kTag, "Created override " + stored.id + " for alarm " + stored.alarmId + " on " +
                       toString(stored.targetDate));
  return Result<Override>::success(stored, durable);
}

Result<Override> ScheduleStore::updateOverride(const std::string& id, const OverridePatch& patch) {
  auto it = overrides_.find(id);
  if (it == overrides_.end())
    return Result<Override>::failure(Status::NotFound, "override " + id + " not found");

  applyPatch(it->second, patch);
  const bool durable = persistOverrides();
  log_->info(kTag, "Updated override " + id);
  return Result<Override>::success(it->second, durable);
}

Status ScheduleStore::deleteOverride(const std::string& id) {
  if (overrides_.erase(id) == 0)
    return Status::NotFound;

  const bool durable = persistOverrides();
  log_->info(kTag, "Deleted override " + id);
  return durable ? Status::Ok : Status::NotPersisted;
}

Result<std::size_t> ScheduleStore::eraseOverridesIf(const OverridePredicate& pred) {
  const auto removed = std::erase_if(overrides_, [&pred](const auto& kv) { return pred(kv.second); });
  if (removed == 0)
    return Result<std::size_t>::success(0);

  return Result<std::size_t>::success(removed, persistOverrides());
}

// ---------------------------------------------------------------------------
// helpers
// ---------------------------------------------------------------------------
template <typename Map> std::string ScheduleStore::nextId(const Map& taken) {
  std::uniform_int_distribution<std::uint32_t> dist;
  char buf[9];
  do {
    std::snprintf(buf, sizeof(buf), "%08x", static_cast<unsigned>(dist(rng_)));
  } while (taken.count(buf) != 0);
  return buf;
}

bool ScheduleStore::persistAlarms() {
  try {
    repo_->saveAlarms(alarms_);
    return true;
  } catch (const PersistenceError& e) {
    reportFailure(std::string("failed to save alarms: ") + e.what());
    return false;
  }
}

bool ScheduleStore::persistOverrides() {
  try {
    repo_->saveOverrides(overrides_);
    return true;
  } catch (const PersistenceError& e) {
    reportFailure(std::string("failed to save overrides: ") + e.what());
    return false;
  }
}

void ScheduleStore::reportFailure(const std::string& what) {
  log_->error(kTag, what);
  errors_->notifyFailure("[ScheduleStore] " + what);
}
