/* @file OverrideLifecycle.cpp
 * @brief stale-override cleanup and cascade delete
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "schedule/OverrideLifecycle.hpp"
#include "core/Logger.hpp"
#include "schedule/ScheduleStore.hpp"

using namespace reveille::schedule;
using reveille::core::Result;

namespace {
  constexpr const char* kTag = "lifecycle";
}

OverrideLifecycle::OverrideLifecycle(ScheduleStore& store, std::shared_ptr<core::Logger> log)
    : store_(store), log_(std::move(log)) {}

Result<std::size_t> OverrideLifecycle::cleanupExpired(LocalTime now) {
  const auto yesterday = addDays(dateOf(now), -1);

  auto res = store_.eraseOverridesIf(
      [&yesterday](const Override& o) { return o.targetDate <= yesterday; });

  if (res.value && *res.value > 0)
    log_->info(kTag, "Cleaned up " + std::to_string(*res.value) + " expired override(s) dated " +
                         toString(yesterday) + " or earlier");
  return res;
}

Result<std::size_t> OverrideLifecycle::cascadeDeleteForAlarm(const std::string& alarmId) {
  auto res =
      store_.eraseOverridesIf([&alarmId](const Override& o) { return o.alarmId == alarmId; });

  if (res.value && *res.value > 0)
    log_->info(kTag, "Deleted " + std::to_string(*res.value) + " override(s) for alarm " + alarmId);
  return res;
}

Result<std::size_t> OverrideLifecycle::purgeOrphans() {
  auto res = store_.eraseOverridesIf(
      [this](const Override& o) { return store_.findAlarm(o.alarmId) == nullptr; });

  if (res.value && *res.value > 0)
    log_->warn(kTag, "Purged " + std::to_string(*res.value) + " override(s) of deleted alarms");
  return res;
}
