/* @file SettingsStore.cpp
 * @brief clamped, lock-protected runtime settings
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// Reveille headers
#include "core/SettingsStore.hpp"

using namespace reveille::core;

namespace {

  struct Range {
    int lo;
    int hi;
    int dflt;
  };

  Range rangeOf(Setting s) {
    switch (s) {
    case Setting::SnoozeMinutes:
      return { 1, 30, 9 };
    case Setting::TimeoutMinutes:
      return { 1, 120, 5 };
    case Setting::CheckIntervalSeconds:
      return { 1, 3600, 30 };
    case Setting::Volume:
      return { 0, 100, 80 };
    case Setting::DisplayBrightness:
      return { 0, 15, 10 };
    default:
      return { 0, 0, 0 };
    }
  }

} // namespace

const char* reveille::core::toString(Setting s) {
  switch (s) {
  case Setting::SnoozeMinutes:
    return "snooze_duration_minutes";
  case Setting::TimeoutMinutes:
    return "timeout_minutes";
  case Setting::CheckIntervalSeconds:
    return "alarm_check_interval_seconds";
  case Setting::Volume:
    return "volume";
  case Setting::DisplayBrightness:
    return "display_brightness";
  default:
    return "unknown";
  }
}

SettingsStore::SettingsStore() {
  for (auto s : { Setting::SnoozeMinutes, Setting::TimeoutMinutes, Setting::CheckIntervalSeconds,
                  Setting::Volume, Setting::DisplayBrightness })
    values_[s] = defaultValue(s);
}

int SettingsStore::set(Setting s, int value) {
  const int v = clamp(s, value);
  std::lock_guard lock(mtx_);
  values_[s] = v;
  return v;
}

int SettingsStore::get(Setting s) const {
  std::lock_guard lock(mtx_);
  auto it = values_.find(s);
  return it != values_.end() ? it->second : defaultValue(s);
}

int SettingsStore::clamp(Setting s, int value) {
  const auto r = rangeOf(s);
  return std::clamp(value, r.lo, r.hi);
}

int SettingsStore::defaultValue(Setting s) { return rangeOf(s).dflt; }
