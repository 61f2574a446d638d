#pragma once
/** @file  SettingsStore.hpp
 *  @brief Thread-safe runtime settings shared by the engine, devices & coordinator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <mutex>
#include <unordered_map>

namespace reveille {
  namespace core {

    /**
 * @enum Setting
 * @brief Strong-typed keys for every tunable setting.
 */
    enum class Setting {
      SnoozeMinutes,
      TimeoutMinutes,
      CheckIntervalSeconds,
      Volume,
      DisplayBrightness,
    };

    const char* toString(Setting s);

    /** @class SettingsStore
 *  @brief Lock-protected map of <Setting → int>, clamped to each key's range.
 *
 *  * Seeded with defaults (snooze 9 min, timeout 5 min, poll 30 s, volume 80, brightness 10).
 *  * R/W from multiple threads (poll loop vs. settings updates).
 */
    class SettingsStore {

    public:
      SettingsStore();
      ~SettingsStore() = default;

      /// Clamps \p value into range, stores it and returns what was stored.
      int set(Setting s, int value);

      /// Thread-safe getter.
      int get(Setting s) const;

      static int clamp(Setting s, int value);
      static int defaultValue(Setting s);

    private:
      mutable std::mutex mtx_;
      std::unordered_map<Setting, int> values_;
    };

  } // namespace core
} // namespace reveille
