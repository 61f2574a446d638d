#pragma once
/** @file  AlarmRecords.hpp
 *  @brief Alarm definitions, date-scoped overrides and resolved occurrences.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <map>
#include <optional>
#include <string>

// Third-party headers
#include <nlohmann/json_fwd.hpp>

// Reveille headers
#include "schedule/Calendar.hpp"

namespace reveille {
  namespace schedule {

    inline constexpr const char* kDefaultSound = "default.mp3";

    /**
 * @struct AlarmDefinition
 * @brief One recurring alarm. `id` is assigned by the store and never changes.
 */
    struct AlarmDefinition {
      std::string id;
      TimeOfDay time;
      DaySet days;
      std::string sound{ kDefaultSound };
      bool enabled{ true };
      std::string label;

      bool operator==(const AlarmDefinition&) const = default;
    };

    /**
 * @struct Override
 * @brief One-time exception to a single alarm instance on `targetDate`.
 *
 *  * `alarmId` is a non-owning back-reference; the store keeps it valid.
 *  * Absent time/sound mean "use the alarm's own". An empty string is never
 *    stored, it is normalised to absent on the way in (see normalised()).
 */
    struct Override {
      std::string id;
      std::string alarmId;
      Date targetDate{};
      std::optional<TimeOfDay> overrideTime;
      std::optional<std::string> overrideSound;
      bool skip{ false };

      bool operator==(const Override&) const = default;
    };

    /// Ordered by id so that iteration, and with it every tie-break, is stable.
    using AlarmMap = std::map<std::string, AlarmDefinition>;
    using OverrideMap = std::map<std::string, Override>;

    /// Partial update of an AlarmDefinition; unset fields are left alone.
    struct AlarmPatch {
      std::optional<TimeOfDay> time;
      std::optional<DaySet> days;
      std::optional<std::string> sound;
      std::optional<bool> enabled;
      std::optional<std::string> label;
    };

    /**
 * @struct OverridePatch
 * @brief Partial update of an Override.
 *
 *  Outer optional = "field supplied"; inner nullopt = clear back to the alarm's value.
 */
    struct OverridePatch {
      std::optional<std::optional<TimeOfDay>> overrideTime;
      std::optional<std::optional<std::string>> overrideSound;
      std::optional<bool> skip;
    };

    /// Effective time/sound of one alarm on one date after applying its override.
    struct EffectiveOccurrence {
      TimeOfDay time;
      std::string sound;
      bool skip{ false };
      std::optional<std::string> overrideId;
    };

    /// The globally-next instance as reported to status callers.
    struct Occurrence {
      std::string alarmId;
      TimeOfDay time;         ///< effective time
      TimeOfDay originalTime; ///< the alarm's base time
      Weekday weekday{ Weekday::Monday };
      std::string label;
      std::string sound;
      long minutesUntil{ 0 };
      Date targetDate{};
      bool hasOverride{ false };
      std::optional<std::string> overrideId;
    };

    /// Empty sound strings collapse to absent.
    std::optional<std::string> normalised(std::optional<std::string> sound);

    /// True if \p text is well-formed UTF-8, i.e. it can be written to a JSON document.
    bool isStorableText(const std::string& text);

    void applyPatch(AlarmDefinition& alarm, const AlarmPatch& patch);
    void applyPatch(Override& ovr, const OverridePatch& patch);

    // ─── nlohmann::json bindings (persisted field names) ───────────────────────
    void to_json(nlohmann::json& j, const AlarmDefinition& a);
    void from_json(const nlohmann::json& j, AlarmDefinition& a);
    void to_json(nlohmann::json& j, const Override& o);
    void from_json(const nlohmann::json& j, Override& o);
    void to_json(nlohmann::json& j, const Occurrence& o);

  } // namespace schedule
} // namespace reveille
