#pragma once
/** @file  OccurrenceResolver.hpp
 *  @brief Pure lookups: effective time/sound per date, next occurrence, trigger match.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>

#include "schedule/AlarmRecords.hpp"
#include "schedule/Calendar.hpp"

namespace reveille::schedule {

  class ScheduleStore;

  struct MatchResult {
    bool matched{ false };
    std::optional<std::string> overrideId;
  };

  /**
 * @class OccurrenceResolver
 * @brief Reads a ScheduleStore snapshot and answers "when" questions about it.
 *
 *  * No side effects; the caller must hold the store's owning lock.
 *  * Overrides are looked up per (alarm, date). A week-ahead instance may carry
 *    a different override than today's instance of the same alarm.
 */
  class OccurrenceResolver {
  public:
    explicit OccurrenceResolver(const ScheduleStore& store) : store_(store) {}

    /// Base time/sound of \p alarm on \p date with that date's override applied.
    EffectiveOccurrence effectiveOccurrence(const AlarmDefinition& alarm, const Date& date) const;

    /**
     * @brief Soonest non-skipped instance across every enabled alarm.
     *
     * An instance due today at or before the current minute counts as passed
     * and is replaced by the same weekday next week. Ties keep the first
     * candidate in (alarm id, Monday → Sunday) order.
     */
    std::optional<Occurrence> nextOccurrence(LocalTime now) const;

    /// True iff \p alarm is due in the current minute of \p now.
    MatchResult matchesNow(const AlarmDefinition& alarm, LocalTime now) const;

  private:
    const ScheduleStore& store_;
  };

} // namespace reveille::schedule
