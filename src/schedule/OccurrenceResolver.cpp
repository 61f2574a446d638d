/* @file OccurrenceResolver.cpp
 * @brief resolves per-date overrides and searches the week for the next alarm
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "schedule/OccurrenceResolver.hpp"
#include "schedule/ScheduleStore.hpp"

using namespace reveille::schedule;

namespace {
  constexpr long kMinutesPerDay = 24 * 60;
}

EffectiveOccurrence OccurrenceResolver::effectiveOccurrence(const AlarmDefinition& alarm,
                                                            const Date& date) const {
  EffectiveOccurrence eff{ alarm.time, alarm.sound, false, std::nullopt };

  const auto* ovr = store_.findOverrideFor(alarm.id, date);
  if (!ovr)
    return eff;

  if (ovr->overrideTime)
    eff.time = *ovr->overrideTime;
  if (ovr->overrideSound && !ovr->overrideSound->empty())
    eff.sound = *ovr->overrideSound;
  eff.skip = ovr->skip;
  eff.overrideId = ovr->id;
  return eff;
}

std::optional<Occurrence> OccurrenceResolver::nextOccurrence(LocalTime now) const {
  const auto today = dateOf(now);
  const auto nowTod = TimeOfDay::of(now);
  const int nowWeekday = static_cast<int>(weekdayOf(today));

  std::optional<Occurrence> best;

  for (const auto& [id, alarm] : store_.alarms()) {
    if (!alarm.enabled)
      continue;

    for (auto day : alarm.days.days()) {
      int daysUntil = (static_cast<int>(day) - nowWeekday + kDaysPerWeek) % kDaysPerWeek;
      auto target = addDays(today, daysUntil);
      auto eff = effectiveOccurrence(alarm, target);

      // today's instance already rang (or is ringing this minute): look a week out,
      // where a different override may apply
      if (daysUntil == 0 && eff.time <= nowTod) {
        daysUntil = kDaysPerWeek;
        target = addDays(today, daysUntil);
        eff = effectiveOccurrence(alarm, target);
      }

      if (eff.skip)
        continue;

      const long minutesUntil =
          daysUntil * kMinutesPerDay + eff.time.minutesOfDay() - nowTod.minutesOfDay();
      if (best && minutesUntil >= best->minutesUntil)
        continue;

      best = Occurrence{ .alarmId = alarm.id,
                         .time = eff.time,
                         .originalTime = alarm.time,
                         .weekday = day,
                         .label = alarm.label,
                         .sound = eff.sound,
                         .minutesUntil = minutesUntil,
                         .targetDate = target,
                         .hasOverride = eff.overrideId.has_value(),
                         .overrideId = eff.overrideId };
    }
  }

  return best;
}

MatchResult OccurrenceResolver::matchesNow(const AlarmDefinition& alarm, LocalTime now) const {
  if (!alarm.enabled)
    return {};

  const auto today = dateOf(now);
  if (!alarm.days.contains(weekdayOf(today)))
    return {};

  const auto eff = effectiveOccurrence(alarm, today);
  if (eff.skip)
    return {};

  if (eff.time != TimeOfDay::of(now))
    return {};

  return MatchResult{ true, eff.overrideId };
}
