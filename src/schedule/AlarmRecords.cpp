/* @file AlarmRecords.cpp
 * @brief patch application and JSON (de)serialisation for alarms and overrides
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// Third-party headers
#include <nlohmann/json.hpp>

// Reveille headers
#include "schedule/AlarmRecords.hpp"

using namespace reveille::schedule;
using nlohmann::json;

namespace {

  // null, missing and "" all read as absent
  std::optional<std::string> optionalString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
      return std::nullopt;
    return normalised(it->get<std::string>());
  }

} // namespace

std::optional<std::string> reveille::schedule::normalised(std::optional<std::string> sound) {
  if (sound && sound->empty())
    return std::nullopt;
  return sound;
}

bool reveille::schedule::isStorableText(const std::string& text) {
  try {
    (void)json(text).dump();
    return true;
  } catch (const json::type_error&) {
    return false;
  }
}

void reveille::schedule::applyPatch(AlarmDefinition& alarm, const AlarmPatch& patch) {
  if (patch.time)
    alarm.time = *patch.time;
  if (patch.days)
    alarm.days = *patch.days;
  if (patch.sound)
    alarm.sound = *patch.sound;
  if (patch.enabled)
    alarm.enabled = *patch.enabled;
  if (patch.label)
    alarm.label = *patch.label;
}

void reveille::schedule::applyPatch(Override& ovr, const OverridePatch& patch) {
  if (patch.overrideTime)
    ovr.overrideTime = *patch.overrideTime;
  if (patch.overrideSound)
    ovr.overrideSound = normalised(*patch.overrideSound);
  if (patch.skip)
    ovr.skip = *patch.skip;
}

// ---------------------------------------------------------------------------
// AlarmDefinition  {id, time, days[], sound, enabled, label}
// ---------------------------------------------------------------------------
void reveille::schedule::to_json(json& j, const AlarmDefinition& a) {
  j = json{ { "id", a.id },       { "time", a.time.toString() }, { "days", a.days.names() },
            { "sound", a.sound }, { "enabled", a.enabled },      { "label", a.label } };
}

void reveille::schedule::from_json(const json& j, AlarmDefinition& a) {
  a.id = j.at("id").get<std::string>();
  a.time = TimeOfDay::parse(j.at("time").get<std::string>());

  // a lone string is accepted as a one-element list; unknown names are dropped
  a.days = DaySet{};
  const auto& days = j.at("days");
  if (days.is_string()) {
    if (auto d = tryParseWeekday(days.get<std::string>()))
      a.days.set(*d);
  } else {
    for (const auto& name : days) {
      if (auto d = tryParseWeekday(name.get<std::string>()))
        a.days.set(*d);
    }
  }

  a.sound = j.value("sound", std::string(kDefaultSound));
  a.enabled = j.value("enabled", true);
  a.label = j.value("label", std::string());
}

// ---------------------------------------------------------------------------
// Override  {id, alarm_id, target_date, override_time, override_sound, skip}
// ---------------------------------------------------------------------------
void reveille::schedule::to_json(json& j, const Override& o) {
  j = json{ { "id", o.id },
            { "alarm_id", o.alarmId },
            { "target_date", toString(o.targetDate) },
            { "override_time", nullptr },
            { "override_sound", nullptr },
            { "skip", o.skip } };
  if (o.overrideTime)
    j["override_time"] = o.overrideTime->toString();
  if (o.overrideSound)
    j["override_sound"] = *o.overrideSound;
}

void reveille::schedule::from_json(const json& j, Override& o) {
  o.id = j.at("id").get<std::string>();
  o.alarmId = j.at("alarm_id").get<std::string>();
  o.targetDate = parseDate(j.at("target_date").get<std::string>());

  o.overrideTime.reset();
  if (auto t = optionalString(j, "override_time"))
    o.overrideTime = TimeOfDay::parse(*t);

  o.overrideSound = optionalString(j, "override_sound");
  o.skip = j.value("skip", false);
}

void reveille::schedule::to_json(json& j, const Occurrence& o) {
  j = json{ { "id", o.alarmId },
            { "time", o.time.toString() },
            { "original_time", o.originalTime.toString() },
            { "day", toString(o.weekday) },
            { "label", o.label },
            { "sound", o.sound },
            { "minutes_until", o.minutesUntil },
            { "target_date", toString(o.targetDate) },
            { "has_override", o.hasOverride },
            { "override_id", nullptr } };
  if (o.overrideId)
    j["override_id"] = *o.overrideId;
}
