#include "schedule/AlarmRecords.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace reveille::schedule;
using nlohmann::json;

TEST(alarm_json, writes_persisted_field_names) {
  AlarmDefinition a;
  a.id = "0a1b2c3d";
  a.time = TimeOfDay::parse("06:30");
  a.days = DaySet{ Weekday::Saturday, Weekday::Monday };
  a.label = "gym";

  const json j = a;
  EXPECT_EQ(j.at("id"), "0a1b2c3d");
  EXPECT_EQ(j.at("time"), "06:30");
  EXPECT_EQ(j.at("days"), json::array({ "monday", "saturday" }));
  EXPECT_EQ(j.at("sound"), "default.mp3");
  EXPECT_EQ(j.at("enabled"), true);
  EXPECT_EQ(j.at("label"), "gym");
  EXPECT_EQ(j.get<AlarmDefinition>(), a);
}

TEST(alarm_json, reads_short_names_and_drops_unknown_days) {
  const auto j = json::parse(R"({"id":"x","time":"07:00","days":["Mon","blursday","fri"]})");
  const auto a = j.get<AlarmDefinition>();
  EXPECT_EQ(a.days, (DaySet{ Weekday::Monday, Weekday::Friday }));
  EXPECT_EQ(a.sound, kDefaultSound);
  EXPECT_TRUE(a.enabled);
  EXPECT_TRUE(a.label.empty());
}

TEST(alarm_json, accepts_a_single_day_string) {
  const auto j = json::parse(R"({"id":"x","time":"07:00","days":"sunday"})");
  EXPECT_EQ(j.get<AlarmDefinition>().days, DaySet{ Weekday::Sunday });
}

TEST(alarm_json, bad_time_throws) {
  const auto j = json::parse(R"({"id":"x","time":"7am","days":[]})");
  EXPECT_THROW(j.get<AlarmDefinition>(), ValidationError);
}

TEST(override_json, absent_fields_are_null) {
  Override o;
  o.id = "11111111";
  o.alarmId = "0a1b2c3d";
  o.targetDate = parseDate("2026-10-19");
  o.skip = true;

  const json j = o;
  EXPECT_EQ(j.at("alarm_id"), "0a1b2c3d");
  EXPECT_EQ(j.at("target_date"), "2026-10-19");
  EXPECT_TRUE(j.at("override_time").is_null());
  EXPECT_TRUE(j.at("override_sound").is_null());
  EXPECT_EQ(j.at("skip"), true);
  EXPECT_EQ(j.get<Override>(), o);
}

TEST(override_json, empty_strings_read_as_absent) {
  const auto j = json::parse(R"({"id":"o","alarm_id":"a","target_date":"2026-10-19",
                                 "override_time":"","override_sound":"","skip":false})");
  const auto o = j.get<Override>();
  EXPECT_FALSE(o.overrideTime);
  EXPECT_FALSE(o.overrideSound);
}

TEST(override_patch, distinguishes_clear_from_untouched) {
  Override o;
  o.overrideTime = TimeOfDay::parse("08:00");
  o.overrideSound = "birds.mp3";

  OverridePatch keep;
  keep.skip = true;
  applyPatch(o, keep);
  EXPECT_EQ(o.overrideTime, TimeOfDay::parse("08:00"));
  EXPECT_EQ(o.overrideSound, "birds.mp3");
  EXPECT_TRUE(o.skip);

  OverridePatch clear;
  clear.overrideTime.emplace(std::nullopt);
  clear.overrideSound.emplace(std::string{});
  applyPatch(o, clear);
  EXPECT_FALSE(o.overrideTime);
  EXPECT_FALSE(o.overrideSound);
}

TEST(alarm_patch, only_touches_supplied_fields) {
  AlarmDefinition a;
  a.time = TimeOfDay::parse("07:00");
  a.label = "work";

  AlarmPatch p;
  p.enabled = false;
  applyPatch(a, p);
  EXPECT_FALSE(a.enabled);
  EXPECT_EQ(a.label, "work");
  EXPECT_EQ(a.time, TimeOfDay::parse("07:00"));
}
