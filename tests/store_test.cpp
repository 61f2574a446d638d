#include "core/Logger.hpp"
#include "schedule/ScheduleStore.hpp"

#include "MemoryRepository.hpp"
#include "MockErrorMonitor.hpp"
#include "TestTime.hpp"

#include <set>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace reveille::schedule;
using namespace reveille::test;
using reveille::core::Logger;
using reveille::core::LogLevel;
using reveille::core::Status;
using ::testing::HasSubstr;
using ::testing::NiceMock;

class schedule_store : public ::testing::Test {
protected:
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  std::shared_ptr<NiceMock<MockErrorMonitor>> errors = std::make_shared<NiceMock<MockErrorMonitor>>();
  ScheduleStore store{ repo, std::make_shared<Logger>(LogLevel::Error), errors };

  AlarmDefinition monday7() {
    AlarmDefinition a;
    a.time = TimeOfDay::parse("07:00");
    a.days = { Weekday::Monday };
    return *store.createAlarm(a).value;
  }

  Override overrideFor(const std::string& alarmId, const std::string& date) {
    Override o;
    o.alarmId = alarmId;
    o.targetDate = parseDate(date);
    return o;
  }
};

TEST_F(schedule_store, create_assigns_eight_hex_id_and_persists) {
  AlarmDefinition draft;
  draft.id = "ignored";
  draft.time = TimeOfDay::parse("06:15");
  const auto res = store.createAlarm(draft);

  ASSERT_EQ(res.status, Status::Ok);
  ASSERT_TRUE(res.value);
  EXPECT_EQ(res.value->id.size(), 8u);
  EXPECT_EQ(res.value->id.find_first_not_of("0123456789abcdef"), std::string::npos);
  EXPECT_EQ(repo->alarms.count(res.value->id), 1u);
  EXPECT_EQ(store.findAlarm(res.value->id)->time, TimeOfDay::parse("06:15"));
}

TEST_F(schedule_store, ids_are_unique) {
  std::set<std::string> ids;
  for (int i = 0; i < 50; ++i)
    ids.insert(monday7().id);
  EXPECT_EQ(ids.size(), 50u);
}

TEST_F(schedule_store, update_toggle_delete_report_not_found) {
  EXPECT_EQ(store.updateAlarm("nope", AlarmPatch{}).status, Status::NotFound);
  EXPECT_EQ(store.toggleAlarm("nope").status, Status::NotFound);
  EXPECT_EQ(store.deleteAlarm("nope"), Status::NotFound);
  EXPECT_EQ(store.deleteOverride("nope"), Status::NotFound);
  EXPECT_EQ(store.updateOverride("nope", OverridePatch{}).status, Status::NotFound);
}

TEST_F(schedule_store, toggle_flips_enabled) {
  const auto a = monday7();
  EXPECT_FALSE(store.toggleAlarm(a.id).value->enabled);
  EXPECT_TRUE(store.toggleAlarm(a.id).value->enabled);
  EXPECT_EQ(repo->alarmSaves, 3);
}

TEST_F(schedule_store, override_for_unknown_alarm_is_rejected) {
  const auto res = store.createOverride(overrideFor("deadbeef", kMonday));
  EXPECT_EQ(res.status, Status::NotFound);
  EXPECT_TRUE(store.overrides().empty());
  EXPECT_EQ(repo->overrideSaves, 0);
}

TEST_F(schedule_store, duplicate_override_is_rejected_without_mutation) {
  const auto a = monday7();
  const auto first = store.createOverride(overrideFor(a.id, kMonday));
  ASSERT_EQ(first.status, Status::Ok);

  auto second = overrideFor(a.id, kMonday);
  second.skip = true;
  const auto res = store.createOverride(second);
  EXPECT_EQ(res.status, Status::Conflict);
  EXPECT_THAT(res.detail, HasSubstr(first.value->id));
  ASSERT_EQ(store.overrides().size(), 1u);
  EXPECT_FALSE(store.overrides().begin()->second.skip);
  EXPECT_EQ(repo->overrideSaves, 1);

  // a different date for the same alarm is fine
  EXPECT_EQ(store.createOverride(overrideFor(a.id, kNextMonday)).status, Status::Ok);
}

TEST_F(schedule_store, empty_override_sound_is_stored_as_absent) {
  const auto a = monday7();
  auto draft = overrideFor(a.id, kMonday);
  draft.overrideSound = "";
  EXPECT_FALSE(store.createOverride(draft).value->overrideSound);
}

TEST_F(schedule_store, finds_override_by_alarm_and_date) {
  const auto a = monday7();
  const auto o = *store.createOverride(overrideFor(a.id, kMonday)).value;

  ASSERT_NE(store.findOverrideFor(a.id, parseDate(kMonday)), nullptr);
  EXPECT_EQ(store.findOverrideFor(a.id, parseDate(kMonday))->id, o.id);
  EXPECT_EQ(store.findOverrideFor(a.id, parseDate(kTuesday)), nullptr);
}

TEST_F(schedule_store, failed_write_keeps_change_and_reports) {
  repo->failSave = true;
  EXPECT_CALL(*errors, notifyFailure(HasSubstr("failed to save alarms"))).Times(1);

  AlarmDefinition draft;
  draft.time = TimeOfDay::parse("05:00");
  const auto res = store.createAlarm(draft);

  EXPECT_EQ(res.status, Status::NotPersisted);
  ASSERT_TRUE(res.value);
  EXPECT_TRUE(reveille::core::applied(res.status));
  EXPECT_NE(store.findAlarm(res.value->id), nullptr);
  EXPECT_TRUE(repo->alarms.empty());
}

TEST_F(schedule_store, failed_load_starts_empty) {
  monday7();
  repo->failLoad = true;
  EXPECT_CALL(*errors, notifyFailure(HasSubstr("failed to load"))).Times(2);

  EXPECT_FALSE(store.load());
  EXPECT_TRUE(store.alarms().empty());
  EXPECT_TRUE(store.overrides().empty());
}

TEST_F(schedule_store, load_replaces_memory_with_repository) {
  AlarmDefinition a;
  a.id = "00000001";
  a.time = TimeOfDay::parse("09:00");
  repo->alarms[a.id] = a;

  EXPECT_TRUE(store.load());
  ASSERT_EQ(store.alarms().size(), 1u);
  EXPECT_EQ(store.alarms().at("00000001"), a);
}

TEST_F(schedule_store, erase_if_writes_once) {
  const auto a = monday7();
  store.createOverride(overrideFor(a.id, kMonday));
  store.createOverride(overrideFor(a.id, kTuesday));
  const int before = repo->overrideSaves;

  const auto res = store.eraseOverridesIf([](const Override&) { return true; });
  EXPECT_EQ(*res.value, 2u);
  EXPECT_EQ(repo->overrideSaves, before + 1);

  EXPECT_EQ(*store.eraseOverridesIf([](const Override&) { return true; }).value, 0u);
  EXPECT_EQ(repo->overrideSaves, before + 1);
}
