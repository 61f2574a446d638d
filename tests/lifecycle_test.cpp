#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "schedule/OverrideLifecycle.hpp"
#include "schedule/ScheduleStore.hpp"

#include "MemoryRepository.hpp"
#include "TestTime.hpp"

#include <gtest/gtest.h>

using namespace reveille::schedule;
using namespace reveille::test;
using reveille::core::ErrorMonitor;
using reveille::core::Logger;
using reveille::core::LogLevel;
using reveille::core::Status;

class override_lifecycle : public ::testing::Test {
protected:
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  std::shared_ptr<Logger> log = std::make_shared<Logger>(LogLevel::Error);
  ScheduleStore store{ repo, log, std::make_shared<ErrorMonitor>() };
  OverrideLifecycle lifecycle{ store, log };

  std::string alarm() {
    AlarmDefinition a;
    a.time = TimeOfDay::parse("07:00");
    a.days = DaySet{ DaySet::kAll };
    return store.createAlarm(a).value->id;
  }

  std::string overrideOn(const std::string& alarmId, const std::string& date) {
    Override o;
    o.alarmId = alarmId;
    o.targetDate = parseDate(date);
    return store.createOverride(o).value->id;
  }
};

TEST_F(override_lifecycle, cleanup_drops_yesterday_and_earlier) {
  const auto a = alarm();
  const auto twoDaysAgo = overrideOn(a, "2026-10-18");
  const auto longAgo = overrideOn(a, "2026-09-01");
  const auto yesterday = overrideOn(a, "2026-10-19");
  const auto today = overrideOn(a, "2026-10-20");
  const auto later = overrideOn(a, "2026-10-27");

  // now is Tuesday 2026-10-20
  const auto res = lifecycle.cleanupExpired(at(kTuesday, "00:05"));
  EXPECT_EQ(res.status, Status::Ok);
  EXPECT_EQ(*res.value, 3u);

  EXPECT_EQ(store.findOverride(twoDaysAgo), nullptr);
  EXPECT_EQ(store.findOverride(longAgo), nullptr);
  EXPECT_EQ(store.findOverride(yesterday), nullptr);
  EXPECT_NE(store.findOverride(today), nullptr);
  EXPECT_NE(store.findOverride(later), nullptr);
}

TEST_F(override_lifecycle, cleanup_crosses_month_boundary) {
  const auto a = alarm();
  const auto lastOfMonth = overrideOn(a, "2026-10-31");
  const auto dayBefore = overrideOn(a, "2026-10-30");

  const auto firstOfMonth = overrideOn(a, "2026-11-01");

  lifecycle.cleanupExpired(at("2026-11-01", "12:00"));
  EXPECT_EQ(store.findOverride(lastOfMonth), nullptr);
  EXPECT_EQ(store.findOverride(dayBefore), nullptr);
  EXPECT_NE(store.findOverride(firstOfMonth), nullptr);
}

TEST_F(override_lifecycle, cascade_removes_only_that_alarms_overrides) {
  const auto a = alarm();
  const auto b = alarm();
  overrideOn(a, kMonday);
  overrideOn(a, kTuesday);
  const auto keep = overrideOn(b, kMonday);

  const auto res = lifecycle.cascadeDeleteForAlarm(a);
  EXPECT_EQ(*res.value, 2u);
  ASSERT_EQ(store.overrides().size(), 1u);
  EXPECT_EQ(store.overrides().begin()->first, keep);
}

TEST_F(override_lifecycle, purges_overrides_of_missing_alarms) {
  Override orphan;
  orphan.id = "0000dead";
  orphan.alarmId = "gone";
  orphan.targetDate = parseDate(kMonday);
  repo->overrides[orphan.id] = orphan;
  ASSERT_TRUE(store.load());

  const auto res = lifecycle.purgeOrphans();
  EXPECT_EQ(*res.value, 1u);
  EXPECT_TRUE(store.overrides().empty());
  EXPECT_TRUE(repo->overrides.empty());
}

TEST_F(override_lifecycle, reports_not_persisted_when_write_fails) {
  const auto a = alarm();
  overrideOn(a, "2026-01-01");
  repo->failSave = true;

  const auto res = lifecycle.cleanupExpired(at(kMonday, "08:00"));
  EXPECT_EQ(res.status, Status::NotPersisted);
  EXPECT_EQ(*res.value, 1u);
  EXPECT_TRUE(store.overrides().empty());
}
