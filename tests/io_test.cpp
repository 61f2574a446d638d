#include "core/Logger.hpp"
#include "io/AudioProcess.hpp"
#include "io/DS3231.hpp"
#include "io/DeviceHub.hpp"
#include "io/I2CDevice.hpp"
#include "io/JsonFileRepository.hpp"
#include "io/MockDeviceHub.hpp"
#include "schedule/ScheduleStore.hpp"

#include "MockErrorMonitor.hpp"
#include "TestTime.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <cstdlib>
#include <fstream>
#include <thread>

using namespace reveille;
using namespace reveille::io;
using namespace reveille::test;
namespace fs = std::filesystem;
using ::testing::HasSubstr;
using ::testing::NiceMock;

namespace {

  std::shared_ptr<core::Logger> quietLog() {
    return std::make_shared<core::Logger>(core::LogLevel::Error);
  }

  fs::path freshDir(const std::string& name) {
    const auto dir = fs::temp_directory_path() / ("reveille_io_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
  }

  void touch(const fs::path& p) { std::ofstream(p) << "x"; }

  // Points PATH at \p dir for the lifetime of the object.
  class ScopedPath {
  public:
    explicit ScopedPath(const fs::path& dir) {
      if (const char* old = std::getenv("PATH"))
        saved_ = old;
      ::setenv("PATH", dir.c_str(), 1);
    }
    ~ScopedPath() { ::setenv("PATH", saved_.c_str(), 1); }

  private:
    std::string saved_;
  };

  template <typename Pred> bool waitFor(Pred pred, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!pred()) {
      if (std::chrono::steady_clock::now() > deadline)
        return false;
      std::this_thread::sleep_for(std::chrono::milliseconds{ 10 });
    }
    return true;
  }

} // namespace

// ---------------------------------------------------------------------------
// I2CDevice
// ---------------------------------------------------------------------------
TEST(i2c_device, open_on_missing_bus_fails_cleanly) {
  I2CDevice dev;
  EXPECT_FALSE(dev.open("/dev/i2c-does-not-exist", 0x68));
  EXPECT_FALSE(dev.isOpen());
  EXPECT_FALSE(dev.lastError().empty());

  std::uint8_t buf[2]{};
  EXPECT_FALSE(dev.readRegisters(0x00, buf, sizeof buf));
  EXPECT_FALSE(dev.writeBytes({ 0x00 }));
}

TEST(i2c_device, move_keeps_identity) {
  I2CDevice a;
  EXPECT_FALSE(a.open("/dev/i2c-does-not-exist", 0x70));
  I2CDevice b(std::move(a));
  EXPECT_EQ(b.address(), 0x70);
  EXPECT_EQ(b.bus(), "/dev/i2c-does-not-exist");
  EXPECT_FALSE(b.isOpen());
}

// ---------------------------------------------------------------------------
// DS3231 register codec
// ---------------------------------------------------------------------------
TEST(ds3231, encodes_bcd_registers) {
  const auto regs = encodeDS3231(at(kMonday, "07:05", 9));
  EXPECT_EQ(regs, (DS3231Registers{ 0x09, 0x05, 0x07, 0x01, 0x19, 0x10, 0x26 }));

  const auto sunday = encodeDS3231(at(kSunday, "23:59", 58));
  EXPECT_EQ(sunday[2], 0x23);
  EXPECT_EQ(sunday[3], 0x07);
}

TEST(ds3231, sets_century_bit_after_2099) {
  const auto t = schedule::makeLocalTime(schedule::parseDate("2101-01-01"),
                                         schedule::TimeOfDay::parse("00:00"));
  const auto regs = encodeDS3231(t);
  EXPECT_EQ(regs[5], 0x81);
  EXPECT_EQ(regs[6], 0x01);
  EXPECT_EQ(decodeDS3231(regs), t);
}

TEST(ds3231, decodes_what_it_encodes) {
  const auto t = at(kTuesday, "18:42", 31);
  EXPECT_EQ(decodeDS3231(encodeDS3231(t)), t);
}

TEST(ds3231, decodes_twelve_hour_mode) {
  DS3231Registers pm{ 0x00, 0x30, 0x40 | 0x20 | 0x07, 0x01, 0x19, 0x10, 0x26 };
  EXPECT_EQ(decodeDS3231(pm), at(kMonday, "19:30"));

  DS3231Registers midnight{ 0x00, 0x00, 0x40 | 0x12, 0x01, 0x19, 0x10, 0x26 };
  EXPECT_EQ(decodeDS3231(midnight), at(kMonday, "00:00"));
}

TEST(ds3231, rejects_garbage_registers) {
  EXPECT_FALSE(decodeDS3231({ 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 })); // day 0
  EXPECT_FALSE(decodeDS3231({ 0x60, 0x00, 0x00, 0x01, 0x01, 0x01, 0x26 })); // 60 s
  EXPECT_FALSE(decodeDS3231({ 0x00, 0x00, 0x25, 0x01, 0x01, 0x01, 0x26 })); // 25 h
  EXPECT_FALSE(decodeDS3231({ 0x00, 0x00, 0x00, 0x01, 0x30, 0x02, 0x26 })); // 30 Feb
}

// ---------------------------------------------------------------------------
// AudioProcess
// ---------------------------------------------------------------------------
TEST(audio_process, resolves_exact_then_extension_then_first) {
  const auto dir = freshDir("sounds");
  touch(dir / "chime.mp3");
  touch(dir / "birds.wav");
  touch(dir / "alpha.ogg");
  touch(dir / "notes.txt");

  AudioProcess audio(dir, quietLog());
  EXPECT_EQ(audio.availableSounds(), (std::vector<std::string>{ "alpha.ogg", "birds.wav", "chime.mp3" }));
  EXPECT_EQ(audio.resolve("chime.mp3"), dir / "chime.mp3");
  EXPECT_EQ(audio.resolve("birds"), dir / "birds.wav");
  EXPECT_EQ(audio.resolve("missing.mp3"), dir / "alpha.ogg");
  EXPECT_EQ(audio.resolve(""), dir / "alpha.ogg");
  fs::remove_all(dir);
}

TEST(audio_process, empty_directory_has_nothing_to_play) {
  const auto dir = freshDir("empty_sounds");
  AudioProcess audio(dir, quietLog());
  EXPECT_FALSE(audio.resolve("default.mp3"));
  EXPECT_FALSE(audio.play("default.mp3", true));
  EXPECT_FALSE(audio.playing());
  audio.stop();
  fs::remove_all(dir);
}

TEST(audio_process, remembers_clamped_volume) {
  const auto dir = freshDir("volume_sounds");
  AudioProcess audio(dir, quietLog());
  audio.setVolume(140);
  EXPECT_EQ(audio.volume(), 100);
  audio.setVolume(-5);
  EXPECT_EQ(audio.volume(), 0);
  fs::remove_all(dir);
}

TEST(audio_process, stop_returns_without_waiting_for_the_player) {
  const auto sounds = freshDir("slow_sounds");
  const auto bin = freshDir("slow_bin");
  touch(sounds / "tone.wav");

  // a player that ignores SIGTERM, so terminating it takes the full grace period
  const auto player = bin / "aplay";
  std::ofstream(player) << "#!/bin/sh\nPATH=/usr/bin:/bin\ntrap '' TERM\n"
                           "while :; do sleep 0.05; done\n";
  fs::permissions(player, fs::perms::owner_all);

  {
    ScopedPath path(bin);
    AudioProcess audio(sounds, quietLog());
    ASSERT_TRUE(audio.play("tone", true));
    ASSERT_TRUE(waitFor([&] { return audio.playing(); }, std::chrono::seconds{ 2 }));

    const auto before = std::chrono::steady_clock::now();
    audio.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::milliseconds{ 100 });

    EXPECT_TRUE(waitFor([&] { return !audio.playing(); }, std::chrono::seconds{ 3 }));
  }
  fs::remove_all(sounds);
  fs::remove_all(bin);
}

// ---------------------------------------------------------------------------
// JsonFileRepository
// ---------------------------------------------------------------------------
class json_repository : public ::testing::Test {
protected:
  void SetUp() override { dir = freshDir("repo"); }
  void TearDown() override { fs::remove_all(dir); }

  void writeFile(const fs::path& p, const std::string& text) { std::ofstream(p) << text; }

  fs::path dir;
};

TEST_F(json_repository, missing_files_load_empty_and_are_created) {
  JsonFileRepository repo(dir, quietLog());
  EXPECT_TRUE(repo.loadAlarms().empty());
  EXPECT_TRUE(repo.loadOverrides().empty());
  EXPECT_TRUE(fs::exists(repo.alarmsFile()));
  EXPECT_TRUE(fs::exists(repo.overridesFile()));
}

TEST_F(json_repository, saves_and_reloads_records) {
  JsonFileRepository repo(dir, quietLog());

  schedule::AlarmDefinition a;
  a.id = "a1";
  a.time = schedule::TimeOfDay::parse("06:45");
  a.days = schedule::DaySet{ schedule::Weekday::Monday, schedule::Weekday::Friday };
  a.label = "gym";
  repo.saveAlarms({ { a.id, a } });

  schedule::Override o;
  o.id = "o1";
  o.alarmId = "a1";
  o.targetDate = schedule::parseDate(kMonday);
  o.overrideSound = "birds.wav";
  repo.saveOverrides({ { o.id, o } });

  JsonFileRepository again(dir, quietLog());
  const auto alarms = again.loadAlarms();
  ASSERT_EQ(alarms.size(), 1u);
  EXPECT_EQ(alarms.at("a1"), a);
  const auto overrides = again.loadOverrides();
  ASSERT_EQ(overrides.size(), 1u);
  EXPECT_EQ(overrides.at("o1"), o);

  EXPECT_FALSE(fs::exists(dir / "alarms.json.tmp"));
  EXPECT_FALSE(fs::exists(dir / "overrides.json.tmp"));
}

TEST_F(json_repository, skips_malformed_records_and_unknown_days) {
  writeFile(dir / "alarms.json", R"({
    "good": {"id": "good", "time": "07:00", "days": ["monday", "funday"], "sound": "x.mp3"},
    "bad":  {"id": "bad", "time": "25:99", "days": ["monday"]},
    "worse": 42
  })");
  JsonFileRepository repo(dir, quietLog());
  const auto alarms = repo.loadAlarms();
  ASSERT_EQ(alarms.size(), 1u);
  const auto& good = alarms.at("good");
  EXPECT_TRUE(good.days.contains(schedule::Weekday::Monday));
  EXPECT_EQ(good.days.days().size(), 1u);
}

TEST_F(json_repository, key_wins_over_stored_id) {
  writeFile(dir / "alarms.json",
            R"({"k1": {"id": "other", "time": "07:00", "days": ["tue"]}})");
  JsonFileRepository repo(dir, quietLog());
  const auto alarms = repo.loadAlarms();
  ASSERT_EQ(alarms.count("k1"), 1u);
  EXPECT_EQ(alarms.at("k1").id, "k1");
}

TEST_F(json_repository, unserialisable_text_is_a_persistence_error) {
  JsonFileRepository repo(dir, quietLog());

  schedule::AlarmDefinition a;
  a.id = "a1";
  a.time = schedule::TimeOfDay::parse("06:45");
  a.days = schedule::DaySet{ schedule::Weekday::Monday };
  repo.saveAlarms({ { a.id, a } });

  auto bad = a;
  bad.id = "a2";
  bad.label = "caf\xe9";
  EXPECT_THROW(repo.saveAlarms({ { a.id, a }, { bad.id, bad } }), schedule::PersistenceError);

  EXPECT_EQ(repo.loadAlarms().size(), 1u);
  EXPECT_FALSE(fs::exists(dir / "alarms.json.tmp"));
}

TEST_F(json_repository, store_reports_unserialisable_text_instead_of_throwing) {
  auto errors = std::make_shared<NiceMock<MockErrorMonitor>>();
  EXPECT_CALL(*errors, notifyFailure(HasSubstr("[ScheduleStore]"))).Times(::testing::AtLeast(1));

  auto log = quietLog();
  schedule::ScheduleStore store(std::make_shared<JsonFileRepository>(dir, log), log, errors);
  ASSERT_TRUE(store.load());

  schedule::AlarmDefinition draft;
  draft.time = schedule::TimeOfDay::parse("07:00");
  draft.days = schedule::DaySet{ schedule::Weekday::Tuesday };
  draft.label = "caf\xe9";
  core::Result<schedule::AlarmDefinition> res;
  EXPECT_NO_THROW(res = store.createAlarm(draft));
  EXPECT_EQ(res.status, core::Status::NotPersisted);
}

TEST_F(json_repository, unreadable_document_throws) {
  writeFile(dir / "alarms.json", "[1, 2, 3]");
  writeFile(dir / "overrides.json", "{ broken");
  JsonFileRepository repo(dir, quietLog());
  EXPECT_THROW(repo.loadAlarms(), schedule::PersistenceError);
  EXPECT_THROW(repo.loadOverrides(), schedule::PersistenceError);
}

// ---------------------------------------------------------------------------
// MockDeviceHub / openDeviceHub
// ---------------------------------------------------------------------------
TEST(mock_device_hub, set_time_shifts_the_clock) {
  const auto dir = freshDir("mock_sounds");
  auto log = quietLog();
  MockDeviceHub hub(std::make_unique<AudioProcess>(dir, log), log);

  const auto target = at(kMonday, "06:59", 50);
  hub.setTime(target);
  const auto now = hub.now();
  EXPECT_GE(now, target);
  EXPECT_LT(now - target, std::chrono::seconds{ 5 });

  hub.setIndicator(true);
  EXPECT_TRUE(hub.indicator());
  hub.setBrightness(40);
  EXPECT_EQ(hub.brightness(), 15);
  EXPECT_EQ(hub.describe(), "mock (system clock)");
  fs::remove_all(dir);
}

TEST(open_device_hub, mock_requested_means_no_fault) {
  const auto dir = freshDir("hub_sounds");
  auto errors = std::make_shared<MockErrorMonitor>();
  EXPECT_CALL(*errors, notifyFailure(::testing::_)).Times(0);

  DeviceConfig cfg;
  cfg.useMock = true;
  cfg.soundsDirectory = dir.string();
  auto hub = openDeviceHub(cfg, quietLog(), errors);
  ASSERT_TRUE(hub);
  EXPECT_EQ(hub->describe(), "mock (system clock)");
  fs::remove_all(dir);
}

TEST(open_device_hub, missing_rtc_falls_back_to_mock) {
  const auto dir = freshDir("fallback_sounds");
  auto errors = std::make_shared<NiceMock<MockErrorMonitor>>();
  EXPECT_CALL(*errors, notifyFailure(HasSubstr("[DeviceHub]"))).Times(1);

  DeviceConfig cfg;
  cfg.useMock = false;
  cfg.i2cBus = "/dev/i2c-does-not-exist";
  cfg.soundsDirectory = dir.string();
  auto hub = openDeviceHub(cfg, quietLog(), errors);
  ASSERT_TRUE(hub);
  EXPECT_EQ(hub->describe(), "mock (system clock)");
  EXPECT_LT(std::chrono::abs(hub->now() - systemLocalTime()), std::chrono::seconds{ 5 });
  fs::remove_all(dir);
}
