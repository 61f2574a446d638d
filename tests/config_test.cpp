#include "core/ConfigLoader.hpp"
#include "core/SystemCoordinator.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace reveille::core;
namespace fs = std::filesystem;
using json = nlohmann::json;

class config_fixture : public ::testing::Test {
protected:
  void SetUp() override {
    dir = fs::temp_directory_path() /
          ("reveille_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    path = dir / "config.json";
  }
  void TearDown() override { fs::remove_all(dir); }

  void write(const std::string& text) { std::ofstream(path) << text; }

  json readBack() {
    std::ifstream in(path);
    return json::parse(in);
  }

  fs::path dir;
  fs::path path;
};

TEST_F(config_fixture, missing_file_gives_defaults) {
  const auto cfg = ConfigLoader(path.string()).loadConfig();
  EXPECT_TRUE(cfg.useMockHardware);
  EXPECT_EQ(cfg.snoozeMinutes, 9);
  EXPECT_EQ(cfg.timeoutMinutes, 5);
  EXPECT_EQ(cfg.checkIntervalSeconds, 30);
  EXPECT_EQ(cfg.volume, 80);
  EXPECT_EQ(cfg.displayBrightness, 10);
  EXPECT_EQ(cfg.i2cBus, "/dev/i2c-1");
  EXPECT_EQ(cfg.rtcAddress, 0x68);
  EXPECT_EQ(cfg.displayAddress, 0x70);
  EXPECT_EQ(cfg.logLevel, "info");
}

TEST_F(config_fixture, reads_supplied_keys_and_hex_addresses) {
  write(R"({
    "use_mock_hardware": false,
    "snooze_duration_minutes": 7,
    "volume": 55,
    "log_level": "debug",
    "rtc_address": "0x57",
    "display_address": 113,
    "some_future_key": [1, 2, 3]
  })");
  const auto cfg = ConfigLoader(path.string()).loadConfig();
  EXPECT_FALSE(cfg.useMockHardware);
  EXPECT_EQ(cfg.snoozeMinutes, 7);
  EXPECT_EQ(cfg.volume, 55);
  EXPECT_EQ(cfg.logLevel, "debug");
  EXPECT_EQ(cfg.rtcAddress, 0x57);
  EXPECT_EQ(cfg.displayAddress, 0x71);
  EXPECT_EQ(cfg.timeoutMinutes, 5);
}

TEST_F(config_fixture, rejects_out_of_range_address) {
  write(R"({"rtc_address": "0x1FF"})");
  EXPECT_THROW(ConfigLoader(path.string()).loadConfig(), std::runtime_error);
}

TEST_F(config_fixture, malformed_json_throws) {
  write("{ \"volume\": 50,");
  EXPECT_THROW(ConfigLoader(path.string()).load(), std::runtime_error);

  write("[1, 2]");
  EXPECT_THROW(ConfigLoader(path.string()).load(), std::runtime_error);
}

TEST_F(config_fixture, save_preserves_other_keys) {
  write(R"({"volume": 20, "custom": "kept"})");
  ConfigLoader loader(path.string());
  auto doc = loader.load();
  doc["volume"] = 65;
  loader.save(doc);

  const auto back = readBack();
  EXPECT_EQ(back["volume"], 65);
  EXPECT_EQ(back["custom"], "kept");
}

class coordinator_fixture : public config_fixture {
protected:
  void SetUp() override {
    config_fixture::SetUp();
    json doc = { { "use_mock_hardware", true },
                 { "data_directory", (dir / "data").string() },
                 { "sounds_directory", (dir / "sounds").string() },
                 { "log_file", (dir / "reveille.log").string() },
                 { "log_level", "error" },
                 { "snooze_duration_minutes", 4 } };
    fs::create_directories(dir / "data");
    std::ofstream(path) << doc.dump(4);
  }
};

TEST_F(coordinator_fixture, initializes_with_mock_hardware) {
  SystemCoordinator sys;
  EXPECT_EQ(sys.state(), SystemCoordinator::State::BOOT);
  EXPECT_THROW(sys.service(), std::logic_error);

  sys.initialize(path.string());
  EXPECT_EQ(sys.state(), SystemCoordinator::State::INIT);
  EXPECT_EQ(sys.config().snoozeMinutes, 4);

  AlarmRequest req;
  req.time = "07:00";
  req.days = { "mon", "fri" };
  const auto created = sys.service().createAlarm(req);
  ASSERT_EQ(created.status, Status::Ok);
  EXPECT_EQ(sys.service().listAlarms().size(), 1u);
  EXPECT_TRUE(fs::exists(dir / "data" / "alarms.json"));

  sys.shutdown();
  EXPECT_EQ(sys.state(), SystemCoordinator::State::STOPPED);
  sys.shutdown();
  EXPECT_EQ(sys.state(), SystemCoordinator::State::STOPPED);
}

TEST_F(coordinator_fixture, settings_update_is_written_back) {
  SystemCoordinator sys;
  sys.initialize(path.string());

  SettingsPatch patch;
  patch.volume = 130;
  patch.snoozeMinutes = 12;
  const auto stored = sys.updateSettings(patch);
  EXPECT_EQ(stored.volume, 100);
  EXPECT_EQ(stored.snoozeMinutes, 12);

  const auto back = readBack();
  EXPECT_EQ(back["volume"], 100);
  EXPECT_EQ(back["snooze_duration_minutes"], 12);
  EXPECT_EQ(back["log_level"], "error");
}

TEST_F(coordinator_fixture, faults_before_running_do_not_change_state) {
  SystemCoordinator sys;
  sys.initialize(path.string());
  sys.handleError("rtc read failed");
  EXPECT_EQ(sys.state(), SystemCoordinator::State::INIT);
}

TEST_F(config_fixture, initialize_fails_on_malformed_config) {
  write("not json");
  SystemCoordinator sys;
  EXPECT_THROW(sys.initialize(path.string()), std::runtime_error);
}
