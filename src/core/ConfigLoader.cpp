/* @file ConfigLoader.cpp
 * @brief config.json parsing with per-key defaults, and write-back of changed settings
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <filesystem>
#include <fstream>
#include <stdexcept>

// 3rd party headers
#include <nlohmann/json.hpp>

// Reveille headers
#include "core/ConfigLoader.hpp"

using namespace reveille::core;
using json = nlohmann::json;

namespace {

  // I²C addresses may be written as 104 or as "0x68"
  std::uint8_t readAddress(const json& j, const char* key, std::uint8_t fallback) {
    const auto it = j.find(key);
    if (it == j.end())
      return fallback;

    unsigned long value = 0;
    if (it->is_string()) {
      try {
        value = std::stoul(it->get<std::string>(), nullptr, 0);
      } catch (const std::logic_error&) {
        throw std::runtime_error(std::string("[ConfigLoader] ") + key + " is not a number");
      }
    } else {
      value = it->get<unsigned long>();
    }
    if (value > 0x7F)
      throw std::runtime_error(std::string("[ConfigLoader] ") + key + " is not a 7-bit address");
    return static_cast<std::uint8_t>(value);
  }

} // namespace

void reveille::core::from_json(const json& j, DaemonConfig& cfg) {
  const DaemonConfig d;
  cfg.useMockHardware = j.value("use_mock_hardware", d.useMockHardware);
  cfg.dataDirectory = j.value("data_directory", d.dataDirectory);
  cfg.soundsDirectory = j.value("sounds_directory", d.soundsDirectory);
  cfg.logFile = j.value("log_file", d.logFile);
  cfg.logLevel = j.value("log_level", d.logLevel);
  cfg.snoozeMinutes = j.value("snooze_duration_minutes", d.snoozeMinutes);
  cfg.timeoutMinutes = j.value("timeout_minutes", d.timeoutMinutes);
  cfg.checkIntervalSeconds = j.value("alarm_check_interval_seconds", d.checkIntervalSeconds);
  cfg.volume = j.value("volume", d.volume);
  cfg.displayBrightness = j.value("display_brightness", d.displayBrightness);
  cfg.i2cBus = j.value("i2c_bus", d.i2cBus);
  cfg.rtcAddress = readAddress(j, "rtc_address", d.rtcAddress);
  cfg.displayAddress = readAddress(j, "display_address", d.displayAddress);
}

void reveille::core::to_json(json& j, const DaemonConfig& cfg) {
  j = json{ { "use_mock_hardware", cfg.useMockHardware },
            { "data_directory", cfg.dataDirectory },
            { "sounds_directory", cfg.soundsDirectory },
            { "log_file", cfg.logFile },
            { "log_level", cfg.logLevel },
            { "snooze_duration_minutes", cfg.snoozeMinutes },
            { "timeout_minutes", cfg.timeoutMinutes },
            { "alarm_check_interval_seconds", cfg.checkIntervalSeconds },
            { "volume", cfg.volume },
            { "display_brightness", cfg.displayBrightness },
            { "i2c_bus", cfg.i2cBus },
            { "rtc_address", cfg.rtcAddress },
            { "display_address", cfg.displayAddress } };
}

ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

json ConfigLoader::load() const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec))
    return json::object();

  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_);

  json doc;
  try {
    in >> doc;
  } catch (const json::parse_error& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
  if (!doc.is_object())
    throw std::runtime_error("[ConfigLoader] " + path_ + " is not a JSON object");
  return doc;
}

DaemonConfig ConfigLoader::loadConfig() const {
  const json doc = load();
  try {
    return doc.get<DaemonConfig>();
  } catch (const json::exception& e) {
    throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
  }
}

void ConfigLoader::save(const json& doc) const {
  std::ofstream out(path_, std::ios::trunc);
  if (!out)
    throw std::runtime_error("[ConfigLoader] cannot open " + path_ + " for writing");
  out << doc.dump(4) << '\n';
  if (!out)
    throw std::runtime_error("[ConfigLoader] write to " + path_ + " failed");
}
