/* @file DeviceHub.cpp
 * @brief capability negotiation: try the RTC and LED backpack, fall back to the mock hub
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>

// Reveille headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "io/AudioProcess.hpp"
#include "io/DeviceHub.hpp"
#include "io/HardwareDeviceHub.hpp"
#include "io/MockDeviceHub.hpp"

using namespace reveille::io;
using namespace std::chrono;

namespace {

  constexpr const char* kTag = "devices";

  std::string hex(std::uint8_t address) {
    char buf[8];
    std::snprintf(buf, sizeof buf, "0x%02X", address);
    return buf;
  }

} // namespace

reveille::schedule::LocalTime reveille::io::systemLocalTime() {
  const std::time_t t = system_clock::to_time_t(system_clock::now());
  std::tm tm{};
  ::localtime_r(&t, &tm);

  const year_month_day ymd{ year{ tm.tm_year + 1900 }, month{ static_cast<unsigned>(tm.tm_mon + 1) },
                            day{ static_cast<unsigned>(tm.tm_mday) } };
  return local_days{ ymd } + hours{ tm.tm_hour } + minutes{ tm.tm_min } +
         seconds{ std::min(tm.tm_sec, 59) }; // tm_sec may be 60 on a leap second
}

std::shared_ptr<DeviceHub> reveille::io::openDeviceHub(const DeviceConfig& cfg,
                                                       std::shared_ptr<core::Logger> log,
                                                       std::shared_ptr<core::ErrorMonitor> errors) {
  auto audio = std::make_unique<AudioProcess>(cfg.soundsDirectory, log);

  if (cfg.useMock)
    return std::make_shared<MockDeviceHub>(std::move(audio), log);

  auto fallback = [&](const std::string& reason) -> std::shared_ptr<DeviceHub> {
    log->error(kTag, reason + ", falling back to mock devices");
    errors->notifyFailure("[DeviceHub] " + reason);
    return std::make_shared<MockDeviceHub>(std::move(audio), log);
  };

  I2CDevice rtcDev;
  if (!rtcDev.open(cfg.i2cBus, cfg.rtcAddress))
    return fallback("DS3231 at " + hex(cfg.rtcAddress) + " unavailable: " + rtcDev.lastError());
  DS3231 rtc{ std::move(rtcDev) };
  if (!rtc.read())
    return fallback("DS3231 at " + hex(cfg.rtcAddress) + " did not return a valid time");

  I2CDevice displayDev;
  if (!displayDev.open(cfg.i2cBus, cfg.displayAddress))
    return fallback("HT16K33 at " + hex(cfg.displayAddress) + " unavailable: " +
                    displayDev.lastError());
  HT16K33 display{ std::move(displayDev) };
  if (!display.init(HT16K33::kMaxBrightness))
    return fallback("HT16K33 at " + hex(cfg.displayAddress) +
                    " init failed: " + display.device().lastError());

  return std::make_shared<HardwareDeviceHub>(std::move(rtc), std::move(display), std::move(audio),
                                             log, errors);
}
