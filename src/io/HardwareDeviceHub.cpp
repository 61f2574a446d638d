/* @file HardwareDeviceHub.cpp
 * @brief DS3231 clock, HT16K33 indicator and AudioProcess behind the DeviceHub face
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdio>

// Reveille headers
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "io/AudioProcess.hpp"
#include "io/HardwareDeviceHub.hpp"

using namespace reveille::io;
using reveille::schedule::LocalTime;

namespace {
  constexpr const char* kTag = "devices";
}

HardwareDeviceHub::HardwareDeviceHub(DS3231 rtc, HT16K33 display,
                                     std::unique_ptr<AudioProcess> audio,
                                     std::shared_ptr<core::Logger> log,
                                     std::shared_ptr<core::ErrorMonitor> errors)
    : rtc_(std::move(rtc)), display_(std::move(display)), audio_(std::move(audio)),
      log_(std::move(log)), errors_(std::move(errors)) {
  log_->info(kTag, "Running with hardware devices: " + describe());
}

HardwareDeviceHub::~HardwareDeviceHub() {
  audio_->stop();
  std::lock_guard lock(mtx_);
  display_.clear();
}

void HardwareDeviceHub::play(const std::string& sound, bool loop) { audio_->play(sound, loop); }

void HardwareDeviceHub::stop() { audio_->stop(); }

void HardwareDeviceHub::setIndicator(bool on) {
  std::lock_guard lock(mtx_);
  if (!display_.setColon(on))
    report("indicator write failed", display_.device());
}

LocalTime HardwareDeviceHub::now() {
  std::lock_guard lock(mtx_);
  if (auto t = rtc_.read())
    return *t;
  report("RTC read failed, using system time", rtc_.device());
  return systemLocalTime();
}

void HardwareDeviceHub::setTime(LocalTime t) {
  std::lock_guard lock(mtx_);
  if (rtc_.write(t))
    log_->info(kTag, "RTC time set to " + schedule::formatLocalTime(t));
  else
    report("RTC write failed", rtc_.device());
}

void HardwareDeviceHub::setVolume(int percent) { audio_->setVolume(percent); }

void HardwareDeviceHub::setBrightness(int level) {
  std::lock_guard lock(mtx_);
  if (display_.setBrightness(level))
    log_->debug(kTag, "Display brightness set to " + std::to_string(level));
  else
    report("brightness write failed", display_.device());
}

std::string HardwareDeviceHub::describe() const {
  char buf[128];
  std::snprintf(buf, sizeof buf, "hardware (DS3231 0x%02X, HT16K33 0x%02X on %s)",
                rtc_.device().address(), display_.device().address(),
                rtc_.device().bus().c_str());
  return buf;
}

void HardwareDeviceHub::report(const std::string& what, const I2CDevice& dev) {
  const std::string msg = what + " (" + dev.lastError() + ")";
  log_->error(kTag, msg);
  errors_->notifyFailure("[HardwareDeviceHub] " + what);
}
