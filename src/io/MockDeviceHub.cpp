/* @file MockDeviceHub.cpp
 * @brief system-clock DeviceHub used on development hosts and as the hardware fallback
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// Reveille headers
#include "core/Logger.hpp"
#include "io/AudioProcess.hpp"
#include "io/MockDeviceHub.hpp"

using namespace reveille::io;
using reveille::schedule::LocalTime;

namespace {
  constexpr const char* kTag = "devices";
}

MockDeviceHub::MockDeviceHub(std::unique_ptr<AudioProcess> audio, std::shared_ptr<core::Logger> log)
    : audio_(std::move(audio)), log_(std::move(log)) {
  log_->info(kTag, "Running with mock devices (system time, logged indicator)");
}

MockDeviceHub::~MockDeviceHub() { audio_->stop(); }

void MockDeviceHub::play(const std::string& sound, bool loop) { audio_->play(sound, loop); }

void MockDeviceHub::stop() { audio_->stop(); }

void MockDeviceHub::setIndicator(bool on) {
  {
    std::lock_guard lock(mtx_);
    indicator_ = on;
  }
  log_->debug(kTag, std::string("Alarm indicator ") + (on ? "on" : "off"));
}

LocalTime MockDeviceHub::now() {
  std::lock_guard lock(mtx_);
  return systemLocalTime() + offset_;
}

void MockDeviceHub::setTime(LocalTime t) {
  {
    std::lock_guard lock(mtx_);
    offset_ = t - systemLocalTime();
  }
  log_->info(kTag, "Mock clock set to " + schedule::formatLocalTime(t));
}

void MockDeviceHub::setVolume(int percent) { audio_->setVolume(percent); }

void MockDeviceHub::setBrightness(int level) {
  std::lock_guard lock(mtx_);
  brightness_ = std::clamp(level, 0, 15);
  log_->debug(kTag, "Display brightness set to " + std::to_string(brightness_));
}

bool MockDeviceHub::indicator() const {
  std::lock_guard lock(mtx_);
  return indicator_;
}

int MockDeviceHub::brightness() const {
  std::lock_guard lock(mtx_);
  return brightness_;
}
