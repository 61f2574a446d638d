#pragma once
/** @file  HardwareDeviceHub.hpp
 *  @brief DeviceHub backed by the DS3231 RTC, the HT16K33 backpack and a speaker.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <mutex>

#include "io/DS3231.hpp"
#include "io/DeviceHub.hpp"
#include "io/HT16K33.hpp"

namespace reveille::io {

  class AudioProcess;

  /**
 * @class HardwareDeviceHub
 * @brief The real clock: every `now()` reads the RTC.
 *
 *  * A failed RTC read falls back to the system clock for that call and is
 *    reported once to the ErrorMonitor.
 *  * Indicator and brightness failures are logged; the alarm still sounds.
 */
  class HardwareDeviceHub : public DeviceHub {
  public:
    HardwareDeviceHub(DS3231 rtc, HT16K33 display, std::unique_ptr<AudioProcess> audio,
                      std::shared_ptr<core::Logger> log, std::shared_ptr<core::ErrorMonitor> errors);
    ~HardwareDeviceHub() override;

    void play(const std::string& sound, bool loop) override;
    void stop() override;
    void setIndicator(bool on) override;

    schedule::LocalTime now() override;
    void setTime(schedule::LocalTime t) override;

    void setVolume(int percent) override;
    void setBrightness(int level) override;

    std::string describe() const override;

  private:
    void report(const std::string& what, const I2CDevice& dev);

    std::mutex mtx_; ///< one I²C transaction at a time
    DS3231 rtc_;
    HT16K33 display_;
    std::unique_ptr<AudioProcess> audio_;
    std::shared_ptr<core::Logger> log_;
    std::shared_ptr<core::ErrorMonitor> errors_;
  };

} // namespace reveille::io
