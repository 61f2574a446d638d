#pragma once
/** @file  DeviceHub.hpp
 *  @brief Single polymorphic face of the clock, sound output and alarm indicator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <memory>
#include <string>

#include "schedule/Calendar.hpp"

namespace reveille::core {
  class Logger;
  class ErrorMonitor;
} // namespace reveille::core

namespace reveille::io {

  /**
 * @class DeviceHub
 * @brief Everything the alarm core asks of the hardware.
 *
 *  * Implementations swallow their own device errors (log + degrade); the core
 *    never branches on which implementation it was handed.
 *  * Calls arrive from the poll thread and from boundary callers, always under
 *    the AlarmService lock.
 */
  class DeviceHub {
  public:
    virtual ~DeviceHub() = default;

    virtual void play(const std::string& sound, bool loop) = 0;
    virtual void stop() = 0;
    virtual void setIndicator(bool on) = 0;

    virtual schedule::LocalTime now() = 0;
    virtual void setTime(schedule::LocalTime t) = 0;

    virtual void setVolume(int percent) = 0;   ///< 0-100
    virtual void setBrightness(int level) = 0; ///< 0-15

    /// Short label for logs, e.g. "hardware (DS3231 @ /dev/i2c-1)".
    virtual std::string describe() const = 0;
  };

  /// Local wall-clock time from the system clock (localtime_r), second precision.
  schedule::LocalTime systemLocalTime();

  struct DeviceConfig {
    bool useMock{ true };
    std::string i2cBus{ "/dev/i2c-1" };
    std::uint8_t rtcAddress{ 0x68 };
    std::uint8_t displayAddress{ 0x70 };
    std::string soundsDirectory{ "sounds" };
  };

  /**
   * @brief Capability negotiation: try the real devices, fall back to the mock.
   *
   * A device that fails to answer is logged and reported to \p errors; the returned hub is
   * always usable.
   */
  std::shared_ptr<DeviceHub> openDeviceHub(const DeviceConfig& cfg,
                                           std::shared_ptr<core::Logger> log,
                                           std::shared_ptr<core::ErrorMonitor> errors);

} // namespace reveille::io
