#pragma once
/** @file  MockDeviceHub.hpp
 *  @brief DeviceHub for hosts without the RTC / LED backpack: system clock, logged indicator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>
#include <mutex>

#include "io/DeviceHub.hpp"

namespace reveille::io {

  class AudioProcess;

  /**
 * @class MockDeviceHub
 * @brief System-clock time shifted by whatever `setTime()` asked for.
 *
 *  Audio is real when a player is installed; the indicator and brightness are
 *  only logged and remembered.
 */
  class MockDeviceHub : public DeviceHub {
  public:
    MockDeviceHub(std::unique_ptr<AudioProcess> audio, std::shared_ptr<core::Logger> log);
    ~MockDeviceHub() override;

    void play(const std::string& sound, bool loop) override;
    void stop() override;
    void setIndicator(bool on) override;

    schedule::LocalTime now() override;
    void setTime(schedule::LocalTime t) override;

    void setVolume(int percent) override;
    void setBrightness(int level) override;

    std::string describe() const override { return "mock (system clock)"; }

    bool indicator() const;
    int brightness() const;

  private:
    std::unique_ptr<AudioProcess> audio_;
    std::shared_ptr<core::Logger> log_;

    mutable std::mutex mtx_;
    std::chrono::seconds offset_{ 0 };
    bool indicator_{ false };
    int brightness_{ 10 };
  };

} // namespace reveille::io
