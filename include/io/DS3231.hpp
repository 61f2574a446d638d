#pragma once
/** @file  DS3231.hpp
 *  @brief DS3231 real-time clock over I²C (time registers 0x00-0x06 only).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <utility>

#include "io/I2CDevice.hpp"
#include "schedule/Calendar.hpp"

namespace reveille::io {

  /// Raw timekeeping registers, seconds first.
  using DS3231Registers = std::array<std::uint8_t, 7>;

  /// BCD-encode \p t (24-hour mode, century bit set for 2100+).
  DS3231Registers encodeDS3231(schedule::LocalTime t);

  /// Decode the registers; nullopt if a field is out of range (e.g. a blank chip).
  std::optional<schedule::LocalTime> decodeDS3231(const DS3231Registers& regs);

  /**
 * @class DS3231
 * @brief Reads and sets the wall-clock time kept by the battery-backed RTC.
 */
  class DS3231 {
  public:
    explicit DS3231(I2CDevice dev) : dev_(std::move(dev)) {}

    /// nullopt on I/O error or invalid register contents.
    std::optional<schedule::LocalTime> read();
    bool write(schedule::LocalTime t);

    const I2CDevice& device() const { return dev_; }

  private:
    I2CDevice dev_;
  };

} // namespace reveille::io
