#pragma once
/** @file  HT16K33.hpp
 *  @brief HT16K33 LED backpack driven as the alarm indicator.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstdint>
#include <utility>

#include "io/I2CDevice.hpp"

namespace reveille {
  namespace io {

    /**
 * @class HT16K33
 * @brief Convenience API for the colon LED and dimming; hides the command bytes.
 *
 *  * `init()` starts the oscillator, blanks display RAM and turns the panel on.
 *  * The colon of the 4-digit backpack is the "alarm ringing" light.
 */
    class HT16K33 {
    public:
      explicit HT16K33(I2CDevice dev) : dev_(std::move(dev)) {}

      //---public API---------------------------------------------------------
      bool init(int brightness);
      bool setColon(bool on);
      bool setBrightness(int level); ///< 0-15, clamped
      bool clear();

      const I2CDevice& device() const { return dev_; }

      static constexpr int kMaxBrightness = 15;

    private:
      I2CDevice dev_;
    };

  } // namespace io
} // namespace reveille
