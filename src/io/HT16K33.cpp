/* @file HT16K33.cpp
 * @brief command bytes for the HT16K33 backpack: oscillator, display setup, dimming, RAM
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <vector>

// Reveille headers
#include "io/HT16K33.hpp"

using namespace reveille::io;

namespace {

  constexpr std::uint8_t kOscillatorOn = 0x21;
  constexpr std::uint8_t kDisplayOnNoBlink = 0x81;
  constexpr std::uint8_t kDimmingBase = 0xE0;

  constexpr std::uint8_t kRamColon = 0x04; ///< display RAM row holding the colon segments
  constexpr std::uint8_t kColonBit = 0x02;
  constexpr std::size_t kRamBytes = 16;

} // namespace

bool HT16K33::init(int brightness) {
  if (!dev_.writeBytes({ kOscillatorOn }))
    return false;
  if (!clear())
    return false;
  if (!dev_.writeBytes({ kDisplayOnNoBlink }))
    return false;
  return setBrightness(brightness);
}

bool HT16K33::setColon(bool on) {
  return dev_.writeBytes({ kRamColon, on ? kColonBit : std::uint8_t{ 0 } });
}

bool HT16K33::setBrightness(int level) {
  const auto dim = static_cast<std::uint8_t>(std::clamp(level, 0, kMaxBrightness));
  return dev_.writeBytes({ static_cast<std::uint8_t>(kDimmingBase | dim) });
}

bool HT16K33::clear() {
  std::vector<std::uint8_t> frame(kRamBytes + 1, 0); // address 0x00 + 16 zero bytes
  return dev_.writeBytes(frame);
}
