/* @file DS3231.cpp
 * @brief BCD codec for the DS3231 timekeeping registers
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>

// Reveille headers
#include "io/DS3231.hpp"

using namespace reveille::io;
using namespace std::chrono;

namespace {

  constexpr std::uint8_t kRegSeconds = 0x00;
  constexpr std::uint8_t kCenturyBit = 0x80;
  constexpr std::uint8_t kHour12Bit = 0x40;
  constexpr std::uint8_t kPmBit = 0x20;

  std::uint8_t toBcd(unsigned v) { return static_cast<std::uint8_t>(((v / 10) << 4) | (v % 10)); }
  unsigned fromBcd(std::uint8_t b) { return ((b >> 4) & 0x0F) * 10 + (b & 0x0F); }

} // namespace

DS3231Registers reveille::io::encodeDS3231(reveille::schedule::LocalTime t) {
  const auto dp = floor<days>(t);
  const year_month_day ymd{ dp };
  const hh_mm_ss hms{ t - dp };
  const int y = static_cast<int>(ymd.year());

  DS3231Registers regs{};
  regs[0] = toBcd(static_cast<unsigned>(hms.seconds().count()));
  regs[1] = toBcd(static_cast<unsigned>(hms.minutes().count()));
  regs[2] = toBcd(static_cast<unsigned>(hms.hours().count())); // bit 6 clear: 24-hour mode
  regs[3] = static_cast<std::uint8_t>(weekday{ dp }.iso_encoding()); // 1 = Monday
  regs[4] = toBcd(static_cast<unsigned>(ymd.day()));
  regs[5] = toBcd(static_cast<unsigned>(ymd.month()));
  if (y >= 2100)
    regs[5] |= kCenturyBit;
  regs[6] = toBcd(static_cast<unsigned>(y % 100));
  return regs;
}

std::optional<reveille::schedule::LocalTime>
reveille::io::decodeDS3231(const DS3231Registers& regs) {
  const unsigned sec = fromBcd(regs[0] & 0x7F);
  const unsigned min = fromBcd(regs[1] & 0x7F);

  unsigned hour = 0;
  if (regs[2] & kHour12Bit) {
    hour = fromBcd(regs[2] & 0x1F) % 12;
    if (regs[2] & kPmBit)
      hour += 12;
  } else {
    hour = fromBcd(regs[2] & 0x3F);
  }

  const unsigned mday = fromBcd(regs[4] & 0x3F);
  const unsigned mon = fromBcd(regs[5] & 0x1F);
  const int yr = 2000 + static_cast<int>(fromBcd(regs[6])) + ((regs[5] & kCenturyBit) ? 100 : 0);

  if (sec > 59 || min > 59 || hour > 23)
    return std::nullopt;
  const year_month_day ymd{ year{ yr }, month{ mon }, day{ mday } };
  if (!ymd.ok())
    return std::nullopt;

  return local_days{ ymd } + hours{ hour } + minutes{ min } + seconds{ sec };
}

std::optional<reveille::schedule::LocalTime> DS3231::read() {
  DS3231Registers regs{};
  if (!dev_.readRegisters(kRegSeconds, regs.data(), regs.size()))
    return std::nullopt;
  return decodeDS3231(regs);
}

bool DS3231::write(reveille::schedule::LocalTime t) {
  const auto regs = encodeDS3231(t);
  std::vector<std::uint8_t> frame{ kRegSeconds };
  frame.insert(frame.end(), regs.begin(), regs.end());
  return dev_.writeBytes(frame);
}
