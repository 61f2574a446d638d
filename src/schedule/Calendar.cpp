/* @file Calendar.cpp
 * @brief parsing and arithmetic for the wall-clock value types
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>

// Reveille headers
#include "schedule/Calendar.hpp"

using namespace reveille::schedule;

namespace {

  constexpr std::array<const char*, reveille::schedule::kDaysPerWeek> kFullNames{
    "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"
  };
  constexpr std::array<const char*, reveille::schedule::kDaysPerWeek> kShortNames{
    "mon", "tue", "wed", "thu", "fri", "sat", "sun"
  };

  bool allDigits(std::string_view s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
  }

  // caller checked allDigits()
  int toInt(std::string_view s) {
    int v = 0;
    for (char c : s)
      v = v * 10 + (c - '0');
    return v;
  }

  std::string lowered(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
  }

} // namespace

// ---------------------------------------------------------------------------
// TimeOfDay
// ---------------------------------------------------------------------------
std::optional<TimeOfDay> TimeOfDay::tryParse(std::string_view hhmm) {
  if (hhmm.size() != 5 || hhmm[2] != ':')
    return std::nullopt;

  auto hh = hhmm.substr(0, 2);
  auto mm = hhmm.substr(3, 2);
  if (!allDigits(hh) || !allDigits(mm))
    return std::nullopt;

  int h = toInt(hh);
  int m = toInt(mm);
  if (h > 23 || m > 59)
    return std::nullopt;

  return TimeOfDay{ static_cast<std::uint8_t>(h), static_cast<std::uint8_t>(m) };
}

TimeOfDay TimeOfDay::parse(std::string_view hhmm) {
  if (auto tod = tryParse(hhmm))
    return *tod;
  throw ValidationError("invalid time '" + std::string(hhmm) + "', expected HH:MM");
}

TimeOfDay TimeOfDay::of(LocalTime t) {
  const auto midnight = std::chrono::floor<std::chrono::days>(t);
  const auto mins = std::chrono::duration_cast<std::chrono::minutes>(t - midnight).count();
  return TimeOfDay{ static_cast<std::uint8_t>(mins / 60), static_cast<std::uint8_t>(mins % 60) };
}

std::string TimeOfDay::toString() const {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02u:%02u", static_cast<unsigned>(hour),
                static_cast<unsigned>(minute));
  return buf;
}

// ---------------------------------------------------------------------------
// Weekday
// ---------------------------------------------------------------------------
std::optional<Weekday> reveille::schedule::tryParseWeekday(std::string_view name) {
  const auto key = lowered(name);
  for (int i = 0; i < kDaysPerWeek; ++i) {
    if (key == kFullNames[i] || key == kShortNames[i])
      return static_cast<Weekday>(i);
  }
  return std::nullopt;
}

Weekday reveille::schedule::parseWeekday(std::string_view name) {
  if (auto d = tryParseWeekday(name))
    return *d;
  throw ValidationError("unknown weekday '" + std::string(name) + "'");
}

const char* reveille::schedule::toString(Weekday d) {
  return kFullNames[static_cast<std::size_t>(d)];
}

// ---------------------------------------------------------------------------
// DaySet
// ---------------------------------------------------------------------------
DaySet::DaySet(std::initializer_list<Weekday> days) {
  for (auto d : days)
    set(d);
}

DaySet DaySet::parse(const std::vector<std::string>& names) {
  DaySet out;
  for (const auto& n : names)
    out.set(parseWeekday(n));
  return out;
}

bool DaySet::contains(Weekday d) const { return (mask_ & (1u << static_cast<unsigned>(d))) != 0; }

void DaySet::set(Weekday d, bool value) {
  const auto bit = static_cast<std::uint8_t>(1u << static_cast<unsigned>(d));
  if (value)
    mask_ |= bit;
  else
    mask_ &= static_cast<std::uint8_t>(~bit);
}

std::vector<Weekday> DaySet::days() const {
  std::vector<Weekday> out;
  for (int i = 0; i < kDaysPerWeek; ++i) {
    if (contains(static_cast<Weekday>(i)))
      out.push_back(static_cast<Weekday>(i));
  }
  return out;
}

std::vector<std::string> DaySet::names() const {
  std::vector<std::string> out;
  for (auto d : days())
    out.emplace_back(toString(d));
  return out;
}

// ---------------------------------------------------------------------------
// Date helpers
// ---------------------------------------------------------------------------
std::optional<Date> reveille::schedule::tryParseDate(std::string_view s) {
  if (s.size() != 10 || s[4] != '-' || s[7] != '-')
    return std::nullopt;

  auto yy = s.substr(0, 4);
  auto mm = s.substr(5, 2);
  auto dd = s.substr(8, 2);
  if (!allDigits(yy) || !allDigits(mm) || !allDigits(dd))
    return std::nullopt;

  Date ymd{ std::chrono::year{ toInt(yy) }, std::chrono::month{ static_cast<unsigned>(toInt(mm)) },
            std::chrono::day{ static_cast<unsigned>(toInt(dd)) } };
  if (!ymd.ok())
    return std::nullopt;
  return ymd;
}

Date reveille::schedule::parseDate(std::string_view s) {
  if (auto d = tryParseDate(s))
    return *d;
  throw ValidationError("invalid date '" + std::string(s) + "', expected YYYY-MM-DD");
}

std::string reveille::schedule::toString(const Date& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(d.year()),
                static_cast<unsigned>(d.month()), static_cast<unsigned>(d.day()));
  return buf;
}

Date reveille::schedule::dateOf(LocalTime t) {
  return Date{ std::chrono::floor<std::chrono::days>(t) };
}

Weekday reveille::schedule::weekdayOf(const Date& d) {
  // iso_encoding(): Monday == 1 … Sunday == 7
  const std::chrono::weekday wd{ std::chrono::local_days{ d } };
  return static_cast<Weekday>(wd.iso_encoding() - 1);
}

Date reveille::schedule::addDays(const Date& d, int days) {
  return Date{ std::chrono::local_days{ d } + std::chrono::days{ days } };
}

LocalTime reveille::schedule::makeLocalTime(const Date& d, TimeOfDay tod, std::chrono::seconds sec) {
  return LocalTime{ std::chrono::local_days{ d } } + std::chrono::hours{ tod.hour } +
         std::chrono::minutes{ tod.minute } + sec;
}

std::string reveille::schedule::formatLocalTime(LocalTime t) {
  const auto day = dateOf(t);
  const auto midnight = std::chrono::floor<std::chrono::days>(t);
  const std::chrono::hh_mm_ss hms{ t - midnight };

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s %02ld:%02ld:%02lld", toString(day).c_str(),
                static_cast<long>(hms.hours().count()), static_cast<long>(hms.minutes().count()),
                static_cast<long long>(hms.seconds().count()));
  return buf;
}
