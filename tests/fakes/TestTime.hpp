#pragma once
/** @file  TestTime.hpp
 *  @brief Shorthand for building LocalTime values in tests.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>

#include "schedule/Calendar.hpp"

namespace reveille {
  namespace test {

    // 2026-10-19 is a Monday
    inline const std::string kMonday = "2026-10-19";
    inline const std::string kTuesday = "2026-10-20";
    inline const std::string kSunday = "2026-10-25";
    inline const std::string kNextMonday = "2026-10-26";

    inline schedule::LocalTime at(const std::string& date, const std::string& hhmm, int sec = 0) {
      return schedule::makeLocalTime(schedule::parseDate(date), schedule::TimeOfDay::parse(hhmm),
                                     std::chrono::seconds{ sec });
    }

  } // namespace test
} // namespace reveille
