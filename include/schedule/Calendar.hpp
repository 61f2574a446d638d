#pragma once
/** @file  Calendar.hpp
 *  @brief Wall-clock value types: time-of-day, calendar date, weekday and day sets.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace reveille {
  namespace schedule {

    /// Device-local wall-clock instant, second precision. No time-zone math is done.
    using LocalTime = std::chrono::local_seconds;
    using Date = std::chrono::year_month_day;

    /**
 * @class ValidationError
 * @brief Raised at the parse boundary for malformed time, date or weekday input.
 */
    class ValidationError : public std::invalid_argument {
    public:
      explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
    };

    /**
 * @struct TimeOfDay
 * @brief 24-hour clock reading at minute granularity.
 *
 *  * Text form is strict `HH:MM` (zero padded, 00:00 … 23:59).
 *  * Ordering matches the lexical order of the text form.
 */
    struct TimeOfDay {
      std::uint8_t hour{ 0 };
      std::uint8_t minute{ 0 };

      /// Parse `HH:MM` or throw ValidationError.
      static TimeOfDay parse(std::string_view hhmm);
      static std::optional<TimeOfDay> tryParse(std::string_view hhmm);

      /// Truncate an instant to its minute.
      static TimeOfDay of(LocalTime t);

      int minutesOfDay() const { return hour * 60 + minute; }
      std::string toString() const;

      auto operator<=>(const TimeOfDay&) const = default;
    };

    enum class Weekday : std::uint8_t {
      Monday,
      Tuesday,
      Wednesday,
      Thursday,
      Friday,
      Saturday,
      Sunday
    };

    inline constexpr int kDaysPerWeek = 7;

    /// Accepts `monday`/`mon` style names in any case.
    std::optional<Weekday> tryParseWeekday(std::string_view name);
    Weekday parseWeekday(std::string_view name); ///< throws ValidationError
    const char* toString(Weekday d);             ///< lowercase full name

    /**
 * @class DaySet
 * @brief Seven-bit weekday mask; bit 0 is Monday, bit 6 is Sunday.
 *
 *  An empty set is legal and means the alarm never fires.
 */
    class DaySet {
    public:
      static constexpr std::uint8_t kNone = 0b0000'0000;
      static constexpr std::uint8_t kAll = 0b0111'1111;

      DaySet() = default;
      explicit DaySet(std::uint8_t mask) : mask_(mask & kAll) {}
      DaySet(std::initializer_list<Weekday> days);

      /// Parse a list of day names; throws ValidationError on the first unknown name.
      static DaySet parse(const std::vector<std::string>& names);

      bool contains(Weekday d) const;
      void set(Weekday d, bool value = true);
      bool empty() const { return mask_ == kNone; }
      std::uint8_t mask() const { return mask_; }

      std::vector<Weekday> days() const;        ///< Monday → Sunday order
      std::vector<std::string> names() const;   ///< normalised lowercase names

      bool operator==(const DaySet&) const = default;

    private:
      std::uint8_t mask_{ kNone };
    };

    // ─── date helpers ─────────────────────────────────────────────────────────
    Date parseDate(std::string_view yyyymmdd); ///< throws ValidationError
    std::optional<Date> tryParseDate(std::string_view yyyymmdd);
    std::string toString(const Date& d); ///< `YYYY-MM-DD`

    Date dateOf(LocalTime t);
    Weekday weekdayOf(const Date& d);
    Date addDays(const Date& d, int days);
    LocalTime makeLocalTime(const Date& d, TimeOfDay tod,
                            std::chrono::seconds sec = std::chrono::seconds{ 0 });

    /// `YYYY-MM-DD HH:MM:SS`, used for logs and status output.
    std::string formatLocalTime(LocalTime t);

  } // namespace schedule
} // namespace reveille
