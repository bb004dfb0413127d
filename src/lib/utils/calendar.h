/*
* Calendar Functions
* (C) 1999-2009,2015 Jack Lloyd
* (C) 2015 Simon Warta (Kullo GmbH)
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_CALENDAR_H_
#define ORDO_CALENDAR_H_

#include <ordo/types.h>
#include <chrono>
#include <string>

namespace Ordo {

/**
* A broken down UTC date and time, as carried by UTCTime and
* GeneralizedTime
*/
class ORDO_TEST_API calendar_point {
   public:
      uint32_t year() const { return m_year; }

      /** 1 through 12 */
      uint32_t month() const { return m_month; }

      /** 1 through 31 */
      uint32_t day() const { return m_day; }

      /** 0 through 23 */
      uint32_t hour() const { return m_hour; }

      uint32_t minutes() const { return m_minutes; }

      /** 0 through 59, or 60 during a leap second */
      uint32_t seconds() const { return m_seconds; }

      /**
      * The fields are stored as given; use is_valid_calendar_time to
      * check them
      */
      calendar_point(uint32_t y, uint32_t mon, uint32_t d, uint32_t h, uint32_t min, uint32_t sec) :
            m_year(y), m_month(mon), m_day(d), m_hour(h), m_minutes(min), m_seconds(sec) {}

      /**
      * Break down a time_point of the system clock, in UTC
      */
      explicit calendar_point(const std::chrono::system_clock::time_point& time_point);

      /**
      * Seconds since 1970-01-01T00:00:00Z
      * @throws Invalid_Argument if the year is before 1970
      */
      uint64_t seconds_since_epoch() const;

      /**
      * @throws Invalid_Argument if the year is before 1970 or the
      *         time does not fit in a time_t
      */
      std::chrono::system_clock::time_point to_std_timepoint() const;

      /**
      * Format as YYYY-MM-DDTHH:MM:SS
      */
      std::string to_string() const;

   private:
      uint32_t m_year;
      uint32_t m_month;
      uint32_t m_day;
      uint32_t m_hour;
      uint32_t m_minutes;
      uint32_t m_seconds;
};

/**
* Check that the given fields name an existing calendar day and time of day
* (leap seconds, i.e. a seconds value of 60, are accepted only if
* @p allow_leap_second is set)
*/
ORDO_TEST_API bool is_valid_calendar_time(
   uint32_t year, uint32_t month, uint32_t day, uint32_t hour, uint32_t minute, uint32_t second, bool allow_leap_second);

}  // namespace Ordo

#endif
