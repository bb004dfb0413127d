/*
* Calendar Functions
* (C) 1999-2010,2017 Jack Lloyd
* (C) 2015 Simon Warta (Kullo GmbH)
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/internal/calendar.h>

#include <ordo/assert.h>
#include <ordo/exceptn.h>
#include <ordo/internal/fmt.h>
#include <ctime>

namespace Ordo {

namespace {

std::tm do_gmtime(std::time_t time_val) {
   std::tm tm;

#if defined(_WIN32)
   ::gmtime_s(&tm, &time_val);
#elif defined(ORDO_TARGET_OS_HAS_POSIX1)
   ::gmtime_r(&time_val, &tm);
#else
   std::tm* tm_p = std::gmtime(&time_val);
   if(tm_p == nullptr) {
      throw Invalid_Argument("gmtime could not convert the time");
   }
   tm = *tm_p;
#endif

   return tm;
}

/*
* Days from 1970-01-01 to the given date, using Howard Hinnant's
* days_from_civil restricted to years from 1970 on
*/
uint64_t days_since_epoch(uint32_t year, uint32_t month, uint32_t day) {
   ORDO_ARG_CHECK(year >= 1970, "Years before 1970 not supported");

   if(month <= 2) {
      year -= 1;
   }
   const uint32_t era = year / 400;
   const uint32_t yoe = year - era * 400;                                          // [0, 399]
   const uint32_t doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;  // [0, 365]
   const uint32_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;                     // [0, 146096]
   return era * 146097 + doe - 719468;
}

bool is_leap_year(uint32_t year) {
   return (year % 4 == 0) && (year % 100 != 0 || year % 400 == 0);
}

}  // namespace

uint64_t calendar_point::seconds_since_epoch() const {
   return (days_since_epoch(year(), month(), day()) * 86400) + (hour() * 60 * 60) + (minutes() * 60) + seconds();
}

std::chrono::system_clock::time_point calendar_point::to_std_timepoint() const {
   const uint64_t secs = seconds_since_epoch();
   const std::time_t t = static_cast<std::time_t>(secs);

   if(t < 0 || static_cast<uint64_t>(t) != secs) {
      throw Invalid_Argument(fmt("{} does not fit in a time_t", to_string()));
   }

   return std::chrono::system_clock::from_time_t(t);
}

std::string calendar_point::to_string() const {
   return fmt("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}", year(), month(), day(), hour(), minutes(), seconds());
}

calendar_point::calendar_point(const std::chrono::system_clock::time_point& time_point) {
   std::tm tm = do_gmtime(std::chrono::system_clock::to_time_t(time_point));

   m_year = tm.tm_year + 1900;
   m_month = tm.tm_mon + 1;
   m_day = tm.tm_mday;
   m_hour = tm.tm_hour;
   m_minutes = tm.tm_min;
   m_seconds = tm.tm_sec;
}

bool is_valid_calendar_time(
   uint32_t year, uint32_t month, uint32_t day, uint32_t hour, uint32_t minute, uint32_t second, bool allow_leap_second) {
   if(month == 0 || month > 12) {
      return false;
   }

   const uint32_t days_in_month[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

   const uint32_t max_day = (month == 2 && is_leap_year(year)) ? 29 : days_in_month[month - 1];

   if(day == 0 || day > max_day) {
      return false;
   }

   if(hour >= 24 || minute >= 60) {
      return false;
   }

   if(second > 60 || (second == 60 && !allow_leap_second)) {
      return false;
   }

   return true;
}

}  // namespace Ordo
