/*
* ASN.1 Time Types
* (C) 1999-2007 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/asn1_time.h>

#include <ordo/exceptn.h>
#include <ordo/internal/calendar.h>
#include <ordo/internal/fmt.h>
#include <ordo/internal/parsing.h>

namespace Ordo {

namespace {

constexpr uint16_t UTC_TIME_LEN = 13;
constexpr uint16_t GENERALIZED_TIME_LEN = 15;

struct Time_Fields {
      uint32_t year = 0;
      uint32_t month = 0;
      uint32_t day = 0;
      uint32_t hour = 0;
      uint32_t minute = 0;
      uint32_t second = 0;
};

std::string_view as_string_view(std::span<const uint8_t> b) {
   return std::string_view(reinterpret_cast<const char*>(b.data()), b.size());
}

/*
* Parse YYMMDDHHMMSSZ or YYYYMMDDHHMMSSZ; any deviation, including a time
* zone other than Z or fractional seconds, is a Value error
*/
Time_Fields parse_time(std::string_view str, size_t year_len, Tag tag) {
   const size_t expected_len = year_len + 5 * 2 + 1;

   if(str.size() != expected_len || str.back() != 'Z') {
      throw DER_Error::value(tag);
   }

   size_t offset = 0;
   auto field = [&](size_t len) -> uint32_t {
      const auto digits = str.substr(offset, len);
      offset += len;
      try {
         return to_u32bit(digits);
      } catch(const Invalid_Argument&) {
         throw DER_Error::value(tag);
      }
   };

   Time_Fields f;
   f.year = field(year_len);
   f.month = field(2);
   f.day = field(2);
   f.hour = field(2);
   f.minute = field(2);
   f.second = field(2);
   return f;
}

void check_time(uint32_t year, uint32_t month, uint32_t day, uint32_t hour, uint32_t minute, uint32_t second, Tag tag) {
   if(!is_valid_calendar_time(year, month, day, hour, minute, second, false)) {
      throw DER_Error::value(tag);
   }
}

std::string format_time(uint32_t year,
                        size_t year_digits,
                        uint32_t month,
                        uint32_t day,
                        uint32_t hour,
                        uint32_t minute,
                        uint32_t second) {
   const std::string yy = (year_digits == 2) ? fmt("{:02}", year) : fmt("{:04}", year);
   return fmt("{}{:02}{:02}{:02}{:02}{:02}Z", yy, month, day, hour, minute, second);
}

std::string readable_time(const calendar_point& cal) {
   return fmt("{:04}/{:02}/{:02} {:02}:{:02}:{:02} UTC",
              cal.year(),
              cal.month(),
              cal.day(),
              cal.hour(),
              cal.minutes(),
              cal.seconds());
}

void encode_time(DER_Encoder& to, Tag tag, std::string_view repr) {
   Header(tag, Length::from_size(repr.size())).encode_into(to);
   to.bytes(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(repr.data()), repr.size()));
}

}  // namespace

/*
* UTCTime
*/
UtcTime::UtcTime(uint32_t year, uint32_t month, uint32_t day, uint32_t hour, uint32_t minute, uint32_t second) :
      m_year(year), m_month(month), m_day(day), m_hour(hour), m_minute(minute), m_second(second) {
   if(year < MIN_YEAR || year > MAX_YEAR) {
      throw DER_Error::value(TAG);
   }
   check_time(year, month, day, hour, minute, second, TAG);
}

UtcTime::UtcTime(const calendar_point& cal) :
      UtcTime(cal.year(), cal.month(), cal.day(), cal.hour(), cal.minutes(), cal.seconds()) {}

UtcTime::UtcTime(const std::chrono::system_clock::time_point& time) : UtcTime(calendar_point(time)) {}

UtcTime UtcTime::from_string(std::string_view str) {
   const auto f = parse_time(str, 2, TAG);
   const uint32_t year = (f.year >= 50) ? (1900 + f.year) : (2000 + f.year);
   return UtcTime(year, f.month, f.day, f.hour, f.minute, f.second);
}

UtcTime UtcTime::from_any(const Any& any) {
   any.assert_is_a(TAG);
   return UtcTime::from_string(as_string_view(any.value()));
}

UtcTime UtcTime::decode(DER_Decoder& decoder) {
   return from_any(decoder.any());
}

std::string UtcTime::to_string() const {
   return format_time(m_year % 100, 2, m_month, m_day, m_hour, m_minute, m_second);
}

std::string UtcTime::readable_string() const {
   return readable_time(calendar_point(m_year, m_month, m_day, m_hour, m_minute, m_second));
}

std::chrono::system_clock::time_point UtcTime::to_std_timepoint() const {
   return calendar_point(m_year, m_month, m_day, m_hour, m_minute, m_second).to_std_timepoint();
}

Length UtcTime::encoded_len() const {
   return Length(UTC_TIME_LEN).for_tlv();
}

void UtcTime::encode_into(DER_Encoder& to) const {
   encode_time(to, TAG, to_string());
}

/*
* GeneralizedTime
*/
GeneralizedTime::GeneralizedTime(
   uint32_t year, uint32_t month, uint32_t day, uint32_t hour, uint32_t minute, uint32_t second) :
      m_year(year), m_month(month), m_day(day), m_hour(hour), m_minute(minute), m_second(second) {
   if(year > 9999) {
      throw DER_Error::value(TAG);
   }
   check_time(year, month, day, hour, minute, second, TAG);
}

GeneralizedTime::GeneralizedTime(const calendar_point& cal) :
      GeneralizedTime(cal.year(), cal.month(), cal.day(), cal.hour(), cal.minutes(), cal.seconds()) {}

GeneralizedTime::GeneralizedTime(const std::chrono::system_clock::time_point& time) :
      GeneralizedTime(calendar_point(time)) {}

GeneralizedTime GeneralizedTime::from_string(std::string_view str) {
   const auto f = parse_time(str, 4, TAG);
   return GeneralizedTime(f.year, f.month, f.day, f.hour, f.minute, f.second);
}

GeneralizedTime GeneralizedTime::from_any(const Any& any) {
   any.assert_is_a(TAG);
   return GeneralizedTime::from_string(as_string_view(any.value()));
}

GeneralizedTime GeneralizedTime::decode(DER_Decoder& decoder) {
   return from_any(decoder.any());
}

std::string GeneralizedTime::to_string() const {
   return format_time(m_year, 4, m_month, m_day, m_hour, m_minute, m_second);
}

std::string GeneralizedTime::readable_string() const {
   return readable_time(calendar_point(m_year, m_month, m_day, m_hour, m_minute, m_second));
}

std::chrono::system_clock::time_point GeneralizedTime::to_std_timepoint() const {
   return calendar_point(m_year, m_month, m_day, m_hour, m_minute, m_second).to_std_timepoint();
}

Length GeneralizedTime::encoded_len() const {
   return Length(GENERALIZED_TIME_LEN).for_tlv();
}

void GeneralizedTime::encode_into(DER_Encoder& to) const {
   encode_time(to, TAG, to_string());
}

/*
* Time
*/
Time make_time(const std::chrono::system_clock::time_point& time) {
   const calendar_point cal(time);

   if(cal.year() >= UtcTime::MIN_YEAR && cal.year() <= UtcTime::MAX_YEAR) {
      return Time(UtcTime(time));
   }
   return Time(GeneralizedTime(time));
}

std::chrono::system_clock::time_point to_std_timepoint(const Time& time) {
   return time.visit([](const auto& t) { return t.to_std_timepoint(); });
}

}  // namespace Ordo
