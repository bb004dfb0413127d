/*
* ASN.1 Time Types
* (C) 1999-2007,2018,2020 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_ASN1_TIME_TYPE_H_
#define ORDO_ASN1_TIME_TYPE_H_

#include <ordo/asn1_choice.h>
#include <chrono>
#include <compare>
#include <string>
#include <string_view>
#include <tuple>

namespace Ordo {

class calendar_point;

/**
* ASN.1 UTCTime in the form YYMMDDHHMMSSZ
*
* Two digit years 50 to 99 are 1950 to 1999, years 00 to 49 are 2000 to
* 2049. Only the Z time zone is accepted and seconds are mandatory.
*/
class ORDO_PUBLIC_API(1, 0) UtcTime final : public Encodable {
   public:
      static constexpr Tag TAG{ASN1_Type::UtcTime};

      static constexpr uint32_t MIN_YEAR = 1950;
      static constexpr uint32_t MAX_YEAR = 2049;

      /**
      * @throws DER_Error (Value) if the fields do not name a valid time
      * in the years 1950 to 2049
      */
      UtcTime(uint32_t year, uint32_t month, uint32_t day, uint32_t hour, uint32_t minute, uint32_t second);

      /**
      * @throws DER_Error (Value) if time is outside the range of UTCTime
      */
      explicit UtcTime(const std::chrono::system_clock::time_point& time);

      /**
      * Parse the string representation, such as "491231235959Z"
      */
      static UtcTime from_string(std::string_view str);

      static UtcTime from_any(const Any& any);

      static UtcTime decode(DER_Decoder& decoder);

      uint32_t year() const { return m_year; }

      uint32_t month() const { return m_month; }

      uint32_t day() const { return m_day; }

      uint32_t hour() const { return m_hour; }

      uint32_t minute() const { return m_minute; }

      uint32_t second() const { return m_second; }

      /**
      * Returns the DER content, such as "491231235959Z"
      */
      std::string to_string() const;

      /**
      * Returns a human friendly string
      */
      std::string readable_string() const;

      /**
      * @throws Invalid_Argument for times before 1970
      */
      std::chrono::system_clock::time_point to_std_timepoint() const;

      Length encoded_len() const override;

      void encode_into(DER_Encoder& to) const override;

      bool operator==(const UtcTime& other) const { return fields() == other.fields(); }

      std::strong_ordering operator<=>(const UtcTime& other) const { return fields() <=> other.fields(); }

   private:
      explicit UtcTime(const calendar_point& cal);

      std::tuple<uint32_t, uint32_t, uint32_t, uint32_t, uint32_t, uint32_t> fields() const {
         return {m_year, m_month, m_day, m_hour, m_minute, m_second};
      }

      uint32_t m_year;
      uint32_t m_month;
      uint32_t m_day;
      uint32_t m_hour;
      uint32_t m_minute;
      uint32_t m_second;
};

/**
* ASN.1 GeneralizedTime in the form YYYYMMDDHHMMSSZ
*
* Fractional seconds and time zones other than Z are rejected. A
* seconds value of 60 (a leap second) is rejected as well, since it
* cannot be represented as a system_clock time_point.
*/
class ORDO_PUBLIC_API(1, 0) GeneralizedTime final : public Encodable {
   public:
      static constexpr Tag TAG{ASN1_Type::GeneralizedTime};

      /**
      * @throws DER_Error (Value) if the fields do not name a valid time
      */
      GeneralizedTime(uint32_t year, uint32_t month, uint32_t day, uint32_t hour, uint32_t minute, uint32_t second);

      explicit GeneralizedTime(const std::chrono::system_clock::time_point& time);

      /**
      * Parse the string representation, such as "20491231235959Z"
      */
      static GeneralizedTime from_string(std::string_view str);

      static GeneralizedTime from_any(const Any& any);

      static GeneralizedTime decode(DER_Decoder& decoder);

      uint32_t year() const { return m_year; }

      uint32_t month() const { return m_month; }

      uint32_t day() const { return m_day; }

      uint32_t hour() const { return m_hour; }

      uint32_t minute() const { return m_minute; }

      uint32_t second() const { return m_second; }

      std::string to_string() const;

      std::string readable_string() const;

      /**
      * @throws Invalid_Argument for times before 1970
      */
      std::chrono::system_clock::time_point to_std_timepoint() const;

      Length encoded_len() const override;

      void encode_into(DER_Encoder& to) const override;

      bool operator==(const GeneralizedTime& other) const { return fields() == other.fields(); }

      std::strong_ordering operator<=>(const GeneralizedTime& other) const { return fields() <=> other.fields(); }

   private:
      explicit GeneralizedTime(const calendar_point& cal);

      std::tuple<uint32_t, uint32_t, uint32_t, uint32_t, uint32_t, uint32_t> fields() const {
         return {m_year, m_month, m_day, m_hour, m_minute, m_second};
      }

      uint32_t m_year;
      uint32_t m_month;
      uint32_t m_day;
      uint32_t m_hour;
      uint32_t m_minute;
      uint32_t m_second;
};

/**
* X.509 Time: either a UTCTime or a GeneralizedTime
*/
using Time = Choice<UtcTime, GeneralizedTime>;

/**
* Create a Time following RFC 5280: UTCTime through the year 2049,
* GeneralizedTime afterwards
*/
ORDO_PUBLIC_API(1, 0) Time make_time(const std::chrono::system_clock::time_point& time);

ORDO_PUBLIC_API(1, 0) std::chrono::system_clock::time_point to_std_timepoint(const Time& time);

}  // namespace Ordo

#endif
