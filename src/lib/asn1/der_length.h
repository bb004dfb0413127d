/*
* DER Length Prefixes
* (C) 2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_DER_LENGTH_H_
#define ORDO_DER_LENGTH_H_

#include <ordo/types.h>
#include <compare>
#include <string>

namespace Ordo {

class DER_Decoder;
class DER_Encoder;

/**
* The length of a DER value. Ordo supports definite lengths of at
* most 65535 bytes, which use a length prefix of one to three bytes.
*/
class ORDO_PUBLIC_API(1, 0) Length final {
   public:
      static constexpr size_t MAX = ORDO_DER_MAX_LENGTH;

      constexpr Length() : m_value(0) {}

      constexpr explicit Length(uint16_t value) : m_value(value) {}

      /**
      * @throws DER_Error (Overflow) if n is larger than MAX
      */
      static Length from_size(size_t n);

      static constexpr Length zero() { return Length(0); }

      static constexpr Length one() { return Length(1); }

      static constexpr Length max() { return Length(static_cast<uint16_t>(MAX)); }

      constexpr size_t value() const { return m_value; }

      /**
      * Checked addition, throws DER_Error (Overflow) if the result
      * exceeds MAX
      */
      Length operator+(Length other) const;

      /**
      * Checked subtraction, throws DER_Error (Overflow) on underflow
      */
      Length operator-(Length other) const;

      Length& operator+=(Length other) { return (*this = *this + other); }

      /**
      * The number of bytes needed to encode this length prefix
      */
      constexpr Length encoded_len() const {
         if(m_value < 0x80) {
            return Length(1);
         } else if(m_value <= 0xFF) {
            return Length(2);
         } else {
            return Length(3);
         }
      }

      /**
      * Total length of a tag-length-value whose value is of this length
      */
      Length for_tlv() const;

      /**
      * Decode a DER length prefix
      */
      static Length decode(DER_Decoder& decoder);

      void encode_into(DER_Encoder& encoder) const;

      std::string to_string() const;

      constexpr bool operator==(const Length& other) const = default;
      constexpr auto operator<=>(const Length& other) const = default;

   private:
      uint16_t m_value;
};

}  // namespace Ordo

#endif
