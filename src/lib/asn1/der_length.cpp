/*
* DER Length Prefixes
* (C) 2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/der_length.h>

#include <ordo/der_dec.h>
#include <ordo/der_enc.h>
#include <ordo/der_error.h>
#include <ordo/internal/int_utils.h>

namespace Ordo {

Length Length::from_size(size_t n) {
   if(n > MAX) {
      throw DER_Error::overflow();
   }
   return Length(static_cast<uint16_t>(n));
}

Length Length::operator+(Length other) const {
   const auto sum = checked_add(value(), other.value());
   if(!sum.has_value()) {
      throw DER_Error::overflow();
   }
   return Length::from_size(*sum);
}

Length Length::operator-(Length other) const {
   const auto diff = checked_sub(value(), other.value());
   if(!diff.has_value()) {
      throw DER_Error::overflow();
   }
   return Length(static_cast<uint16_t>(*diff));
}

Length Length::for_tlv() const {
   return Length::one() + encoded_len() + *this;
}

Length Length::decode(DER_Decoder& decoder) {
   const uint8_t first = decoder.byte();

   // 0x80 would introduce an indefinite length, which DER forbids
   if(first < 0x80) {
      return Length(first);
   }

   if(first == 0x81) {
      const uint8_t len = decoder.byte();

      // X.690 10.1: the length must use the minimum number of octets
      if(len < 0x80) {
         decoder.error(DER_Error::noncanonical());
      }
      return Length(len);
   }

   if(first == 0x82) {
      const uint16_t hi = decoder.byte();
      const uint16_t lo = decoder.byte();
      const uint16_t len = static_cast<uint16_t>((hi << 8) | lo);

      if(len <= 0xFF) {
         decoder.error(DER_Error::noncanonical());
      }
      return Length(len);
   }

   decoder.error(DER_Error::overlength());
}

void Length::encode_into(DER_Encoder& encoder) const {
   if(m_value < 0x80) {
      encoder.byte(static_cast<uint8_t>(m_value));
   } else if(m_value <= 0xFF) {
      encoder.byte(0x81).byte(static_cast<uint8_t>(m_value));
   } else {
      encoder.byte(0x82).byte(static_cast<uint8_t>(m_value >> 8)).byte(static_cast<uint8_t>(m_value & 0xFF));
   }
}

std::string Length::to_string() const {
   return std::to_string(m_value);
}

}  // namespace Ordo
