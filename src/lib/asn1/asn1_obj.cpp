/*
* ASN.1 BOOLEAN and NULL
* (C) 1999-2007,2018,2020 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/asn1_obj.h>

namespace Ordo {

namespace {

constexpr uint8_t DER_FALSE = 0x00;
constexpr uint8_t DER_TRUE = 0xFF;

}  // namespace

Boolean Boolean::from_any(const Any& any) {
   any.assert_is_a(TAG);

   // Any content other than a single 0x00 or 0xFF octet
   const auto value = any.value();
   if(value.size() != 1) {
      throw DER_Error::noncanonical();
   }

   if(value[0] == DER_FALSE) {
      return Boolean(false);
   } else if(value[0] == DER_TRUE) {
      return Boolean(true);
   } else {
      throw DER_Error::noncanonical();
   }
}

Boolean Boolean::decode(DER_Decoder& decoder) {
   return from_any(decoder.any());
}

Length Boolean::encoded_len() const {
   return Length::one().for_tlv();
}

void Boolean::encode_into(DER_Encoder& to) const {
   Header(TAG, Length::one()).encode_into(to);
   to.byte(m_value ? DER_TRUE : DER_FALSE);
}

Null Null::from_any(const Any& any) {
   any.assert_is_a(TAG);

   if(!any.is_empty()) {
      throw DER_Error::length(TAG);
   }

   return Null();
}

Null Null::decode(DER_Decoder& decoder) {
   return from_any(decoder.any());
}

Length Null::encoded_len() const {
   return Length::zero().for_tlv();
}

void Null::encode_into(DER_Encoder& to) const {
   Header(TAG, Length::zero()).encode_into(to);
}

}  // namespace Ordo
