/*
* ASN.1 SEQUENCE, SEQUENCE OF and SET OF
* (C) 2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/asn1_seq.h>

#include <algorithm>

namespace Ordo {

Sequence::Sequence(std::span<const uint8_t> body) : m_body(body) {
   if(body.size() > Length::MAX) {
      throw DER_Error::length(TAG);
   }
}

Sequence Sequence::from_any(const Any& any) {
   any.assert_is_a(TAG);
   return Sequence(any.value());
}

Sequence Sequence::decode(DER_Decoder& decoder) {
   return from_any(decoder.any());
}

Length Sequence::encoded_len() const {
   return Length::from_size(m_body.size()).for_tlv();
}

void Sequence::encode_into(DER_Encoder& to) const {
   Header(TAG, Length::from_size(m_body.size())).encode_into(to);
   to.bytes(m_body);
}

bool Sequence::operator==(const Sequence& other) const {
   return std::equal(m_body.begin(), m_body.end(), other.m_body.begin(), other.m_body.end());
}

Length Message::encoded_len() const {
   Length body_len;
   fields([&](std::span<const Encodable* const> encodables) {
      for(const Encodable* field : encodables) {
         body_len += field->encoded_len();
      }
   });
   return body_len.for_tlv();
}

void Message::encode_into(DER_Encoder& to) const {
   fields([&](std::span<const Encodable* const> encodables) { to.sequence(encodables); });
}

}  // namespace Ordo
