/*
* ASN.1 ANY Values
* (C) 1999-2007,2018,2020 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/asn1_any.h>

#include <ordo/asn1_obj.h>
#include <ordo/asn1_oid.h>
#include <ordo/asn1_str.h>
#include <ordo/asn1_time.h>
#include <ordo/hex.h>
#include <ordo/internal/fmt.h>
#include <algorithm>

namespace Ordo {

Any::Any(Tag tag, std::span<const uint8_t> value) : m_tag(tag), m_value(value) {
   if(value.size() > Length::MAX) {
      throw DER_Error::length(tag);
   }
}

Any Any::decode(DER_Decoder& decoder) {
   const Header header = Header::decode(decoder);

   if(header.length().value() > decoder.remaining_len()) {
      decoder.error(DER_Error::length(header.tag()));
   }

   return Any(header.tag(), decoder.bytes(header.length().value()));
}

Any Any::from_der(std::span<const uint8_t> der) {
   DER_Decoder decoder(der);
   auto any = decoder.decode<Any>();
   return decoder.finish(any);
}

Length Any::encoded_len() const {
   return length().for_tlv();
}

void Any::encode_into(DER_Encoder& to) const {
   Header(m_tag, length()).encode_into(to);
   to.bytes(m_value);
}

bool Any::boolean() const {
   return Boolean::from_any(*this).value();
}

bool Any::is_null() const {
   return m_tag == Null::TAG && m_value.empty();
}

OctetString Any::octet_string() const {
   return OctetString::from_any(*this);
}

BitString Any::bit_string() const {
   return BitString::from_any(*this);
}

OID Any::oid() const {
   return OID::from_any(*this);
}

Utf8String Any::utf8_string() const {
   return Utf8String::from_any(*this);
}

PrintableString Any::printable_string() const {
   return PrintableString::from_any(*this);
}

Ia5String Any::ia5_string() const {
   return Ia5String::from_any(*this);
}

UtcTime Any::utc_time() const {
   return UtcTime::from_any(*this);
}

GeneralizedTime Any::generalized_time() const {
   return GeneralizedTime::from_any(*this);
}

std::string Any::to_string() const {
   return fmt("{}: {}", m_tag.to_string(), hex_encode(m_value));
}

bool Any::operator==(const Any& other) const {
   return m_tag == other.m_tag && std::equal(m_value.begin(), m_value.end(), other.m_value.begin(), other.m_value.end());
}

}  // namespace Ordo
