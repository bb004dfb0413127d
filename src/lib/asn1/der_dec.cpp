/*
* DER Decoder
* (C) 1999-2010,2018 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/der_dec.h>

#include <ordo/asn1_any.h>
#include <ordo/asn1_obj.h>
#include <ordo/asn1_oid.h>
#include <ordo/asn1_str.h>

namespace Ordo {

uint8_t DER_Decoder::byte() {
   return bytes(1)[0];
}

std::span<const uint8_t> DER_Decoder::bytes(size_t len) {
   if(m_failed) {
      error(DER_Error::failed());
   }

   if(len > remaining_len()) {
      error(DER_Error::truncated());
   }

   const auto result = m_input.subspan(m_position, len);
   m_position += len;
   return result;
}

std::optional<Tag> DER_Decoder::peek_tag() const {
   if(is_finished()) {
      return std::nullopt;
   }

   const uint8_t octet = m_input[m_position];
   const auto tag = Tag::try_from_octet(octet);
   if(!tag.has_value()) {
      // Reported by the decode that consumes it
      return std::nullopt;
   }
   return tag;
}

void DER_Decoder::error(const DER_Error& err) {
   m_failed = true;

   if(err.position().has_value()) {
      throw err;
   }
   throw err.at(m_position);
}

std::span<const uint8_t> DER_Decoder::value_of(Tag expected) {
   if(m_failed) {
      error(DER_Error::failed());
   }

   const size_t start = m_position;
   const Header header = Header::decode(*this);

   if(header.tag() != expected) {
      m_failed = true;
      throw DER_Error::unexpected_tag(expected, header.tag()).at(start);
   }

   if(header.length().value() > remaining_len()) {
      error(DER_Error::length(header.tag()));
   }

   return bytes(header.length().value());
}

Any DER_Decoder::any() {
   return decode<Any>();
}

Null DER_Decoder::null() {
   return decode<Null>();
}

bool DER_Decoder::boolean() {
   return decode<Boolean>().value();
}

OctetString DER_Decoder::octet_string() {
   return decode<OctetString>();
}

BitString DER_Decoder::bit_string() {
   return decode<BitString>();
}

Utf8String DER_Decoder::utf8_string() {
   return decode<Utf8String>();
}

OID DER_Decoder::oid() {
   return decode<OID>();
}

}  // namespace Ordo
