/*
* ASN.1 OBJECT IDENTIFIER
* (C) 1999-2007,2024 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/asn1_oid.h>

#include <ordo/asn1_any.h>
#include <sstream>

namespace Ordo {

OID OID::from_bytes(std::span<const uint8_t> ber) {
   if(ber.size() < 2 || ber.size() > MAX_LENGTH) {
      throw DER_Error::oid();
   }

   // Walking the arcs validates the root octet and every later arc
   OID_Arcs arcs(ber);
   while(arcs.next().has_value()) {}

   OID oid;
   std::copy(ber.begin(), ber.end(), oid.m_bytes.begin());
   oid.m_len = static_cast<uint8_t>(ber.size());
   return oid;
}

OID OID::from_any(const Any& any) {
   any.assert_is_a(TAG);
   return OID::from_bytes(any.value());
}

OID OID::decode(DER_Decoder& decoder) {
   return from_any(decoder.any());
}

std::optional<uint32_t> OID::arc(size_t index) const {
   size_t i = 0;
   for(const uint32_t a : arcs()) {
      if(i == index) {
         return a;
      }
      ++i;
   }
   return std::nullopt;
}

/*
* Return this OID as a string
*/
std::string OID::to_string() const {
   std::ostringstream out;

   bool first = true;
   for(const uint32_t a : arcs()) {
      if(!first) {
         out << ".";
      }
      // avoid locale issues with integer formatting
      out << std::to_string(a);
      first = false;
   }

   return out.str();
}

Length OID::encoded_len() const {
   return Length(m_len).for_tlv();
}

void OID::encode_into(DER_Encoder& to) const {
   ORDO_ASSERT(m_len >= 2 && m_len <= MAX_LENGTH, "OID content is within bounds");
   Header(TAG, Length(m_len)).encode_into(to);
   to.bytes(as_bytes());
}

size_t OID::hash_code() const {
   // FNV-1a
   uint64_t hash = 0xcbf29ce484222325;
   for(const uint8_t b : as_bytes()) {
      hash ^= b;
      hash *= 0x100000001b3;
   }
   return static_cast<size_t>(hash);
}

}  // namespace Ordo
