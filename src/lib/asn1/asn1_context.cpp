/*
* ASN.1 Context-Specific Fields
* (C) 2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/asn1_context.h>

namespace Ordo {

ContextSpecific ContextSpecific::from_any(const Any& any) {
   const Tag tag = any.tag();

   if(!tag.is_context_specific()) {
      throw DER_Error::unexpected_tag(std::nullopt, tag);
   }

   // Context-specific tags are always decoded as constructed with a number
   return ContextSpecific(tag.number().value(), Any::from_der(any.value()));
}

ContextSpecific ContextSpecific::decode(DER_Decoder& decoder) {
   return from_any(decoder.any());
}

Length ContextSpecific::encoded_len() const {
   return m_value.encoded_len().for_tlv();
}

void ContextSpecific::encode_into(DER_Encoder& to) const {
   Header(tag(), m_value.encoded_len()).encode_into(to);
   to.encode(m_value);
}

bool ContextSpecific::operator==(const ContextSpecific& other) const {
   return m_tag_number == other.m_tag_number && m_value == other.m_value;
}

}  // namespace Ordo
