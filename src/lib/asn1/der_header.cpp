/*
* DER Tag-Length Headers
* (C) 2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/der_header.h>

#include <ordo/der_dec.h>
#include <ordo/der_enc.h>
#include <ordo/der_error.h>

namespace Ordo {

Header Header::decode(DER_Decoder& decoder) {
   const uint8_t octet = decoder.byte();
   const auto tag = Tag::try_from_octet(octet);
   if(!tag.has_value()) {
      decoder.error(DER_Error::unknown_tag(octet));
   }

   try {
      return Header(*tag, Length::decode(decoder));
   } catch(const DER_Error& e) {
      if(e.kind() == DER_ErrorKind::Overlength) {
         throw DER_Error::length(*tag).at(e.position().value_or(decoder.position()));
      }
      throw;
   }
}

void Header::encode_into(DER_Encoder& encoder) const {
   encoder.byte(m_tag.octet());
   m_length.encode_into(encoder);
}

Length Header::encoded_len() const {
   return Length::one() + m_length.encoded_len();
}

}  // namespace Ordo
