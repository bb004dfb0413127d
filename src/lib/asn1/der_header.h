/*
* DER Tag-Length Headers
* (C) 2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_DER_HEADER_H_
#define ORDO_DER_HEADER_H_

#include <ordo/asn1_tag.h>
#include <ordo/der_length.h>

namespace Ordo {

/**
* The tag and length which prefix every DER value
*/
class ORDO_PUBLIC_API(1, 0) Header final {
   public:
      constexpr Header(Tag tag, Length length) : m_tag(tag), m_length(length) {}

      constexpr Tag tag() const { return m_tag; }

      constexpr Length length() const { return m_length; }

      /**
      * Decode a header. A length prefix which is wider than Ordo
      * supports is reported as a Length error for the decoded tag.
      */
      static Header decode(DER_Decoder& decoder);

      void encode_into(DER_Encoder& encoder) const;

      /**
      * Number of bytes used by the encoded header
      */
      Length encoded_len() const;

      constexpr bool operator==(const Header& other) const = default;

   private:
      Tag m_tag;
      Length m_length;
};

}  // namespace Ordo

#endif
