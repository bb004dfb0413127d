/*
* ASN.1 BOOLEAN and NULL
* (C) 1999-2007,2018,2020 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_ASN1_OBJECT_TYPES_H_
#define ORDO_ASN1_OBJECT_TYPES_H_

#include <ordo/asn1_any.h>

namespace Ordo {

/**
* ASN.1 BOOLEAN; DER requires the content octet to be 0x00 or 0xFF
*/
class ORDO_PUBLIC_API(1, 0) Boolean final : public Encodable {
   public:
      static constexpr Tag TAG{ASN1_Type::Boolean};

      constexpr explicit Boolean(bool value = false) : m_value(value) {}

      constexpr bool value() const { return m_value; }

      static Boolean from_any(const Any& any);

      static Boolean decode(DER_Decoder& decoder);

      Length encoded_len() const override;

      void encode_into(DER_Encoder& to) const override;

      bool operator==(const Boolean& other) const { return m_value == other.m_value; }

   private:
      bool m_value;
};

/**
* ASN.1 NULL
*/
class ORDO_PUBLIC_API(1, 0) Null final : public Encodable {
   public:
      static constexpr Tag TAG{ASN1_Type::Null};

      constexpr Null() = default;

      static Null from_any(const Any& any);

      static Null decode(DER_Decoder& decoder);

      Length encoded_len() const override;

      void encode_into(DER_Encoder& to) const override;

      bool operator==(const Null& /*other*/) const { return true; }
};

}  // namespace Ordo

#endif
