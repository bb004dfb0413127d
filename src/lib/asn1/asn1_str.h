/*
* ASN.1 String Types
* (C) 1999-2007,2018,2020 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_ASN1_STRINGS_H_
#define ORDO_ASN1_STRINGS_H_

#include <ordo/asn1_any.h>
#include <span>
#include <string>
#include <string_view>

namespace Ordo {

/*
* All string types here are views: they do not copy the bytes they are
* constructed or decoded from, which must outlive them.
*/

/**
* ASN.1 OCTET STRING
*/
class ORDO_PUBLIC_API(1, 0) OctetString final : public Encodable {
   public:
      static constexpr Tag TAG{ASN1_Type::OctetString};

      /**
      * @throws DER_Error (Length) if value is longer than Length::MAX
      */
      explicit OctetString(std::span<const uint8_t> value);

      std::span<const uint8_t> value() const { return m_value; }

      size_t size() const { return m_value.size(); }

      bool empty() const { return m_value.empty(); }

      static OctetString from_any(const Any& any);

      static OctetString decode(DER_Decoder& decoder);

      Length encoded_len() const override;

      void encode_into(DER_Encoder& to) const override;

      bool operator==(const OctetString& other) const;

   private:
      std::span<const uint8_t> m_value;
};

/**
* ASN.1 BIT STRING. Only bit strings consisting of whole octets (with
* zero unused bits) are supported; value() excludes the unused bits
* count octet.
*/
class ORDO_PUBLIC_API(1, 0) BitString final : public Encodable {
   public:
      static constexpr Tag TAG{ASN1_Type::BitString};

      /**
      * @throws DER_Error (Length) if value is too long to encode
      */
      explicit BitString(std::span<const uint8_t> value);

      std::span<const uint8_t> value() const { return m_value; }

      size_t size() const { return m_value.size(); }

      static BitString from_any(const Any& any);

      static BitString decode(DER_Decoder& decoder);

      Length encoded_len() const override;

      void encode_into(DER_Encoder& to) const override;

      bool operator==(const BitString& other) const;

   private:
      std::span<const uint8_t> m_value;
};

/**
* ASN.1 UTF8String
*/
class ORDO_PUBLIC_API(1, 0) Utf8String final : public Encodable {
   public:
      static constexpr Tag TAG{ASN1_Type::Utf8String};

      /**
      * @throws DER_Error (Value) if value is not valid UTF-8
      */
      explicit Utf8String(std::string_view value);

      std::string_view value() const { return m_value; }

      std::string to_string() const { return std::string(m_value); }

      static Utf8String from_any(const Any& any);

      static Utf8String decode(DER_Decoder& decoder);

      Length encoded_len() const override;

      void encode_into(DER_Encoder& to) const override;

      bool operator==(const Utf8String& other) const { return m_value == other.m_value; }

   private:
      std::string_view m_value;
};

/**
* ASN.1 PrintableString: letters, digits, space and '()+,-./:=?
*/
class ORDO_PUBLIC_API(1, 0) PrintableString final : public Encodable {
   public:
      static constexpr Tag TAG{ASN1_Type::PrintableString};

      /**
      * @throws DER_Error (Value) if value contains a character outside
      * the PrintableString alphabet
      */
      explicit PrintableString(std::string_view value);

      std::string_view value() const { return m_value; }

      std::string to_string() const { return std::string(m_value); }

      static PrintableString from_any(const Any& any);

      static PrintableString decode(DER_Decoder& decoder);

      Length encoded_len() const override;

      void encode_into(DER_Encoder& to) const override;

      bool operator==(const PrintableString& other) const { return m_value == other.m_value; }

   private:
      std::string_view m_value;
};

/**
* ASN.1 IA5String (7-bit ASCII)
*/
class ORDO_PUBLIC_API(1, 0) Ia5String final : public Encodable {
   public:
      static constexpr Tag TAG{ASN1_Type::Ia5String};

      /**
      * @throws DER_Error (Value) if value contains a non-ASCII character
      */
      explicit Ia5String(std::string_view value);

      std::string_view value() const { return m_value; }

      std::string to_string() const { return std::string(m_value); }

      static Ia5String from_any(const Any& any);

      static Ia5String decode(DER_Decoder& decoder);

      Length encoded_len() const override;

      void encode_into(DER_Encoder& to) const override;

      bool operator==(const Ia5String& other) const { return m_value == other.m_value; }

   private:
      std::string_view m_value;
};

}  // namespace Ordo

#endif
