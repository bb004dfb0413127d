/*
* ASN.1 DER Tags
* (C) 1999-2007,2018,2020 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_ASN1_TAG_H_
#define ORDO_ASN1_TAG_H_

#include <ordo/types.h>
#include <compare>
#include <optional>
#include <string>

namespace Ordo {

/**
* ASN.1 Class Tags
*/
enum class ASN1_Class : uint8_t {
   Universal = 0b0000'0000,
   Application = 0b0100'0000,
   ContextSpecific = 0b1000'0000,
   Private = 0b1100'0000,
};

/**
* ASN.1 universal type tags understood by Ordo
*/
enum class ASN1_Type : uint8_t {
   Boolean = 0x01,
   Integer = 0x02,
   BitString = 0x03,
   OctetString = 0x04,
   Null = 0x05,
   ObjectId = 0x06,
   Utf8String = 0x0C,
   Sequence = 0x10,
   Set = 0x11,
   PrintableString = 0x13,
   Ia5String = 0x16,
   UtcTime = 0x17,
   GeneralizedTime = 0x18,
};

std::string ORDO_PUBLIC_API(1, 0) to_string(ASN1_Class type);
std::string ORDO_PUBLIC_API(1, 0) to_string(ASN1_Type type);

/**
* Throws a DER_Error of kind UnknownTag for the given identifier octet
*/
[[noreturn]] void ORDO_UNSTABLE_API throw_unknown_tag(uint8_t octet);

/**
* The number of a non-universal tag. Only the low-tag-number form is
* supported, so values are restricted to 0..30.
*/
class ORDO_PUBLIC_API(1, 0) TagNumber final {
   public:
      static constexpr uint8_t MAX = 30;

      /**
      * @throws DER_Error (UnknownTag) if number exceeds MAX
      */
      constexpr explicit TagNumber(uint8_t number) : m_number(number) {
         if(number > MAX) {
            throw_unknown_tag(number);
         }
      }

      constexpr uint8_t value() const { return m_number; }

      constexpr bool operator==(const TagNumber& other) const = default;
      constexpr auto operator<=>(const TagNumber& other) const = default;

   private:
      uint8_t m_number;
};

/**
* An ASN.1 identifier octet.
*
* Universal tags are stored as they appear on the wire. Tags of the
* application, context-specific and private classes are always
* constructed; primitive (IMPLICIT) forms of these classes are rejected
* when decoding.
*/
class ORDO_PUBLIC_API(1, 0) Tag final {
   public:
      static constexpr uint8_t CONSTRUCTED_FLAG = 0b0010'0000;

      constexpr Tag(ASN1_Type type) : m_octet(universal_octet(type)) {}

      static constexpr Tag application(TagNumber number) {
         return Tag(static_cast<uint8_t>(ASN1_Class::Application) | CONSTRUCTED_FLAG | number.value());
      }

      static constexpr Tag context_specific(TagNumber number) {
         return Tag(static_cast<uint8_t>(ASN1_Class::ContextSpecific) | CONSTRUCTED_FLAG | number.value());
      }

      static constexpr Tag private_use(TagNumber number) {
         return Tag(static_cast<uint8_t>(ASN1_Class::Private) | CONSTRUCTED_FLAG | number.value());
      }

      /**
      * Map an identifier octet to a Tag, returning nullopt for octets
      * which do not name a supported tag
      */
      static constexpr std::optional<Tag> try_from_octet(uint8_t octet) {
         switch(octet) {
            case 0x01:
            case 0x02:
            case 0x03:
            case 0x04:
            case 0x05:
            case 0x06:
            case 0x0C:
            case 0x13:
            case 0x16:
            case 0x17:
            case 0x18:
            case 0x30:
            case 0x31:
               return Tag(octet);
            default:
               break;
         }

         const uint8_t number = octet & 0x1F;
         if((octet & CONSTRUCTED_FLAG) == 0 || number > TagNumber::MAX || (octet & 0xC0) == 0) {
            return std::nullopt;
         }

         return Tag(octet);
      }

      /**
      * @throws DER_Error (UnknownTag) if the octet is not a supported tag
      */
      static Tag from_octet(uint8_t octet);

      constexpr uint8_t octet() const { return m_octet; }

      constexpr ASN1_Class class_tag() const { return static_cast<ASN1_Class>(m_octet & 0xC0); }

      constexpr bool is_constructed() const { return (m_octet & CONSTRUCTED_FLAG) != 0; }

      constexpr bool is_universal() const { return class_tag() == ASN1_Class::Universal; }

      constexpr bool is_application() const { return class_tag() == ASN1_Class::Application; }

      constexpr bool is_context_specific() const { return class_tag() == ASN1_Class::ContextSpecific; }

      constexpr bool is_private() const { return class_tag() == ASN1_Class::Private; }

      /**
      * The tag number of a non-universal tag
      */
      constexpr std::optional<TagNumber> number() const {
         if(is_universal()) {
            return std::nullopt;
         }
         return TagNumber(m_octet & 0x1F);
      }

      /**
      * The universal type, if this is a universal tag
      */
      constexpr std::optional<ASN1_Type> type() const {
         if(!is_universal()) {
            return std::nullopt;
         }
         return static_cast<ASN1_Type>(m_octet & 0x1F);
      }

      /**
      * @throws DER_Error (UnexpectedTag) if this tag is not expected
      */
      void assert_eq(Tag expected) const;

      std::string to_string() const;

      constexpr bool operator==(const Tag& other) const = default;
      constexpr auto operator<=>(const Tag& other) const = default;

   private:
      constexpr explicit Tag(uint8_t octet) : m_octet(octet) {}

      static constexpr uint8_t universal_octet(ASN1_Type type) {
         const uint8_t t = static_cast<uint8_t>(type);
         if(type == ASN1_Type::Sequence || type == ASN1_Type::Set) {
            return t | CONSTRUCTED_FLAG;
         }
         return t;
      }

      uint8_t m_octet;
};

}  // namespace Ordo

#endif
