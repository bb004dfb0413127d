/*
* ASN.1 DER Tags
* (C) 1999-2007,2018,2020 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/asn1_tag.h>

#include <ordo/der_error.h>
#include <ordo/internal/fmt.h>

namespace Ordo {

std::string to_string(ASN1_Class type) {
   switch(type) {
      case ASN1_Class::Universal:
         return "UNIVERSAL";
      case ASN1_Class::Application:
         return "APPLICATION";
      case ASN1_Class::ContextSpecific:
         return "CONTEXT-SPECIFIC";
      case ASN1_Class::Private:
         return "PRIVATE";
   }

   return fmt("ASN1_Class({})", static_cast<size_t>(type));
}

std::string to_string(ASN1_Type type) {
   switch(type) {
      case ASN1_Type::Boolean:
         return "BOOLEAN";
      case ASN1_Type::Integer:
         return "INTEGER";
      case ASN1_Type::BitString:
         return "BIT STRING";
      case ASN1_Type::OctetString:
         return "OCTET STRING";
      case ASN1_Type::Null:
         return "NULL";
      case ASN1_Type::ObjectId:
         return "OBJECT IDENTIFIER";
      case ASN1_Type::Utf8String:
         return "UTF8String";
      case ASN1_Type::Sequence:
         return "SEQUENCE";
      case ASN1_Type::Set:
         return "SET";
      case ASN1_Type::PrintableString:
         return "PrintableString";
      case ASN1_Type::Ia5String:
         return "IA5String";
      case ASN1_Type::UtcTime:
         return "UTCTime";
      case ASN1_Type::GeneralizedTime:
         return "GeneralizedTime";
   }

   return fmt("ASN1_Type({})", static_cast<size_t>(type));
}

void throw_unknown_tag(uint8_t octet) {
   throw DER_Error::unknown_tag(octet);
}

Tag Tag::from_octet(uint8_t octet) {
   if(auto tag = try_from_octet(octet)) {
      return *tag;
   }
   throw_unknown_tag(octet);
}

void Tag::assert_eq(Tag expected) const {
   if(*this != expected) {
      throw DER_Error::unexpected_tag(expected, *this);
   }
}

std::string Tag::to_string() const {
   if(auto t = type()) {
      return Ordo::to_string(*t);
   }

   return fmt("{} {}", Ordo::to_string(class_tag()), static_cast<size_t>(m_octet & 0x1F));
}

}  // namespace Ordo
