/*
* DER Codec Errors
* (C) 2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/der_error.h>

#include <ordo/internal/fmt.h>

namespace Ordo {

std::string to_string(DER_ErrorKind kind) {
   switch(kind) {
      case DER_ErrorKind::Failed:
         return "Failed";
      case DER_ErrorKind::Length:
         return "Length";
      case DER_ErrorKind::Noncanonical:
         return "Noncanonical";
      case DER_ErrorKind::Oid:
         return "Oid";
      case DER_ErrorKind::Overflow:
         return "Overflow";
      case DER_ErrorKind::Overlength:
         return "Overlength";
      case DER_ErrorKind::TrailingData:
         return "TrailingData";
      case DER_ErrorKind::Truncated:
         return "Truncated";
      case DER_ErrorKind::Underlength:
         return "Underlength";
      case DER_ErrorKind::UnexpectedTag:
         return "UnexpectedTag";
      case DER_ErrorKind::UnknownTag:
         return "UnknownTag";
      case DER_ErrorKind::Value:
         return "Value";
   }

   ORDO_ASSERT_UNREACHABLE();
}

DER_Error::DER_Error(DER_ErrorKind kind,
                     std::optional<Tag> tag,
                     std::optional<Tag> expected_tag,
                     std::optional<uint8_t> octet,
                     std::pair<size_t, size_t> counts,
                     std::optional<size_t> position) :
      Decoding_Error(format_message(kind, tag, expected_tag, octet, counts, position)),
      m_kind(kind),
      m_tag(tag),
      m_expected_tag(expected_tag),
      m_octet(octet),
      m_counts(counts),
      m_position(position) {}

std::string DER_Error::format_message(DER_ErrorKind kind,
                                      std::optional<Tag> tag,
                                      std::optional<Tag> expected_tag,
                                      std::optional<uint8_t> octet,
                                      std::pair<size_t, size_t> counts,
                                      std::optional<size_t> position) {
   std::string msg;

   switch(kind) {
      case DER_ErrorKind::Failed:
         msg = "operation failed";
         break;
      case DER_ErrorKind::Length:
         msg = fmt("incorrect length for {}", tag->to_string());
         break;
      case DER_ErrorKind::Noncanonical:
         msg = "DER is not canonically encoded";
         break;
      case DER_ErrorKind::Oid:
         msg = "malformed OID";
         break;
      case DER_ErrorKind::Overflow:
         msg = "integer overflow";
         break;
      case DER_ErrorKind::Overlength:
         msg = "DER message is too long";
         break;
      case DER_ErrorKind::TrailingData:
         msg = fmt("trailing data at end of DER message: decoded {} bytes, {} bytes remaining",
                   counts.first,
                   counts.second);
         break;
      case DER_ErrorKind::Truncated:
         msg = "DER message is truncated";
         break;
      case DER_ErrorKind::Underlength:
         msg = fmt("DER message too short: expected {}, got {}", counts.first, counts.second);
         break;
      case DER_ErrorKind::UnexpectedTag:
         msg = "unexpected ASN.1 DER tag: ";
         if(expected_tag.has_value()) {
            msg += fmt("expected {}, ", expected_tag->to_string());
         }
         msg += fmt("got {}", tag->to_string());
         break;
      case DER_ErrorKind::UnknownTag:
         msg = fmt("unknown/unsupported ASN.1 DER tag: 0x{:02x}", octet.value_or(0));
         break;
      case DER_ErrorKind::Value:
         msg = fmt("malformed ASN.1 DER value for {}", tag->to_string());
         break;
   }

   if(position.has_value()) {
      msg += fmt(" at DER byte {}", *position);
   }

   return msg;
}

DER_Error DER_Error::failed() {
   return DER_Error(DER_ErrorKind::Failed, std::nullopt, std::nullopt, std::nullopt, {0, 0}, std::nullopt);
}

DER_Error DER_Error::length(Tag tag) {
   return DER_Error(DER_ErrorKind::Length, tag, std::nullopt, std::nullopt, {0, 0}, std::nullopt);
}

DER_Error DER_Error::noncanonical() {
   return DER_Error(DER_ErrorKind::Noncanonical, std::nullopt, std::nullopt, std::nullopt, {0, 0}, std::nullopt);
}

DER_Error DER_Error::oid() {
   return DER_Error(DER_ErrorKind::Oid, std::nullopt, std::nullopt, std::nullopt, {0, 0}, std::nullopt);
}

DER_Error DER_Error::overflow() {
   return DER_Error(DER_ErrorKind::Overflow, std::nullopt, std::nullopt, std::nullopt, {0, 0}, std::nullopt);
}

DER_Error DER_Error::overlength() {
   return DER_Error(DER_ErrorKind::Overlength, std::nullopt, std::nullopt, std::nullopt, {0, 0}, std::nullopt);
}

DER_Error DER_Error::trailing_data(size_t decoded, size_t remaining) {
   return DER_Error(
      DER_ErrorKind::TrailingData, std::nullopt, std::nullopt, std::nullopt, {decoded, remaining}, std::nullopt);
}

DER_Error DER_Error::truncated() {
   return DER_Error(DER_ErrorKind::Truncated, std::nullopt, std::nullopt, std::nullopt, {0, 0}, std::nullopt);
}

DER_Error DER_Error::underlength(size_t expected, size_t actual) {
   return DER_Error(
      DER_ErrorKind::Underlength, std::nullopt, std::nullopt, std::nullopt, {expected, actual}, std::nullopt);
}

DER_Error DER_Error::unexpected_tag(std::optional<Tag> expected, Tag actual) {
   return DER_Error(DER_ErrorKind::UnexpectedTag, actual, expected, std::nullopt, {0, 0}, std::nullopt);
}

DER_Error DER_Error::unknown_tag(uint8_t octet) {
   return DER_Error(DER_ErrorKind::UnknownTag, std::nullopt, std::nullopt, octet, {0, 0}, std::nullopt);
}

DER_Error DER_Error::value(Tag tag) {
   return DER_Error(DER_ErrorKind::Value, tag, std::nullopt, std::nullopt, {0, 0}, std::nullopt);
}

DER_Error DER_Error::at(size_t position) const {
   return DER_Error(m_kind, m_tag, m_expected_tag, m_octet, m_counts, position);
}

DER_Error DER_Error::nested(size_t offset) const {
   return at(offset + m_position.value_or(0));
}

}  // namespace Ordo
