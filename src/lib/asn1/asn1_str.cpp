/*
* ASN.1 String Types
* (C) 1999-2007,2018,2020 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/asn1_str.h>

#include <ordo/internal/charset.h>
#include <algorithm>

namespace Ordo {

namespace {

std::span<const uint8_t> as_bytes(std::string_view s) {
   return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

std::string_view as_string_view(std::span<const uint8_t> b) {
   return std::string_view(reinterpret_cast<const char*>(b.data()), b.size());
}

void check_string_length(size_t len, Tag tag) {
   if(len > Length::MAX) {
      throw DER_Error::length(tag);
   }
}

void encode_string(DER_Encoder& to, Tag tag, std::span<const uint8_t> value) {
   Header(tag, Length::from_size(value.size())).encode_into(to);
   to.bytes(value);
}

}  // namespace

/*
* OCTET STRING
*/
OctetString::OctetString(std::span<const uint8_t> value) : m_value(value) {
   check_string_length(value.size(), TAG);
}

OctetString OctetString::from_any(const Any& any) {
   any.assert_is_a(TAG);
   return OctetString(any.value());
}

OctetString OctetString::decode(DER_Decoder& decoder) {
   return from_any(decoder.any());
}

Length OctetString::encoded_len() const {
   return Length::from_size(m_value.size()).for_tlv();
}

void OctetString::encode_into(DER_Encoder& to) const {
   encode_string(to, TAG, m_value);
}

bool OctetString::operator==(const OctetString& other) const {
   return std::equal(m_value.begin(), m_value.end(), other.m_value.begin(), other.m_value.end());
}

/*
* BIT STRING
*/
BitString::BitString(std::span<const uint8_t> value) : m_value(value) {
   // One octet is needed for the count of unused bits
   if(value.size() >= Length::MAX) {
      throw DER_Error::length(TAG);
   }
}

BitString BitString::from_any(const Any& any) {
   any.assert_is_a(TAG);

   const auto content = any.value();

   // Only octet aligned bit strings (no unused bits) are supported
   if(content.empty() || content[0] != 0) {
      throw DER_Error::length(TAG);
   }

   return BitString(content.subspan(1));
}

BitString BitString::decode(DER_Decoder& decoder) {
   return from_any(decoder.any());
}

Length BitString::encoded_len() const {
   return (Length::one() + Length::from_size(m_value.size())).for_tlv();
}

void BitString::encode_into(DER_Encoder& to) const {
   Header(TAG, Length::one() + Length::from_size(m_value.size())).encode_into(to);
   to.byte(0x00);
   to.bytes(m_value);
}

bool BitString::operator==(const BitString& other) const {
   return std::equal(m_value.begin(), m_value.end(), other.m_value.begin(), other.m_value.end());
}

/*
* UTF8String
*/
Utf8String::Utf8String(std::string_view value) : m_value(value) {
   check_string_length(value.size(), TAG);

   if(!is_valid_utf8(as_bytes(value))) {
      throw DER_Error::value(TAG);
   }
}

Utf8String Utf8String::from_any(const Any& any) {
   any.assert_is_a(TAG);
   return Utf8String(as_string_view(any.value()));
}

Utf8String Utf8String::decode(DER_Decoder& decoder) {
   return from_any(decoder.any());
}

Length Utf8String::encoded_len() const {
   return Length::from_size(m_value.size()).for_tlv();
}

void Utf8String::encode_into(DER_Encoder& to) const {
   encode_string(to, TAG, as_bytes(m_value));
}

/*
* PrintableString
*/
PrintableString::PrintableString(std::string_view value) : m_value(value) {
   check_string_length(value.size(), TAG);

   if(!is_printable_string(as_bytes(value))) {
      throw DER_Error::value(TAG);
   }
}

PrintableString PrintableString::from_any(const Any& any) {
   any.assert_is_a(TAG);
   return PrintableString(as_string_view(any.value()));
}

PrintableString PrintableString::decode(DER_Decoder& decoder) {
   return from_any(decoder.any());
}

Length PrintableString::encoded_len() const {
   return Length::from_size(m_value.size()).for_tlv();
}

void PrintableString::encode_into(DER_Encoder& to) const {
   encode_string(to, TAG, as_bytes(m_value));
}

/*
* IA5String
*/
Ia5String::Ia5String(std::string_view value) : m_value(value) {
   check_string_length(value.size(), TAG);

   if(!is_ia5_string(as_bytes(value))) {
      throw DER_Error::value(TAG);
   }
}

Ia5String Ia5String::from_any(const Any& any) {
   any.assert_is_a(TAG);
   return Ia5String(as_string_view(any.value()));
}

Ia5String Ia5String::decode(DER_Decoder& decoder) {
   return from_any(decoder.any());
}

Length Ia5String::encoded_len() const {
   return Length::from_size(m_value.size()).for_tlv();
}

void Ia5String::encode_into(DER_Encoder& to) const {
   encode_string(to, TAG, as_bytes(m_value));
}

}  // namespace Ordo
