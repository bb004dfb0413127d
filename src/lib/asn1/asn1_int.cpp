/*
* ASN.1 INTEGER
* (C) 2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/asn1_int.h>

namespace Ordo::detail {

namespace {

constexpr Tag INTEGER_TAG(ASN1_Type::Integer);

/*
* X.690 8.3.2: the first nine bits of a multi-byte INTEGER may not all
* be the same
*/
bool is_minimal_integer(std::span<const uint8_t> content) {
   if(content.size() < 2) {
      return true;
   }

   const bool redundant_zero = (content[0] == 0x00 && (content[1] & 0x80) == 0);
   const bool redundant_ones = (content[0] == 0xFF && (content[1] & 0x80) != 0);
   return !redundant_zero && !redundant_ones;
}

void check_integer_content(std::span<const uint8_t> content) {
   if(content.empty()) {
      throw DER_Error::length(INTEGER_TAG);
   }

   if(!is_minimal_integer(content)) {
      throw DER_Error::noncanonical();
   }
}

}  // namespace

Integer_Content Integer_Content::from_signed(int64_t v) {
   Integer_Content c;
   const uint64_t u = static_cast<uint64_t>(v);
   for(size_t i = 0; i != 8; ++i) {
      c.m_bytes[8 - i] = static_cast<uint8_t>(u >> (8 * i));
   }

   size_t start = 1;
   while(start < 8) {
      const uint8_t b = c.m_bytes[start];
      const bool next_high = (c.m_bytes[start + 1] & 0x80) != 0;

      if((b == 0x00 && !next_high) || (b == 0xFF && next_high)) {
         ++start;
      } else {
         break;
      }
   }

   c.m_len = 9 - start;
   return c;
}

Integer_Content Integer_Content::from_unsigned(uint64_t v) {
   Integer_Content c;
   for(size_t i = 0; i != 8; ++i) {
      c.m_bytes[8 - i] = static_cast<uint8_t>(v >> (8 * i));
   }

   size_t start = 1;
   while(start < 8 && c.m_bytes[start] == 0) {
      ++start;
   }

   // A set high bit would read as negative, so keep a zero byte in front
   if((c.m_bytes[start] & 0x80) != 0) {
      --start;
   }

   c.m_len = 9 - start;
   return c;
}

int64_t decode_signed_integer(std::span<const uint8_t> content, size_t max_bytes) {
   check_integer_content(content);

   if(content.size() > max_bytes) {
      throw DER_Error::length(INTEGER_TAG);
   }

   uint64_t v = (content[0] & 0x80) ? ~static_cast<uint64_t>(0) : 0;
   for(const uint8_t b : content) {
      v = (v << 8) | b;
   }

   return static_cast<int64_t>(v);
}

uint64_t decode_unsigned_integer(std::span<const uint8_t> content, size_t max_bytes) {
   const auto magnitude = decode_unsigned_bytes(content, max_bytes);

   uint64_t v = 0;
   for(const uint8_t b : magnitude) {
      v = (v << 8) | b;
   }

   return v;
}

std::span<const uint8_t> decode_unsigned_bytes(std::span<const uint8_t> content, size_t max_bytes) {
   check_integer_content(content);

   if((content[0] & 0x80) != 0) {
      throw DER_Error::value(INTEGER_TAG);
   }

   // A leading zero is only present (after the minimality check) to
   // guard a set high bit
   if(content[0] == 0x00 && content.size() > 1) {
      content = content.subspan(1);
   }

   if(content.size() > max_bytes) {
      throw DER_Error::length(INTEGER_TAG);
   }

   return content;
}

std::span<const uint8_t> strip_leading_zeros(std::span<const uint8_t> bytes) {
   while(!bytes.empty() && bytes[0] == 0) {
      bytes = bytes.subspan(1);
   }
   return bytes;
}

}  // namespace Ordo::detail
