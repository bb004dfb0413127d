/*
* ASN.1 INTEGER
* (C) 2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_ASN1_INTEGER_H_
#define ORDO_ASN1_INTEGER_H_

#include <ordo/asn1_any.h>
#include <algorithm>
#include <array>
#include <concepts>
#include <span>
#include <type_traits>

namespace Ordo {

namespace detail {

/**
* Content octets of a minimally encoded INTEGER of at most 64 bits
*/
class ORDO_UNSTABLE_API Integer_Content final {
   public:
      static Integer_Content from_signed(int64_t v);

      static Integer_Content from_unsigned(uint64_t v);

      std::span<const uint8_t> bytes() const { return std::span<const uint8_t>(m_bytes).last(m_len); }

   private:
      Integer_Content() = default;

      std::array<uint8_t, 9> m_bytes{};
      size_t m_len = 0;
};

/**
* Decode the content octets of a signed INTEGER which must fit in
* max_bytes bytes
*/
int64_t ORDO_UNSTABLE_API decode_signed_integer(std::span<const uint8_t> content, size_t max_bytes);

/**
* Decode the content octets of a non-negative INTEGER which must fit in
* max_bytes bytes
*/
uint64_t ORDO_UNSTABLE_API decode_unsigned_integer(std::span<const uint8_t> content, size_t max_bytes);

/**
* Validate the content octets of a non-negative INTEGER of up to
* max_bytes bytes and return its magnitude with leading zeros removed
*/
std::span<const uint8_t> ORDO_UNSTABLE_API decode_unsigned_bytes(std::span<const uint8_t> content, size_t max_bytes);

std::span<const uint8_t> ORDO_UNSTABLE_API strip_leading_zeros(std::span<const uint8_t> bytes);

}  // namespace detail

/**
* An ASN.1 INTEGER held in a native integer type
*/
template <std::integral T>
class Integer final : public Encodable {
   public:
      static_assert(!std::is_same_v<T, bool>, "Use Ordo::Boolean for BOOLEAN values");
      static_assert(sizeof(T) <= 8, "Integer supports at most 64 bit values");

      static constexpr Tag TAG{ASN1_Type::Integer};

      constexpr explicit Integer(T value = 0) : m_value(value) {}

      constexpr T value() const { return m_value; }

      static Integer from_any(const Any& any) {
         any.assert_is_a(TAG);

         if constexpr(std::is_signed_v<T>) {
            return Integer(static_cast<T>(detail::decode_signed_integer(any.value(), sizeof(T))));
         } else {
            return Integer(static_cast<T>(detail::decode_unsigned_integer(any.value(), sizeof(T))));
         }
      }

      static Integer decode(DER_Decoder& decoder) { return from_any(decoder.any()); }

      Length encoded_len() const override { return Length::from_size(content().bytes().size()).for_tlv(); }

      void encode_into(DER_Encoder& to) const override {
         const auto c = content();
         Header(TAG, Length::from_size(c.bytes().size())).encode_into(to);
         to.bytes(c.bytes());
      }

      bool operator==(const Integer& other) const { return m_value == other.m_value; }

   private:
      detail::Integer_Content content() const {
         if constexpr(std::is_signed_v<T>) {
            return detail::Integer_Content::from_signed(m_value);
         } else {
            return detail::Integer_Content::from_unsigned(m_value);
         }
      }

      T m_value;
};

/**
* A non-negative INTEGER of at most N bytes, such as an RSA modulus or
* an ECDSA signature component, held as a big-endian view without
* leading zeros. The viewed bytes are not copied.
*/
template <size_t N>
class UintBytes final : public Encodable {
   public:
      static constexpr Tag TAG{ASN1_Type::Integer};

      /**
      * @throws DER_Error (Length) if bytes, less leading zeros, is
      * longer than N
      */
      explicit UintBytes(std::span<const uint8_t> bytes) : m_bytes(detail::strip_leading_zeros(bytes)) {
         if(m_bytes.size() > N) {
            throw DER_Error::length(TAG);
         }
      }

      std::span<const uint8_t> bytes() const { return m_bytes; }

      bool is_zero() const { return m_bytes.empty(); }

      static UintBytes from_any(const Any& any) {
         any.assert_is_a(TAG);
         return UintBytes(detail::decode_unsigned_bytes(any.value(), N));
      }

      static UintBytes decode(DER_Decoder& decoder) { return from_any(decoder.any()); }

      Length encoded_len() const override { return content_len().for_tlv(); }

      void encode_into(DER_Encoder& to) const override {
         Header(TAG, content_len()).encode_into(to);
         if(needs_leading_zero()) {
            to.byte(0x00);
         }
         to.bytes(m_bytes);
      }

      bool operator==(const UintBytes& other) const {
         return std::equal(m_bytes.begin(), m_bytes.end(), other.m_bytes.begin(), other.m_bytes.end());
      }

   private:
      bool needs_leading_zero() const { return m_bytes.empty() || (m_bytes[0] & 0x80) != 0; }

      Length content_len() const { return Length::from_size(m_bytes.size() + (needs_leading_zero() ? 1 : 0)); }

      std::span<const uint8_t> m_bytes;
};

}  // namespace Ordo

#endif
