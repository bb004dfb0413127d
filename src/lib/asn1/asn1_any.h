/*
* ASN.1 ANY Values
* (C) 1999-2007,2018,2020 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_ASN1_ANY_H_
#define ORDO_ASN1_ANY_H_

#include <ordo/der_dec.h>
#include <ordo/der_enc.h>
#include <optional>
#include <span>
#include <string>

namespace Ordo {

class GeneralizedTime;
class Ia5String;
class PrintableString;
class UtcTime;

/**
* An arbitrary DER value: a tag plus a view of its content octets.
*
* The content is not copied; the buffer it was decoded from must remain
* valid for as long as the Any is in use.
*/
class ORDO_PUBLIC_API(1, 0) Any final : public Encodable {
   public:
      /**
      * @throws DER_Error (Length) if value is longer than Length::MAX
      */
      Any(Tag tag, std::span<const uint8_t> value);

      Tag tag() const { return m_tag; }

      Length length() const { return Length(static_cast<uint16_t>(m_value.size())); }

      bool is_empty() const { return m_value.empty(); }

      std::span<const uint8_t> value() const { return m_value; }

      /**
      * Throws DER_Error (UnexpectedTag) if this value is not tagged
      * with expected
      */
      void assert_is_a(Tag expected) const { m_tag.assert_eq(expected); }

      /**
      * An Any accepts every tag
      */
      static constexpr bool can_decode(Tag /*tag*/) { return true; }

      static Any decode(DER_Decoder& decoder);

      /**
      * Decode a complete DER message consisting of a single value
      */
      static Any from_der(std::span<const uint8_t> der);

      Length encoded_len() const override;

      void encode_into(DER_Encoder& to) const override;

      bool boolean() const;

      template <std::integral T>
      T integer() const {
         return Integer<T>::from_any(*this).value();
      }

      bool is_null() const;

      OctetString octet_string() const;

      BitString bit_string() const;

      OID oid() const;

      Utf8String utf8_string() const;

      PrintableString printable_string() const;

      Ia5String ia5_string() const;

      UtcTime utc_time() const;

      GeneralizedTime generalized_time() const;

      /**
      * Decode the body of a SEQUENCE with f, which must consume all of it
      */
      template <typename F>
         requires std::invocable<F, DER_Decoder&>
      auto sequence(F&& f) const -> std::invoke_result_t<F, DER_Decoder&> {
         assert_is_a(Tag(ASN1_Type::Sequence));
         return decode_body(std::forward<F>(f));
      }

      /**
      * Decode the body of a value tagged with context-specific number,
      * which f must consume entirely
      */
      template <typename F>
         requires std::invocable<F, DER_Decoder&>
      auto context_specific(TagNumber number, F&& f) const -> std::invoke_result_t<F, DER_Decoder&> {
         assert_is_a(Tag::context_specific(number));
         return decode_body(std::forward<F>(f));
      }

      /**
      * As context_specific, but returns nullopt if this value carries
      * some other tag
      */
      template <typename F>
         requires std::invocable<F, DER_Decoder&>
      auto context_specific_optional(TagNumber number, F&& f) const
         -> std::optional<std::invoke_result_t<F, DER_Decoder&>> {
         if(m_tag != Tag::context_specific(number)) {
            return std::nullopt;
         }
         return context_specific(number, std::forward<F>(f));
      }

      /**
      * Return a string with the tag name and the content in hex
      */
      std::string to_string() const;

      bool operator==(const Any& other) const;

   private:
      template <typename F>
      auto decode_body(F&& f) const -> std::invoke_result_t<F, DER_Decoder&> {
         DER_Decoder decoder(m_value);
         auto result = std::invoke(std::forward<F>(f), decoder);
         return decoder.finish(std::move(result));
      }

      Tag m_tag;
      std::span<const uint8_t> m_value;
};

template <typename T>
T DER_Decoder::decode_from_any() {
   return T::from_any(any());
}

}  // namespace Ordo

#endif
