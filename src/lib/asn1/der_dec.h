/*
* DER Decoder
* (C) 1999-2010,2018 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_DER_DECODER_H_
#define ORDO_DER_DECODER_H_

#include <ordo/der_error.h>
#include <ordo/der_header.h>
#include <concepts>
#include <functional>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>

namespace Ordo {

class Any;
class BitString;
class Null;
class OctetString;
class OID;
class Utf8String;

template <std::integral T>
class Integer;

class DER_Decoder;

/**
* A type which can be decoded from DER, either directly from a decoder
* or from an already decoded Any
*/
template <typename T>
concept DER_Decodable = requires(DER_Decoder& dec) {
   { T::decode(dec) } -> std::convertible_to<T>;
} || requires(const Any& any) {
   { T::from_any(any) } -> std::convertible_to<T>;
};

/**
* Return true if a value of type T may begin with the given tag. Types
* which accept more than one tag (such as a CHOICE) provide a static
* can_decode function, other types compare against their TAG.
*/
template <typename T>
constexpr bool der_accepts_tag(Tag tag) {
   if constexpr(requires { T::can_decode(tag); }) {
      return T::can_decode(tag);
   } else {
      return tag == T::TAG;
   }
}

/**
* DER Decoding Object
*
* Decodes values from a caller provided buffer, which must remain valid
* and unmodified for as long as the decoder and any value decoded from
* it are in use. Once any operation has failed the decoder is marked as
* failed and every further operation throws a DER_Error of kind Failed.
*/
class ORDO_PUBLIC_API(1, 0) DER_Decoder final {
   public:
      explicit DER_Decoder(std::span<const uint8_t> input) : m_input(input) {}

      DER_Decoder(const uint8_t buf[], size_t len) : DER_Decoder(std::span<const uint8_t>(buf, len)) {}

      /**
      * Decode a value of type T
      */
      template <DER_Decodable T>
      T decode() {
         if(m_failed) {
            error(DER_Error::failed());
         }

         const size_t start = m_position;

         try {
            if constexpr(requires { T::decode(*this); }) {
               return T::decode(*this);
            } else {
               return decode_from_any<T>();
            }
         } catch(const DER_Error& e) {
            m_failed = true;
            if(e.position().has_value()) {
               throw;
            }
            throw e.at(start);
         }
      }

      /**
      * Decode a value of type T into out
      * Returns (*this)
      */
      template <DER_Decodable T>
      DER_Decoder& decode(T& out) {
         out = decode<T>();
         return (*this);
      }

      /**
      * Decode an OPTIONAL value. Returns nullopt without consuming
      * anything if no input remains or the next tag is not one T accepts.
      */
      template <DER_Decodable T>
      std::optional<T> decode_optional() {
         if(m_failed) {
            error(DER_Error::failed());
         }

         const auto tag = peek_tag();

         if(!tag.has_value() || !der_accepts_tag<T>(*tag)) {
            return std::nullopt;
         }

         return decode<T>();
      }

      /**
      * Decode a SEQUENCE, calling f with a decoder over its body. The
      * body must be fully consumed by f.
      */
      template <typename F>
         requires std::invocable<F, DER_Decoder&>
      auto sequence(F&& f) -> std::invoke_result_t<F, DER_Decoder&> {
         const auto body = value_of(Tag(ASN1_Type::Sequence));
         const size_t offset = m_position - body.size();

         try {
            DER_Decoder nested(body);
            auto result = std::invoke(std::forward<F>(f), nested);
            return nested.finish(std::move(result));
         } catch(const DER_Error& e) {
            m_failed = true;
            throw e.nested(offset);
         }
      }

      Any any();

      Null null();

      bool boolean();

      template <std::integral T>
      T integer() {
         return decode<Integer<T>>().value();
      }

      OctetString octet_string();

      BitString bit_string();

      Utf8String utf8_string();

      OID oid();

      /**
      * Return value if all input has been consumed, otherwise throws
      * DER_Error (TrailingData)
      */
      template <typename T>
      T finish(T value) {
         if(m_failed) {
            error(DER_Error::failed());
         }

         if(!is_finished()) {
            const DER_Error err = DER_Error::trailing_data(m_position, remaining_len());
            m_failed = true;
            throw err.at(m_position);
         }

         return value;
      }

      /**
      * Consume a single byte
      */
      uint8_t byte();

      /**
      * Consume len bytes, returning a view of them
      */
      std::span<const uint8_t> bytes(size_t len);

      /**
      * Return the tag of the next value without consuming anything, or
      * nullopt if no input remains or the next octet is not a known tag
      */
      std::optional<Tag> peek_tag() const;

      /**
      * Return true if there is no more input
      */
      bool is_finished() const { return remaining_len() == 0; }

      size_t remaining_len() const { return m_failed ? 0 : m_input.size() - m_position; }

      size_t position() const { return m_position; }

      bool is_failed() const { return m_failed; }

      /**
      * Mark the decoder as failed and throw err annotated with the
      * current position
      */
      [[noreturn]] void error(const DER_Error& err);

   private:
      /**
      * Decode an Any and convert it with T::from_any; defined in asn1_any.h
      */
      template <typename T>
      T decode_from_any();

      /**
      * Decode a header which must carry the expected tag and return a
      * view of the value it introduces
      */
      std::span<const uint8_t> value_of(Tag expected);

      std::span<const uint8_t> m_input;
      size_t m_position = 0;
      bool m_failed = false;
};

}  // namespace Ordo

#endif
