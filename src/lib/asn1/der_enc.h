/*
* DER Encoder
* (C) 1999-2007,2018 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_DER_ENCODER_H_
#define ORDO_DER_ENCODER_H_

#include <ordo/der_error.h>
#include <ordo/der_header.h>
#include <concepts>
#include <initializer_list>
#include <span>
#include <string_view>
#include <vector>

namespace Ordo {

class DER_Encoder;
class OID;

template <std::integral T>
class Integer;

/**
* Base class for all values which can be DER encoded
*/
class ORDO_PUBLIC_API(1, 0) Encodable {
   public:
      /**
      * Return the number of bytes encode_into will write, including
      * the tag and length prefix
      */
      virtual Length encoded_len() const = 0;

      /**
      * Encode whatever this object is into to
      * @param to the DER_Encoder that will be written to
      */
      virtual void encode_into(DER_Encoder& to) const = 0;

      /**
      * Return the encoding of this object in a freshly sized buffer
      */
      std::vector<uint8_t> to_der() const;

      /**
      * Append the encoding of this object to out
      */
      void encode_to_vec(std::vector<uint8_t>& out) const;

      constexpr Encodable() = default;
      constexpr Encodable(const Encodable&) = default;
      constexpr Encodable& operator=(const Encodable&) = default;
      constexpr Encodable(Encodable&&) = default;
      constexpr Encodable& operator=(Encodable&&) = default;

      constexpr virtual ~Encodable() = default;
};

/**
* DER Encoding Object
*
* Writes into a caller provided buffer. Writing past the end of the
* buffer throws DER_Error (Overlength); once any operation has failed
* the encoder is marked as failed and every further operation throws a
* DER_Error of kind Failed.
*/
class ORDO_PUBLIC_API(1, 0) DER_Encoder final {
   public:
      explicit DER_Encoder(std::span<uint8_t> output) : m_output(output) {}

      DER_Encoder(uint8_t buf[], size_t len) : DER_Encoder(std::span<uint8_t>(buf, len)) {}

      /**
      * Insert a single byte into the output
      */
      DER_Encoder& byte(uint8_t b);

      /**
      * Insert raw bytes directly into the output
      */
      DER_Encoder& bytes(std::span<const uint8_t> b);

      /**
      * Request for an object to encode itself to this stream. Throws
      * DER_Error (Underlength) if the object writes fewer bytes than
      * its encoded_len() promised.
      */
      DER_Encoder& encode(const Encodable& value);

      /**
      * Encode a SEQUENCE containing each of fields in order
      */
      DER_Encoder& sequence(std::span<const Encodable* const> fields);

      DER_Encoder& sequence(std::initializer_list<const Encodable*> fields) {
         return sequence(std::span<const Encodable* const>(fields.begin(), fields.size()));
      }

      /**
      * Encode value wrapped in a context-specific tag
      */
      DER_Encoder& context_specific(TagNumber number, const Encodable& value);

      DER_Encoder& null();

      DER_Encoder& boolean(bool b);

      template <std::integral T>
      DER_Encoder& integer(T value) {
         return encode(Integer<T>(value));
      }

      DER_Encoder& octet_string(std::span<const uint8_t> value);

      DER_Encoder& bit_string(std::span<const uint8_t> value);

      DER_Encoder& utf8_string(std::string_view value);

      DER_Encoder& oid(const OID& oid);

      /**
      * Return the prefix of the output buffer which has been written
      */
      std::span<const uint8_t> finish() const;

      size_t position() const { return m_position; }

      size_t remaining_len() const { return m_output.size() - m_position; }

      bool is_failed() const { return m_failed; }

   private:
      /**
      * Reserve len bytes of the output and return them
      */
      std::span<uint8_t> reserve(size_t len);

      [[noreturn]] void error(const DER_Error& err);

      std::span<uint8_t> m_output;
      size_t m_position = 0;
      bool m_failed = false;
};

}  // namespace Ordo

#endif
