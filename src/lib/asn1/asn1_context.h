/*
* ASN.1 Context-Specific Fields
* (C) 2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_ASN1_CONTEXT_H_
#define ORDO_ASN1_CONTEXT_H_

#include <ordo/asn1_any.h>
#include <utility>

namespace Ordo {

/**
* A value carrying any context-specific tag, such as an extension in a
* CHOICE whose meaning depends on the tag number. The tagged value is
* an explicitly tagged (constructed) wrapper around a single DER value.
*/
class ORDO_PUBLIC_API(1, 0) ContextSpecific final : public Encodable {
   public:
      ContextSpecific(TagNumber tag_number, const Any& value) : m_tag_number(tag_number), m_value(value) {}

      TagNumber tag_number() const { return m_tag_number; }

      Tag tag() const { return Tag::context_specific(m_tag_number); }

      const Any& value() const { return m_value; }

      static constexpr bool can_decode(Tag tag) { return tag.is_context_specific(); }

      /**
      * @throws DER_Error (UnexpectedTag) if any is not context-specific
      */
      static ContextSpecific from_any(const Any& any);

      static ContextSpecific decode(DER_Decoder& decoder);

      Length encoded_len() const override;

      void encode_into(DER_Encoder& to) const override;

      bool operator==(const ContextSpecific& other) const;

   private:
      TagNumber m_tag_number;
      Any m_value;
};

/**
* A field of type T explicitly tagged with context-specific number N,
* as in "[0] EXPLICIT T"
*/
template <uint8_t N, typename T>
class ContextualTo final : public Encodable {
   public:
      static constexpr Tag TAG = Tag::context_specific(TagNumber(N));

      explicit ContextualTo(T value) : m_value(std::move(value)) {}

      const T& value() const { return m_value; }

      const T& operator*() const { return m_value; }

      const T* operator->() const { return &m_value; }

      /**
      * @throws DER_Error (UnexpectedTag) if any is not tagged N, or any
      * error decoding T from the content
      */
      static ContextualTo from_any(const Any& any) {
         any.assert_is_a(TAG);

         DER_Decoder decoder(any.value());
         auto value = decoder.decode<T>();
         return ContextualTo(decoder.finish(std::move(value)));
      }

      static ContextualTo decode(DER_Decoder& decoder) { return from_any(decoder.any()); }

      Length encoded_len() const override { return m_value.encoded_len().for_tlv(); }

      void encode_into(DER_Encoder& to) const override {
         Header(TAG, m_value.encoded_len()).encode_into(to);
         to.encode(m_value);
      }

      bool operator==(const ContextualTo& other) const { return m_value == other.m_value; }

   private:
      T m_value;
};

template <typename T>
using ContextualTo0 = ContextualTo<0, T>;

template <typename T>
using ContextualTo1 = ContextualTo<1, T>;

template <typename T>
using ContextualTo2 = ContextualTo<2, T>;

template <typename T>
using ContextualTo3 = ContextualTo<3, T>;

}  // namespace Ordo

#endif
