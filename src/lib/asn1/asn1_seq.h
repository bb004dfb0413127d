/*
* ASN.1 SEQUENCE, SEQUENCE OF and SET OF
* (C) 2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_ASN1_SEQUENCE_H_
#define ORDO_ASN1_SEQUENCE_H_

#include <ordo/asn1_any.h>
#include <algorithm>
#include <functional>
#include <iterator>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace Ordo {

/**
* The body of a SEQUENCE whose fields have not been decoded yet
*
* The body is viewed, not copied.
*/
class ORDO_PUBLIC_API(1, 0) Sequence final : public Encodable {
   public:
      static constexpr Tag TAG{ASN1_Type::Sequence};

      /**
      * @throws DER_Error (Length) if body is longer than Length::MAX
      */
      explicit Sequence(std::span<const uint8_t> body);

      std::span<const uint8_t> as_bytes() const { return m_body; }

      /**
      * Return a new decoder positioned at the first field
      */
      DER_Decoder decoder() const { return DER_Decoder(m_body); }

      /**
      * Decode the fields with f, which must consume the entire body
      */
      template <typename F>
         requires std::invocable<F, DER_Decoder&>
      auto decode_nested(F&& f) const -> std::invoke_result_t<F, DER_Decoder&> {
         DER_Decoder dec(m_body);
         auto result = std::invoke(std::forward<F>(f), dec);
         return dec.finish(std::move(result));
      }

      static Sequence from_any(const Any& any);

      static Sequence decode(DER_Decoder& decoder);

      Length encoded_len() const override;

      void encode_into(DER_Encoder& to) const override;

      bool operator==(const Sequence& other) const;

   private:
      std::span<const uint8_t> m_body;
};

/**
* Decodes consecutive values of type T until the input is exhausted, as
* in the body of a SEQUENCE OF. Each value is decoded on demand; the
* iteration cannot be restarted.
*/
template <DER_Decodable T>
class SequenceIter final {
   public:
      class iterator final {
         public:
            using iterator_category = std::input_iterator_tag;
            using value_type = T;
            using difference_type = std::ptrdiff_t;
            using pointer = const T*;
            using reference = const T&;

            iterator() = default;

            explicit iterator(SequenceIter* iter) : m_iter(iter) { advance(); }

            const T& operator*() const { return *m_value; }

            const T* operator->() const { return &*m_value; }

            iterator& operator++() {
               advance();
               return (*this);
            }

            void operator++(int) { advance(); }

            bool operator==(const iterator& other) const { return m_iter == other.m_iter; }

         private:
            void advance() {
               m_value.reset();
               if(auto v = m_iter->next()) {
                  m_value.emplace(std::move(*v));
               } else {
                  m_iter = nullptr;
               }
            }

            SequenceIter* m_iter = nullptr;
            std::optional<T> m_value;
      };

      explicit SequenceIter(DER_Decoder decoder) : m_decoder(std::move(decoder)) {}

      explicit SequenceIter(const Sequence& seq) : m_decoder(seq.decoder()) {}

      /**
      * Return the next value, or nullopt once the input is exhausted
      * @throws DER_Error if the next value is malformed, or (Failed) if
      * an earlier call threw
      */
      std::optional<T> next() {
         // A failed decoder reports no remaining input
         if(!m_decoder.is_failed() && m_decoder.is_finished()) {
            return std::nullopt;
         }
         return m_decoder.decode<T>();
      }

      iterator begin() { return iterator(this); }

      iterator end() { return iterator(); }

   private:
      DER_Decoder m_decoder;
};

/**
* A decoded SET OF whose element encodings have been checked to appear
* in strictly increasing order, as DER requires. The elements are
* viewed, not copied, and decoded again each time they are iterated.
*/
template <DER_Decodable T>
class SetOfRef final : public Encodable {
   public:
      static constexpr Tag TAG{ASN1_Type::Set};

      /**
      * Validate the body of a SET OF
      * @throws DER_Error (Noncanonical) if the elements are not sorted
      * or contain a duplicate, or any error decoding an element
      */
      static SetOfRef create(std::span<const uint8_t> body) {
         if(body.size() > Length::MAX) {
            throw DER_Error::length(TAG);
         }

         DER_Decoder decoder(body);
         std::optional<std::span<const uint8_t>> last;

         while(!decoder.is_finished()) {
            const size_t start = decoder.position();
            decoder.decode<T>();
            const auto encoding = body.subspan(start, decoder.position() - start);

            if(last.has_value() &&
               !std::lexicographical_compare(last->begin(), last->end(), encoding.begin(), encoding.end())) {
               throw DER_Error::noncanonical().at(start);
            }

            last = encoding;
         }

         return SetOfRef(body);
      }

      std::span<const uint8_t> as_bytes() const { return m_body; }

      /**
      * Return a new iterator over the elements
      */
      SequenceIter<T> elements() const { return SequenceIter<T>(DER_Decoder(m_body)); }

      static SetOfRef from_any(const Any& any) {
         any.assert_is_a(TAG);
         return SetOfRef::create(any.value());
      }

      static SetOfRef decode(DER_Decoder& decoder) { return from_any(decoder.any()); }

      Length encoded_len() const override { return Length::from_size(m_body.size()).for_tlv(); }

      void encode_into(DER_Encoder& to) const override {
         Header(TAG, Length::from_size(m_body.size())).encode_into(to);
         to.bytes(m_body);
      }

      bool operator==(const SetOfRef& other) const {
         return std::equal(m_body.begin(), m_body.end(), other.m_body.begin(), other.m_body.end());
      }

   private:
      explicit SetOfRef(std::span<const uint8_t> body) : m_body(body) {}

      std::span<const uint8_t> m_body;
};

/**
* An owning SET OF, kept in DER order as elements are inserted
*/
template <typename T>
class SetOf final : public Encodable {
   public:
      static constexpr Tag TAG{ASN1_Type::Set};

      SetOf() = default;

      /**
      * Insert value at its sorted position
      * @throws DER_Error (Noncanonical) if an equal element is present
      */
      void insert(T value) {
         auto encoding = value.to_der();

         const auto pos = std::lower_bound(m_encodings.begin(), m_encodings.end(), encoding);
         if(pos != m_encodings.end() && *pos == encoding) {
            throw DER_Error::noncanonical();
         }

         const auto idx = std::distance(m_encodings.begin(), pos);
         m_elements.insert(m_elements.begin() + idx, std::move(value));
         m_encodings.insert(pos, std::move(encoding));
      }

      const std::vector<T>& elements() const { return m_elements; }

      size_t size() const { return m_elements.size(); }

      bool empty() const { return m_elements.empty(); }

      typename std::vector<T>::const_iterator begin() const { return m_elements.begin(); }

      typename std::vector<T>::const_iterator end() const { return m_elements.end(); }

      static SetOf from_any(const Any& any)
         requires DER_Decodable<T>
      {
         SetOf set;
         for(const auto& element : SetOfRef<T>::from_any(any).elements()) {
            set.insert(element);
         }
         return set;
      }

      static SetOf decode(DER_Decoder& decoder)
         requires DER_Decodable<T>
      {
         return from_any(decoder.any());
      }

      Length encoded_len() const override { return body_len().for_tlv(); }

      void encode_into(DER_Encoder& to) const override {
         Header(TAG, body_len()).encode_into(to);
         for(const auto& encoding : m_encodings) {
            to.bytes(encoding);
         }
      }

      bool operator==(const SetOf& other) const { return m_encodings == other.m_encodings; }

   private:
      Length body_len() const {
         Length len;
         for(const auto& encoding : m_encodings) {
            len += Length::from_size(encoding.size());
         }
         return len;
      }

      std::vector<T> m_elements;
      std::vector<std::vector<uint8_t>> m_encodings;
};

/**
* Base class for structures encoded as a SEQUENCE of their fields
*
* A subclass lists its fields, in order, by calling the provided
* callback once; encoded_len and encode_into are derived from them.
*/
class ORDO_PUBLIC_API(1, 0) Message : public Encodable {
   public:
      static constexpr Tag TAG{ASN1_Type::Sequence};

      using Fields_Callback = std::function<void(std::span<const Encodable* const>)>;

      virtual void fields(const Fields_Callback& f) const = 0;

      Length encoded_len() const override;

      void encode_into(DER_Encoder& to) const override;
};

}  // namespace Ordo

#endif
