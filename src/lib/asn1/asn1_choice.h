/*
* ASN.1 CHOICE
* (C) 2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_ASN1_CHOICE_H_
#define ORDO_ASN1_CHOICE_H_

#include <ordo/asn1_any.h>
#include <concepts>
#include <type_traits>
#include <utility>
#include <variant>

namespace Ordo {

/**
* ASN.1 CHOICE between a fixed list of alternatives
*
* The alternative is selected by the tag of the encoded value; when more
* than one alternative accepts a tag, the first one listed wins.
*/
template <typename... Alts>
class Choice final : public Encodable {
   public:
      static_assert(sizeof...(Alts) > 0, "A CHOICE needs at least one alternative");

      using variant_type = std::variant<Alts...>;

      template <typename A>
         requires(std::same_as<std::remove_cvref_t<A>, Alts> || ...)
      Choice(A&& value) : m_value(std::forward<A>(value)) {}

      template <size_t I, typename... Args>
      explicit Choice(std::in_place_index_t<I> idx, Args&&... args) : m_value(idx, std::forward<Args>(args)...) {}

      static constexpr bool can_decode(Tag tag) { return (der_accepts_tag<Alts>(tag) || ...); }

      static Choice decode(DER_Decoder& decoder) {
         const auto tag = decoder.peek_tag();

         if(!tag.has_value()) {
            // Reports the truncation or unknown tag
            const Any any = decoder.any();
            decoder.error(DER_Error::unexpected_tag(std::nullopt, any.tag()));
         }

         return decode_alternative(decoder, *tag);
      }

      static Choice from_any(const Any& any)
         requires(requires { Alts::from_any(any); } && ...)
      {
         return from_any_alternative(any);
      }

      const variant_type& value() const { return m_value; }

      size_t index() const { return m_value.index(); }

      template <typename A>
      bool holds() const {
         return std::holds_alternative<A>(m_value);
      }

      /**
      * @throws Invalid_State if another alternative is held
      */
      template <typename A>
      const A& get() const {
         ORDO_STATE_CHECK(holds<A>());
         return *std::get_if<A>(&m_value);
      }

      template <typename A>
      const A* get_if() const {
         return std::get_if<A>(&m_value);
      }

      template <typename F>
      decltype(auto) visit(F&& f) const {
         return std::visit(std::forward<F>(f), m_value);
      }

      Length encoded_len() const override {
         return std::visit([](const auto& alt) { return alt.encoded_len(); }, m_value);
      }

      void encode_into(DER_Encoder& to) const override {
         std::visit([&](const auto& alt) { alt.encode_into(to); }, m_value);
      }

      bool operator==(const Choice& other) const { return m_value == other.m_value; }

   private:
      template <size_t I = 0>
      static Choice decode_alternative(DER_Decoder& decoder, Tag tag) {
         if constexpr(I == sizeof...(Alts)) {
            decoder.error(DER_Error::unexpected_tag(std::nullopt, tag));
         } else {
            using Alt = std::variant_alternative_t<I, variant_type>;
            if(der_accepts_tag<Alt>(tag)) {
               return Choice(std::in_place_index<I>, decoder.decode<Alt>());
            }
            return decode_alternative<I + 1>(decoder, tag);
         }
      }

      template <size_t I = 0>
      static Choice from_any_alternative(const Any& any) {
         if constexpr(I == sizeof...(Alts)) {
            throw DER_Error::unexpected_tag(std::nullopt, any.tag());
         } else {
            using Alt = std::variant_alternative_t<I, variant_type>;
            if(der_accepts_tag<Alt>(any.tag())) {
               return Choice(std::in_place_index<I>, Alt::from_any(any));
            }
            return from_any_alternative<I + 1>(any);
         }
      }

      variant_type m_value;
};

}  // namespace Ordo

#endif
