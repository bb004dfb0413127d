/*
* ASN.1 OBJECT IDENTIFIER
* (C) 1999-2007,2024 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_ASN1_OID_H_
#define ORDO_ASN1_OID_H_

#include <ordo/der_dec.h>
#include <ordo/der_enc.h>
#include <algorithm>
#include <array>
#include <compare>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace Ordo {

class Any;

/**
* The first two arcs of an OID, which are packed into a single octet
*/
class ORDO_PUBLIC_API(1, 0) RootArcs final {
   public:
      static constexpr uint32_t FIRST_ARC_MAX = 2;
      static constexpr uint32_t SECOND_ARC_MAX = 39;

      /**
      * @throws DER_Error (Oid) if either arc is out of range
      */
      constexpr RootArcs(uint32_t first, uint32_t second) : m_octet(0) {
         if(first > FIRST_ARC_MAX || second > SECOND_ARC_MAX) {
            throw DER_Error::oid();
         }
         m_octet = static_cast<uint8_t>(first * (SECOND_ARC_MAX + 1) + second);
      }

      /**
      * @throws DER_Error (Oid) if the octet does not hold valid root arcs
      */
      static constexpr RootArcs from_octet(uint8_t octet) {
         return RootArcs(octet / (SECOND_ARC_MAX + 1), octet % (SECOND_ARC_MAX + 1));
      }

      constexpr uint32_t first_arc() const { return m_octet / (SECOND_ARC_MAX + 1); }

      constexpr uint32_t second_arc() const { return m_octet % (SECOND_ARC_MAX + 1); }

      constexpr uint8_t octet() const { return m_octet; }

      constexpr bool operator==(const RootArcs& other) const = default;

   private:
      uint8_t m_octet;
};

/**
* Iterates over the arcs of a BER encoded OID. The encoding is viewed,
* not copied. Iteration cannot be restarted; create a new OID_Arcs
* instead.
*/
class ORDO_PUBLIC_API(1, 0) OID_Arcs final {
   public:
      class iterator final {
         public:
            using iterator_category = std::input_iterator_tag;
            using value_type = uint32_t;
            using difference_type = std::ptrdiff_t;
            using pointer = const uint32_t*;
            using reference = uint32_t;

            constexpr iterator() = default;

            constexpr explicit iterator(OID_Arcs* arcs) : m_arcs(arcs) { advance(); }

            constexpr uint32_t operator*() const { return m_value; }

            constexpr iterator& operator++() {
               advance();
               return (*this);
            }

            constexpr void operator++(int) { advance(); }

            constexpr bool operator==(const iterator& other) const { return m_arcs == other.m_arcs; }

         private:
            constexpr void advance() {
               if(auto arc = m_arcs->next()) {
                  m_value = *arc;
               } else {
                  m_arcs = nullptr;
               }
            }

            OID_Arcs* m_arcs = nullptr;
            uint32_t m_value = 0;
      };

      static constexpr size_t MAX_ARC_BYTES = 4;

      constexpr explicit OID_Arcs(std::span<const uint8_t> ber) : m_ber(ber) {}

      /**
      * Return the next arc, or nullopt once all arcs have been returned
      * @throws DER_Error (Oid) if an arc takes more than MAX_ARC_BYTES
      * octets, is not minimally encoded, or is truncated
      */
      constexpr std::optional<uint32_t> next() {
         if(m_ber.empty()) {
            return std::nullopt;
         }

         if(m_cursor == 0) {
            m_cursor = 1;
            m_second_pending = true;
            return RootArcs::from_octet(m_ber[0]).first_arc();
         }

         if(m_second_pending) {
            m_second_pending = false;
            return RootArcs::from_octet(m_ber[0]).second_arc();
         }

         if(m_cursor >= m_ber.size()) {
            return std::nullopt;
         }

         uint32_t arc = 0;
         for(size_t i = 0;; ++i) {
            if(m_cursor >= m_ber.size()) {
               // truncated
               throw DER_Error::oid();
            }

            const uint8_t b = m_ber[m_cursor++];

            // X.690 8.19.2: no leading 0x80 padding octets
            if(i == 0 && b == 0x80) {
               throw DER_Error::oid();
            }

            arc = (arc << 7) | (b & 0x7F);

            if((b & 0x80) == 0) {
               return arc;
            }

            // arc overflowed: at most MAX_ARC_BYTES octets per arc
            if(i + 1 == MAX_ARC_BYTES) {
               throw DER_Error::oid();
            }
         }
      }

      constexpr iterator begin() { return iterator(this); }

      constexpr iterator end() { return iterator(); }

   private:
      std::span<const uint8_t> m_ber;
      size_t m_cursor = 0;
      bool m_second_pending = false;
};

/**
* Converts arcs into their BER encoding. All functions are usable in
* constant expressions, where a malformed OID is a compile time error.
*/
class ORDO_PUBLIC_API(1, 0) OID_Parser final {
   public:
      static constexpr size_t MAX_LENGTH = ORDO_OID_MAX_LENGTH;

      /**
      * Parse a dotted decimal string such as "1.2.840.113549"
      * @throws DER_Error (Oid) if the string is not a valid OID
      */
      static constexpr OID_Parser parse(std::string_view str) {
         if(str.empty() || !is_digit(str[0])) {
            throw DER_Error::oid();
         }

         OID_Parser parser;
         uint32_t first_arc = 0;
         size_t arcs_seen = 0;
         size_t i = 0;

         while(true) {
            // An empty arc, including one following a trailing '.'
            if(i == str.size() || !is_digit(str[i])) {
               throw DER_Error::oid();
            }

            uint64_t arc = 0;
            while(i < str.size() && is_digit(str[i])) {
               arc = arc * 10 + static_cast<uint64_t>(str[i] - '0');
               if(arc > 0xFFFFFFFF) {
                  throw DER_Error::oid();
               }
               ++i;
            }

            parser.push_arc(arcs_seen, first_arc, static_cast<uint32_t>(arc));
            ++arcs_seen;

            if(i == str.size()) {
               break;
            }

            if(str[i] != '.') {
               throw DER_Error::oid();
            }
            ++i;
         }

         if(arcs_seen < 3) {
            throw DER_Error::oid();
         }

         return parser;
      }

      /**
      * Encode a list of at least three arcs
      * @throws DER_Error (Oid) if the arcs do not form a valid OID
      */
      static constexpr OID_Parser from_arcs(std::span<const uint32_t> arcs) {
         if(arcs.size() < 3) {
            throw DER_Error::oid();
         }

         OID_Parser parser;
         uint32_t first_arc = 0;
         for(size_t i = 0; i != arcs.size(); ++i) {
            parser.push_arc(i, first_arc, arcs[i]);
         }
         return parser;
      }

      constexpr std::span<const uint8_t> bytes() const { return std::span<const uint8_t>(m_bytes.data(), m_len); }

   private:
      constexpr OID_Parser() = default;

      static constexpr bool is_digit(char c) { return c >= '0' && c <= '9'; }

      constexpr void push_arc(size_t index, uint32_t& first_arc, uint32_t arc) {
         if(index == 0) {
            first_arc = arc;
         } else if(index == 1) {
            push_byte(RootArcs(first_arc, arc).octet());
         } else {
            push_base128(arc);
         }
      }

      constexpr void push_byte(uint8_t b) {
         if(m_len == MAX_LENGTH) {
            throw DER_Error::oid();
         }
         m_bytes[m_len++] = b;
      }

      constexpr void push_base128(uint32_t arc) {
         size_t groups = 1;
         while((arc >> (7 * groups)) != 0) {
            ++groups;
            if(groups > OID_Arcs::MAX_ARC_BYTES) {
               throw DER_Error::oid();
            }
         }

         for(size_t j = 0; j != groups; ++j) {
            const size_t shift = 7 * (groups - j - 1);
            uint8_t b = static_cast<uint8_t>((arc >> shift) & 0x7F);
            if(j != groups - 1) {
               b |= 0x80;
            }
            push_byte(b);
         }
      }

      std::array<uint8_t, MAX_LENGTH> m_bytes{};
      size_t m_len = 0;
};

/**
* ASN.1 Object Identifier
*
* The BER encoding (without tag and length) is stored inline, so an OID
* is cheap to copy. The encoding can be computed at compile time:
*
* @code
* constexpr auto rsa_ber = Ordo::OID_Parser::parse("1.2.840.113549.1.1.1");
* const Ordo::OID rsa(rsa_ber);
* @endcode
*/
class ORDO_PUBLIC_API(1, 0) OID final : public Encodable {
   public:
      static constexpr size_t MAX_LENGTH = ORDO_OID_MAX_LENGTH;

      static constexpr Tag TAG{ASN1_Type::ObjectId};

      /**
      * Construct an OID from a dotted decimal string
      * @throws DER_Error (Oid) if str is not a valid OID
      */
      static constexpr OID parse(std::string_view str) { return OID(OID_Parser::parse(str)); }

      /**
      * Initialize an OID from a sequence of integer values
      */
      constexpr OID(std::initializer_list<uint32_t> arcs) :
            OID(OID_Parser::from_arcs(std::span<const uint32_t>(arcs.begin(), arcs.size()))) {}

      constexpr explicit OID(const OID_Parser& parsed) {
         const auto bytes = parsed.bytes();
         std::copy(bytes.begin(), bytes.end(), m_bytes.begin());
         m_len = static_cast<uint8_t>(bytes.size());
      }

      /**
      * Validate and copy a BER encoded OID (without tag and length)
      * @throws DER_Error (Oid) if ber is not a valid OID encoding
      */
      static OID from_bytes(std::span<const uint8_t> ber);

      static OID from_any(const Any& any);

      static OID decode(DER_Decoder& decoder);

      /**
      * Return the BER encoding, without tag and length
      */
      constexpr std::span<const uint8_t> as_bytes() const { return std::span<const uint8_t>(m_bytes.data(), m_len); }

      constexpr OID_Arcs arcs() const { return OID_Arcs(as_bytes()); }

      /**
      * Return the arc at index, or nullopt if the OID has fewer arcs
      */
      std::optional<uint32_t> arc(size_t index) const;

      /**
      * Get this OID as a dotted-decimal string
      */
      std::string to_string() const;

      Length encoded_len() const override;

      void encode_into(DER_Encoder& to) const override;

      /**
      * Return a hash code for this OID
      *
      * This value is only meant as a std::unordered_map hash and
      * can change value from release to release.
      */
      size_t hash_code() const;

      constexpr bool operator==(const OID& other) const {
         return std::equal(m_bytes.begin(), m_bytes.begin() + m_len, other.m_bytes.begin(), other.m_bytes.begin() + other.m_len);
      }

      constexpr std::strong_ordering operator<=>(const OID& other) const {
         return std::lexicographical_compare_three_way(
            m_bytes.begin(), m_bytes.begin() + m_len, other.m_bytes.begin(), other.m_bytes.begin() + other.m_len);
      }

   private:
      constexpr OID() = default;

      std::array<uint8_t, MAX_LENGTH> m_bytes{};
      uint8_t m_len = 0;
};

}  // namespace Ordo

template <>
class std::hash<Ordo::OID> {
   public:
      size_t operator()(const Ordo::OID& oid) const noexcept { return oid.hash_code(); }
};

#endif
