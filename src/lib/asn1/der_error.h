/*
* DER Codec Errors
* (C) 2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_DER_ERROR_H_
#define ORDO_DER_ERROR_H_

#include <ordo/asn1_tag.h>
#include <ordo/exceptn.h>
#include <optional>
#include <string>
#include <utility>

namespace Ordo {

/**
* The reason a DER encoding or decoding operation failed
*/
enum class DER_ErrorKind {
   /// Operation attempted on an encoder or decoder that already failed
   Failed,
   /// The length of a value is wrong for its tag
   Length,
   /// The encoding is valid BER but not canonical DER
   Noncanonical,
   /// Malformed OBJECT IDENTIFIER
   Oid,
   /// Integer or length arithmetic overflowed
   Overflow,
   /// Message or length prefix is too long
   Overlength,
   /// Bytes remain after decoding a complete message
   TrailingData,
   /// Input ended unexpectedly
   Truncated,
   /// Fewer bytes were produced than were promised
   Underlength,
   /// A tag other than the expected one was found
   UnexpectedTag,
   /// An identifier octet which is not supported
   UnknownTag,
   /// Content octets are invalid for the value's type
   Value,
};

std::string ORDO_PUBLIC_API(1, 0) to_string(DER_ErrorKind kind);

/**
* Exception thrown for all DER encoding and decoding failures
*/
class ORDO_PUBLIC_API(1, 0) DER_Error final : public Decoding_Error {
   public:
      static DER_Error failed();

      static DER_Error length(Tag tag);

      static DER_Error noncanonical();

      static DER_Error oid();

      static DER_Error overflow();

      static DER_Error overlength();

      static DER_Error trailing_data(size_t decoded, size_t remaining);

      static DER_Error truncated();

      static DER_Error underlength(size_t expected, size_t actual);

      static DER_Error unexpected_tag(std::optional<Tag> expected, Tag actual);

      static DER_Error unknown_tag(uint8_t octet);

      static DER_Error value(Tag tag);

      DER_ErrorKind kind() const { return m_kind; }

      /**
      * The tag a Length or Value error refers to, or the tag actually
      * found for an UnexpectedTag error
      */
      std::optional<Tag> tag() const { return m_tag; }

      /**
      * The tag which was expected by an UnexpectedTag error, if any
      */
      std::optional<Tag> expected_tag() const { return m_expected_tag; }

      /**
      * The identifier octet rejected by an UnknownTag error
      */
      std::optional<uint8_t> unknown_tag_byte() const { return m_octet; }

      /**
      * For TrailingData the number of bytes decoded, for Underlength the
      * number of bytes expected
      */
      size_t first_count() const { return m_counts.first; }

      /**
      * For TrailingData the number of bytes remaining, for Underlength
      * the number of bytes actually written
      */
      size_t second_count() const { return m_counts.second; }

      /**
      * Offset into the input of the decoder which observed the error
      */
      std::optional<size_t> position() const { return m_position; }

      /**
      * Return a copy of this error annotated with a position
      */
      DER_Error at(size_t position) const;

      /**
      * Return a copy of this error with its position shifted by offset
      * (or set to offset if it had none)
      */
      DER_Error nested(size_t offset) const;

   private:
      DER_Error(DER_ErrorKind kind,
                std::optional<Tag> tag,
                std::optional<Tag> expected_tag,
                std::optional<uint8_t> octet,
                std::pair<size_t, size_t> counts,
                std::optional<size_t> position);

      static std::string format_message(DER_ErrorKind kind,
                                        std::optional<Tag> tag,
                                        std::optional<Tag> expected_tag,
                                        std::optional<uint8_t> octet,
                                        std::pair<size_t, size_t> counts,
                                        std::optional<size_t> position);

      DER_ErrorKind m_kind;
      std::optional<Tag> m_tag;
      std::optional<Tag> m_expected_tag;
      std::optional<uint8_t> m_octet;
      std::pair<size_t, size_t> m_counts;
      std::optional<size_t> m_position;
};

}  // namespace Ordo

#endif
