/*
* DER Encoder
* (C) 1999-2007,2018 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/der_enc.h>

#include <ordo/asn1_obj.h>
#include <ordo/asn1_oid.h>
#include <ordo/asn1_str.h>
#include <algorithm>

namespace Ordo {

std::vector<uint8_t> Encodable::to_der() const {
   std::vector<uint8_t> output;
   encode_to_vec(output);
   return output;
}

void Encodable::encode_to_vec(std::vector<uint8_t>& out) const {
   const size_t expected = encoded_len().value();
   const size_t offset = out.size();
   out.resize(offset + expected);

   DER_Encoder encoder(std::span<uint8_t>(out).subspan(offset));
   encode_into(encoder);
   const size_t actual = encoder.finish().size();

   if(actual != expected) {
      out.resize(offset);
      throw DER_Error::underlength(expected, actual);
   }
}

void DER_Encoder::error(const DER_Error& err) {
   m_failed = true;
   throw err;
}

std::span<uint8_t> DER_Encoder::reserve(size_t len) {
   if(m_failed) {
      error(DER_Error::failed());
   }

   if(len > remaining_len()) {
      error(DER_Error::overlength());
   }

   auto reserved = m_output.subspan(m_position, len);
   m_position += len;
   return reserved;
}

DER_Encoder& DER_Encoder::byte(uint8_t b) {
   reserve(1)[0] = b;
   return (*this);
}

DER_Encoder& DER_Encoder::bytes(std::span<const uint8_t> b) {
   auto out = reserve(b.size());
   std::copy(b.begin(), b.end(), out.begin());
   return (*this);
}

DER_Encoder& DER_Encoder::encode(const Encodable& value) {
   if(m_failed) {
      error(DER_Error::failed());
   }

   const size_t expected = value.encoded_len().value();
   const size_t start = m_position;

   try {
      value.encode_into(*this);
   } catch(const DER_Error&) {
      m_failed = true;
      throw;
   }

   const size_t actual = m_position - start;
   if(actual != expected) {
      error(DER_Error::underlength(expected, actual));
   }

   return (*this);
}

DER_Encoder& DER_Encoder::sequence(std::span<const Encodable* const> fields) {
   if(m_failed) {
      error(DER_Error::failed());
   }

   const Tag tag(ASN1_Type::Sequence);

   Length body_len;
   try {
      for(const Encodable* field : fields) {
         body_len += field->encoded_len();
      }
   } catch(const DER_Error&) {
      m_failed = true;
      throw;
   }

   Header(tag, body_len).encode_into(*this);

   DER_Encoder nested(reserve(body_len.value()));

   try {
      for(const Encodable* field : fields) {
         field->encode_into(nested);
      }
   } catch(const DER_Error& e) {
      m_failed = true;

      // A field writing more than it promised runs off the end of the
      // exactly sized body
      if(e.kind() == DER_ErrorKind::Overlength) {
         throw DER_Error::length(tag);
      }
      throw;
   }

   if(nested.position() != body_len.value()) {
      error(DER_Error::length(tag));
   }

   return (*this);
}

DER_Encoder& DER_Encoder::context_specific(TagNumber number, const Encodable& value) {
   Header(Tag::context_specific(number), value.encoded_len()).encode_into(*this);
   return encode(value);
}

DER_Encoder& DER_Encoder::null() {
   return encode(Null());
}

DER_Encoder& DER_Encoder::boolean(bool b) {
   return encode(Boolean(b));
}

DER_Encoder& DER_Encoder::octet_string(std::span<const uint8_t> value) {
   return encode(OctetString(value));
}

DER_Encoder& DER_Encoder::bit_string(std::span<const uint8_t> value) {
   return encode(BitString(value));
}

DER_Encoder& DER_Encoder::utf8_string(std::string_view value) {
   return encode(Utf8String(value));
}

DER_Encoder& DER_Encoder::oid(const OID& oid) {
   return encode(oid);
}

std::span<const uint8_t> DER_Encoder::finish() const {
   if(m_failed) {
      throw DER_Error::failed();
   }

   ORDO_ASSERT_NOMSG(m_position <= m_output.size());

   return std::span<const uint8_t>(m_output.first(m_position));
}

}  // namespace Ordo
