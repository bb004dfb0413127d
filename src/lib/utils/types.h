/*
* Low Level Types
* (C) 1999-2007 Jack Lloyd
* (C) 2015 Simon Warta (Kullo GmbH)
* (C) 2016 René Korthaus, Rohde & Schwarz Cybersecurity
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_TYPES_H_
#define ORDO_TYPES_H_

#include <ordo/api.h>     // IWYU pragma: export
#include <ordo/assert.h>  // IWYU pragma: export
#include <ordo/build.h>   // IWYU pragma: export
#include <cstddef>        // IWYU pragma: export
#include <cstdint>        // IWYU pragma: export
#include <memory>         // IWYU pragma: export

namespace Ordo {

/**
* @mainpage Ordo DER Codec API Reference
*
* <dl>
* <dt>Wire primitives<dd>
*        Length, Tag, TagNumber, Header
* <dt>Cursors<dd>
*        DER_Decoder, DER_Encoder, Encodable
* <dt>Universal types<dd>
*        Any, Boolean, Null, Integer, UintBytes, OctetString, BitString, Utf8String,
*        PrintableString, Ia5String, OID, UtcTime, GeneralizedTime
* <dt>Composite types<dd>
*        Sequence, SequenceIter, SetOfRef, SetOf, Message, Choice, ContextSpecific, ContextualTo
* </dl>
*/

using std::int16_t;
using std::int32_t;
using std::int64_t;
using std::int8_t;
using std::size_t;
using std::uint16_t;
using std::uint32_t;
using std::uint64_t;
using std::uint8_t;

static_assert(sizeof(std::size_t) == 8 || sizeof(std::size_t) == 4, "This platform has an unexpected size for size_t");

}  // namespace Ordo

#endif
