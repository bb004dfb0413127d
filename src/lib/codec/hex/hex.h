/*
* Hex Encoding and Decoding
* (C) 2010 Jack Lloyd
*     2024 René Meusel, Rohde & Schwarz Cybersecurity
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_HEX_CODEC_H_
#define ORDO_HEX_CODEC_H_

#include <ordo/types.h>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Ordo {

/**
* Hex encode input_length bytes of input
* @param uppercase use A-F rather than a-f
*/
std::string ORDO_PUBLIC_API(1, 0) hex_encode(const uint8_t input[], size_t input_length, bool uppercase = true);

inline std::string hex_encode(std::span<const uint8_t> input, bool uppercase = true) {
   return hex_encode(input.data(), input.size(), uppercase);
}

/**
* Decode as much hex as forms whole bytes
*
* @param output an array of at least input_length/2 bytes
* @param input some hex input
* @param input_length length of input in bytes
* @param input_consumed set to the number of input characters which were
*        decoded. If a final digit had no partner this is the offset of
*        that digit, and input[input_consumed:] should be passed in again
*        once more input is available.
* @param ignore_ws skip spaces, tabs and line breaks; if false they are
*        rejected like any other non hex character
* @return number of bytes written to output
* @throws Invalid_Argument on a character that is not a hex digit
*/
size_t ORDO_PUBLIC_API(1, 0)
   hex_decode(uint8_t output[], const char input[], size_t input_length, size_t& input_consumed, bool ignore_ws = true);

/**
* As above, but an odd number of digits is an error
* @throws Invalid_Argument on invalid input or a trailing half byte
*/
size_t ORDO_PUBLIC_API(1, 0)
   hex_decode(uint8_t output[], const char input[], size_t input_length, bool ignore_ws = true);

/**
* Decode a hex string such as "3003020105"
* @throws Invalid_Argument on invalid input or a trailing half byte
*/
std::vector<uint8_t> ORDO_PUBLIC_API(1, 0) hex_decode(std::string_view input, bool ignore_ws = true);

}  // namespace Ordo

#endif
