/*
* Character Set Handling
* (C) 1999-2007,2021 Jack Lloyd
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_CHARSET_H_
#define ORDO_CHARSET_H_

#include <ordo/types.h>
#include <span>
#include <string>

namespace Ordo {

/**
* Check that the input is well formed UTF-8
*
* Overlong encodings, surrogate code points (U+D800 to U+DFFF) and values
* beyond U+10FFFF are rejected.
*/
ORDO_TEST_API bool is_valid_utf8(std::span<const uint8_t> utf8);

/**
* Check that every character belongs to the ASN.1 PrintableString alphabet
* (letters, digits, space and the punctuation '()+,-./:=?)
*/
ORDO_TEST_API bool is_printable_string(std::span<const uint8_t> str);

/**
* Check that every character is 7-bit ASCII, as required by IA5String
*/
ORDO_TEST_API bool is_ia5_string(std::span<const uint8_t> str);

/**
* Return a string containing 'c', quoted and possibly escaped
*
* This is used when creating an error message nothing an invalid character
* in some codex (for example during hex decoding)
*
* Tab, newline and carriage return are shown as "\t", "\n" and "\r";
* other control characters and bytes above 0x7F as "\xHH".
*/
ORDO_TEST_API std::string format_char_for_display(char c);

}  // namespace Ordo

#endif
