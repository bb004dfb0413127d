/*
* String parsing helpers
* (C) 1999-2007,2013 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_PARSING_UTILS_H_
#define ORDO_PARSING_UTILS_H_

#include <ordo/types.h>
#include <string>
#include <string_view>
#include <vector>

namespace Ordo {

/**
* Split a string on a delimiter. Empty fields are dropped, but a
* trailing delimiter is rejected.
* @param str the input string
* @param delim the delimiter
* @return the non-empty fields of str
* @throws Invalid_Argument if str ends with delim
*/
ORDO_TEST_API std::vector<std::string> split_on(std::string_view str, char delim);

/**
* Convert a string of decimal digits to a number. Signs, whitespace
* and any other characters are rejected.
* @param str the string to convert
* @return number value of the string
* @throws Invalid_Argument if str is empty, not decimal or exceeds 32 bits
*/
ORDO_TEST_API uint32_t to_u32bit(std::string_view str);

}  // namespace Ordo

#endif
