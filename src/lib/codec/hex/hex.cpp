/*
* Hex Encoding and Decoding
* (C) 2010,2020 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/hex.h>

#include <ordo/exceptn.h>
#include <ordo/internal/charset.h>
#include <ordo/internal/fmt.h>
#include <optional>

namespace Ordo {

namespace {

std::optional<uint8_t> hex_digit_value(char c) {
   if(c >= '0' && c <= '9') {
      return static_cast<uint8_t>(c - '0');
   }
   if(c >= 'a' && c <= 'f') {
      return static_cast<uint8_t>(c - 'a' + 10);
   }
   if(c >= 'A' && c <= 'F') {
      return static_cast<uint8_t>(c - 'A' + 10);
   }
   return std::nullopt;
}

bool is_hex_whitespace(char c) {
   return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

}  // namespace

std::string hex_encode(const uint8_t input[], size_t input_length, bool uppercase) {
   const char* digits = uppercase ? "0123456789ABCDEF" : "0123456789abcdef";

   std::string output;
   output.reserve(2 * input_length);

   for(size_t i = 0; i != input_length; ++i) {
      output.push_back(digits[input[i] >> 4]);
      output.push_back(digits[input[i] & 0x0F]);
   }

   return output;
}

size_t hex_decode(uint8_t output[], const char input[], size_t input_length, size_t& input_consumed, bool ignore_ws) {
   size_t written = 0;

   // offset of a high nibble still waiting for its low nibble
   std::optional<size_t> pending;
   uint8_t high = 0;

   for(size_t i = 0; i != input_length; ++i) {
      const auto nibble = hex_digit_value(input[i]);

      if(!nibble) {
         if(ignore_ws && is_hex_whitespace(input[i])) {
            continue;
         }
         throw Invalid_Argument(fmt("hex_decode: invalid character {}", format_char_for_display(input[i])));
      }

      if(pending) {
         output[written++] = static_cast<uint8_t>((high << 4) | *nibble);
         pending.reset();
      } else {
         high = *nibble;
         pending = i;
      }
   }

   input_consumed = pending.value_or(input_length);
   return written;
}

size_t hex_decode(uint8_t output[], const char input[], size_t input_length, bool ignore_ws) {
   size_t consumed = 0;
   const size_t written = hex_decode(output, input, input_length, consumed, ignore_ws);

   if(consumed != input_length) {
      throw Invalid_Argument("hex_decode: input did not have full bytes");
   }

   return written;
}

std::vector<uint8_t> hex_decode(std::string_view input, bool ignore_ws) {
   std::vector<uint8_t> bin(input.size() / 2);

   const size_t written = hex_decode(bin.data(), input.data(), input.size(), ignore_ws);

   bin.resize(written);
   return bin;
}

}  // namespace Ordo
