/*
* Character Set Handling
* (C) 1999-2007,2021 Jack Lloyd
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/internal/charset.h>

#include <ordo/internal/fmt.h>

namespace Ordo {

namespace {

bool is_continuation_byte(uint8_t b) {
   return (b & 0xC0) == 0x80;
}

bool is_printable_char(uint8_t c) {
   const bool is_alpha_lower = (c >= 'a' && c <= 'z');
   const bool is_alpha_upper = (c >= 'A' && c <= 'Z');
   const bool is_decimal = (c >= '0' && c <= '9');

   bool is_print_punc = false;
   for(const char p : {' ', '\'', '(', ')', '+', ',', '-', '.', '/', ':', '=', '?'}) {
      if(c == static_cast<uint8_t>(p)) {
         is_print_punc = true;
      }
   }

   return is_alpha_lower || is_alpha_upper || is_decimal || is_print_punc;
}

}  // namespace

bool is_valid_utf8(std::span<const uint8_t> utf8) {
   size_t i = 0;

   while(i < utf8.size()) {
      const uint8_t b0 = utf8[i];

      if(b0 < 0x80) {
         i += 1;
         continue;
      }

      size_t extra = 0;
      uint32_t c = 0;
      uint32_t min_value = 0;

      if((b0 & 0xE0) == 0xC0) {
         extra = 1;
         c = b0 & 0x1F;
         min_value = 0x80;
      } else if((b0 & 0xF0) == 0xE0) {
         extra = 2;
         c = b0 & 0x0F;
         min_value = 0x800;
      } else if((b0 & 0xF8) == 0xF0) {
         extra = 3;
         c = b0 & 0x07;
         min_value = 0x10000;
      } else {
         return false;
      }

      if(utf8.size() - i <= extra) {
         return false;
      }

      for(size_t j = 1; j <= extra; ++j) {
         const uint8_t b = utf8[i + j];
         if(!is_continuation_byte(b)) {
            return false;
         }
         c = (c << 6) | (b & 0x3F);
      }

      if(c < min_value || c > 0x10FFFF || (c >= 0xD800 && c < 0xE000)) {
         return false;
      }

      i += 1 + extra;
   }

   return true;
}

bool is_printable_string(std::span<const uint8_t> str) {
   for(const uint8_t c : str) {
      if(!is_printable_char(c)) {
         return false;
      }
   }
   return true;
}

bool is_ia5_string(std::span<const uint8_t> str) {
   for(const uint8_t c : str) {
      if(c >= 0x80) {
         return false;
      }
   }
   return true;
}

std::string format_char_for_display(char c) {
   switch(c) {
      case '\t':
         return "'\\t'";
      case '\n':
         return "'\\n'";
      case '\r':
         return "'\\r'";
      default:
         break;
   }

   const uint8_t z = static_cast<uint8_t>(c);
   if(z >= 0x80 || z < 0x20) {
      return fmt("'\\x{:02X}'", z);
   }

   return fmt("'{}'", c);
}

}  // namespace Ordo
