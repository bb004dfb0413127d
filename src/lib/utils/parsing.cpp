/*
* String parsing helpers
* (C) 1999-2007,2013,2014,2015,2018 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/internal/parsing.h>

#include <ordo/exceptn.h>
#include <ordo/internal/fmt.h>

namespace Ordo {

uint32_t to_u32bit(std::string_view str) {
   if(str.empty()) {
      throw Invalid_Argument("to_u32bit empty decimal string");
   }

   uint64_t x = 0;

   for(const char chr : str) {
      if(chr < '0' || chr > '9') {
         throw Invalid_Argument(fmt("to_u32bit invalid decimal string '{}'", str));
      }

      x = 10 * x + static_cast<uint64_t>(chr - '0');

      if(x > 0xFFFFFFFF) {
         throw Invalid_Argument(fmt("Integer value of {} exceeds 32 bit range", str));
      }
   }

   return static_cast<uint32_t>(x);
}

std::vector<std::string> split_on(std::string_view str, char delim) {
   std::vector<std::string> elems;

   while(!str.empty()) {
      const size_t end = str.find(delim);

      if(end == std::string_view::npos) {
         elems.emplace_back(str);
         return elems;
      }

      if(end == str.size() - 1) {
         throw Invalid_Argument(fmt("Unable to split string '{}' on trailing delimiter", str));
      }

      if(end > 0) {
         elems.emplace_back(str.substr(0, end));
      }
      str.remove_prefix(end + 1);
   }

   return elems;
}

}  // namespace Ordo
