/*
* (C) 2023 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_UTIL_FMT_H_
#define ORDO_UTIL_FMT_H_

#include <ordo/types.h>
#include <iomanip>
#include <locale>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

namespace Ordo {

namespace fmt_detail {

/*
* Contents of a "{:...}" replacement field
*/
struct Format_Spec {
      bool zero_pad = false;
      int width = 0;
      char conversion = 0;
};

/*
* If format begins with a replacement field, parse it into spec and
* return the length of the field; otherwise return zero
*/
inline size_t parse_field(std::string_view format, Format_Spec& spec) {
   if(format.size() < 2 || format[0] != '{') {
      return 0;
   }

   if(format[1] == '}') {
      return 2;
   }

   if(format[1] != ':') {
      return 0;
   }

   size_t i = 2;

   if(i < format.size() && format[i] == '0') {
      spec.zero_pad = true;
      ++i;
   }

   while(i < format.size() && format[i] >= '0' && format[i] <= '9' && spec.width < 100) {
      spec.width = spec.width * 10 + (format[i] - '0');
      ++i;
   }

   if(i < format.size() && (format[i] == 'x' || format[i] == 'X' || format[i] == 'd')) {
      spec.conversion = format[i];
      ++i;
   }

   if(i < format.size() && format[i] == '}') {
      return i + 1;
   }

   return 0;
}

template <typename T>
void format_value(std::ostringstream& oss, const Format_Spec& spec, const T& val) {
   const auto flags = oss.flags();
   const auto fill = oss.fill();

   if(spec.zero_pad) {
      oss << std::setfill('0');
   }
   if(spec.width > 0) {
      oss << std::setw(spec.width);
   }
   if(spec.conversion == 'x') {
      oss << std::hex << std::nouppercase;
   } else if(spec.conversion == 'X') {
      oss << std::hex << std::uppercase;
   }

   // A conversion asks for a number, not a character
   if constexpr(std::is_integral_v<T> && sizeof(T) == 1 && !std::is_same_v<T, bool>) {
      if(spec.conversion != 0) {
         oss << static_cast<unsigned int>(static_cast<uint8_t>(val));
      } else {
         oss << val;
      }
   } else {
      oss << val;
   }

   oss.flags(flags);
   oss.fill(fill);
}

inline void do_fmt(std::ostringstream& oss, std::string_view format) {
   oss << format;
}

template <typename T, typename... Ts>
void do_fmt(std::ostringstream& oss, std::string_view format, const T& val, const Ts&... rest) {
   size_t i = 0;

   while(i < format.size()) {
      Format_Spec spec;
      if(const size_t field_len = parse_field(format.substr(i), spec)) {
         format_value(oss, spec, val);
         return do_fmt(oss, format.substr(i + field_len), rest...);
      }

      oss << format[i];
      i += 1;
   }
}

}  // namespace fmt_detail

/**
* Simple formatter utility.
*
* '{}' markers in the format string are replaced by the arguments. A
* marker may carry a small subset of the std::format specification:
* '{:02}' pads with zeros to a width, and '{:x}', '{:02X}' print an
* integer in hex. Single byte integers given a conversion are printed
* as numbers. There is no support for escaping.
*/
template <typename... T>
std::string fmt(std::string_view format, const T&... args) {
   std::ostringstream oss;
   oss.imbue(std::locale::classic());
   fmt_detail::do_fmt(oss, format, args...);
   return oss.str();
}

}  // namespace Ordo

#endif
