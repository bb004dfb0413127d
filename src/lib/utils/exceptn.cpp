/*
* (C) 2017 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/exceptn.h>

#include <ordo/internal/fmt.h>

namespace Ordo {

std::string to_string(ErrorType type) {
   switch(type) {
      case ErrorType::Unknown:
         return "Unknown";
      case ErrorType::InternalError:
         return "InternalError";
      case ErrorType::InvalidObjectState:
         return "InvalidObjectState";
      case ErrorType::InvalidArgument:
         return "InvalidArgument";
      case ErrorType::DecodingFailure:
         return "DecodingFailure";
   }

   return "Unrecognized Ordo error";
}

Exception::Exception(std::string_view msg) : m_msg(msg) {}

Exception::Exception(const char* prefix, std::string_view msg) : m_msg(fmt("{} {}", prefix, msg)) {}

Invalid_Argument::Invalid_Argument(std::string_view msg) : Exception(msg) {}

Internal_Error::Internal_Error(std::string_view err) : Exception("Internal error:", err) {}

Decoding_Error::Decoding_Error(std::string_view name) : Exception(name) {}

}  // namespace Ordo
