/*
* (C) 2015 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_CLI_EXCEPTIONS_H_
#define ORDO_CLI_EXCEPTIONS_H_

#include <stdexcept>
#include <string>

namespace Ordo_CLI {

class CLI_Error : public std::runtime_error {
   public:
      explicit CLI_Error(const std::string& s) : std::runtime_error(s) {}
};

class CLI_Usage_Error final : public CLI_Error {
   public:
      explicit CLI_Usage_Error(const std::string& what) : CLI_Error(what) {}
};

}  // namespace Ordo_CLI

#endif
