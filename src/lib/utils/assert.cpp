/*
* Runtime assertion checking
* (C) 2010,2012,2018 Jack Lloyd
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/assert.h>

#include <ordo/exceptn.h>
#include <ordo/internal/fmt.h>
#include <string>

#if defined(ORDO_TERMINATE_ON_ASSERTS)
   #include <cstdlib>
   #include <iostream>
#endif

namespace Ordo {

void throw_invalid_argument(const char* message, const char* func, const char* file) {
   throw Invalid_Argument(fmt("{} in {}:{}", message, func, file));
}

void throw_invalid_state(const char* expr, const char* func, const char* file) {
   throw Invalid_State(fmt("Invalid state: expr {} was false in {}:{}", expr, func, file));
}

namespace {

[[noreturn]] void report_internal_error(const std::string& msg) {
#if defined(ORDO_TERMINATE_ON_ASSERTS)
   std::cerr << msg << '\n';
   std::abort();
#else
   throw Internal_Error(msg);
#endif
}

}  // namespace

void assertion_failure(const char* expr_str, const char* assertion_made, const char* func, const char* file, int line) {
   std::string msg;

   if(assertion_made != nullptr && assertion_made[0] != 0) {
      msg = fmt("False assertion '{}' (expression {})", assertion_made, expr_str);
   } else {
      msg = fmt("False assertion {}", expr_str);
   }

   if(func != nullptr) {
      msg += fmt(" in {}", func);
   }

   report_internal_error(fmt("{} @{}:{}", msg, file, line));
}

void assert_unreachable(const char* file, int line) {
   report_internal_error(fmt("Codepath that was marked unreachable was reached @{}:{}", file, line));
}

}  // namespace Ordo
