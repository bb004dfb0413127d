/*
* Runtime assertion checking
* (C) 2010,2018 Jack Lloyd
*     2017 Simon Warta (Kullo GmbH)
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_ASSERTION_CHECKING_H_
#define ORDO_ASSERTION_CHECKING_H_

#include <ordo/api.h>

namespace Ordo {

/**
* Report a failed ORDO_ASSERT; throws Internal_Error, or aborts if
* built with ORDO_TERMINATE_ON_ASSERTS
*/
[[noreturn]] void ORDO_PUBLIC_API(1, 0)
   assertion_failure(const char* expr_str, const char* assertion_made, const char* func, const char* file, int line);

/**
* Throws Invalid_Argument naming the function which rejected its input
*/
[[noreturn]] void ORDO_UNSTABLE_API throw_invalid_argument(const char* message, const char* func, const char* file);

#define ORDO_ARG_CHECK(expr, msg)                               \
   do {                                                         \
      if(!(expr))                                               \
         Ordo::throw_invalid_argument(msg, __func__, __FILE__); \
   } while(0)

/**
* Throws Invalid_State naming the failed condition
*/
[[noreturn]] void ORDO_UNSTABLE_API throw_invalid_state(const char* message, const char* func, const char* file);

#define ORDO_STATE_CHECK(expr)                                 \
   do {                                                        \
      if(!(expr))                                              \
         Ordo::throw_invalid_state(#expr, __func__, __FILE__); \
   } while(0)

/**
* Check an internal invariant of the library; not for validating input,
* which is reported as DER_Error or Invalid_Argument
*/
#define ORDO_ASSERT(expr, assertion_made)                                              \
   do {                                                                                \
      if(!(expr))                                                                      \
         Ordo::assertion_failure(#expr, assertion_made, __func__, __FILE__, __LINE__); \
   } while(0)

#define ORDO_ASSERT_NOMSG(expr)                                            \
   do {                                                                    \
      if(!(expr))                                                          \
         Ordo::assertion_failure(#expr, "", __func__, __FILE__, __LINE__); \
   } while(0)

/*
* Marks a path the compiler cannot prove unreachable, such as the end of
* a switch over every enumerator. Reaching it is reported like a failed
* ORDO_ASSERT rather than being undefined behavior.
*/
[[noreturn]] void ORDO_UNSTABLE_API assert_unreachable(const char* file, int line);

#define ORDO_ASSERT_UNREACHABLE() Ordo::assert_unreachable(__FILE__, __LINE__)

}  // namespace Ordo

#endif
