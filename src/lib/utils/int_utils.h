/*
* (C) 2024 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_INT_UTILS_H_
#define ORDO_INT_UTILS_H_

#include <ordo/types.h>
#include <concepts>
#include <optional>

namespace Ordo {

/**
* @return a + b, or nullopt if the sum does not fit in T
*/
template <std::unsigned_integral T>
constexpr std::optional<T> checked_add(T a, T b) {
   const T r = static_cast<T>(a + b);
   if(r < a) {
      return std::nullopt;
   }
   return r;
}

/**
* @return a - b, or nullopt if b is larger than a
*/
template <std::unsigned_integral T>
constexpr std::optional<T> checked_sub(T a, T b) {
   if(b > a) {
      return std::nullopt;
   }
   return static_cast<T>(a - b);
}

}  // namespace Ordo

#endif
