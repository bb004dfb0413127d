/*
* Exceptions
* (C) 1999-2009,2018 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_EXCEPTION_H_
#define ORDO_EXCEPTION_H_

#include <ordo/types.h>
#include <exception>
#include <string>
#include <string_view>

namespace Ordo {

/**
* Different types of errors that might occur
*/
enum class ErrorType {
   /** Some unknown error */
   Unknown = 1,
   /** An internal error occurred */
   InternalError,

   /** Invalid object state */
   InvalidObjectState = 100,
   /** The application provided an argument which is invalid */
   InvalidArgument,
   /** Decoding a message or datum failed */
   DecodingFailure,
};

//! \brief Convert an ErrorType to string
std::string ORDO_PUBLIC_API(1, 0) to_string(ErrorType type);

/**
* Base class for all exceptions thrown by the library
*/
class ORDO_PUBLIC_API(1, 0) Exception : public std::exception {
   public:
      /**
      * A message meant for developers and logs. Its wording is not
      * stable across releases; match on error_type() or, for the DER
      * codec, DER_Error::kind() instead.
      */
      const char* what() const noexcept override { return m_msg.c_str(); }

      virtual ErrorType error_type() const noexcept { return ErrorType::Unknown; }

      /**
      * Avoid throwing base Exception, use a subclass
      */
      explicit Exception(std::string_view msg);

      /**
      * Avoid throwing base Exception, use a subclass
      */
      Exception(const char* prefix, std::string_view msg);

   private:
      std::string m_msg;
};

/**
* An invalid argument was provided to an API call.
*/
class ORDO_PUBLIC_API(1, 0) Invalid_Argument : public Exception {
   public:
      explicit Invalid_Argument(std::string_view msg);

      ErrorType error_type() const noexcept override { return ErrorType::InvalidArgument; }
};

/**
* A decoding error occurred.
*
* The DER codec reports every failure, encoder side included, with the
* DER_Error subclass.
*/
class ORDO_PUBLIC_API(1, 0) Decoding_Error : public Exception {
   public:
      explicit Decoding_Error(std::string_view name);

      ErrorType error_type() const noexcept override { return ErrorType::DecodingFailure; }
};

/**
* An operation was requested on an object in a state that does not
* allow it, such as taking the wrong alternative out of a Choice
*/
class ORDO_PUBLIC_API(1, 0) Invalid_State : public Exception {
   public:
      explicit Invalid_State(std::string_view err) : Exception(err) {}

      ErrorType error_type() const noexcept override { return ErrorType::InvalidObjectState; }
};

/**
* An internal error occurred. If observed, please file a bug.
*/
class ORDO_PUBLIC_API(1, 0) Internal_Error : public Exception {
   public:
      explicit Internal_Error(std::string_view err);

      ErrorType error_type() const noexcept override { return ErrorType::InternalError; }
};

}  // namespace Ordo

#endif
