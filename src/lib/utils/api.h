/*
* (C) 2016,2025 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_API_ANNOTATIONS_H_
#define ORDO_API_ANNOTATIONS_H_

#include <ordo/build.h>

/*
* Symbol visibility for shared library builds
*/
#if defined(ORDO_SHARED_BUILD) && (defined(__GNUC__) || defined(__clang__))
   #define ORDO_DLL __attribute__((visibility("default")))
#elif defined(ORDO_SHARED_BUILD) && defined(_MSC_VER) && defined(ORDO_IS_BEING_BUILT)
   #define ORDO_DLL __declspec(dllexport)
#elif defined(ORDO_SHARED_BUILD) && defined(_MSC_VER)
   #define ORDO_DLL __declspec(dllimport)
#else
   #define ORDO_DLL
#endif

/**
* Marks a supported public API, first released in version maj.min. It
* changes incompatibly only in a new major version.
*/
#define ORDO_PUBLIC_API(maj, min) ORDO_DLL

/**
* Marks an exported API which applications may call but which may
* change in any release, such as the helpers behind ORDO_ARG_CHECK
*/
#define ORDO_UNSTABLE_API ORDO_DLL

/**
* Marks internal functions exported only so ordo_tests can link
* against a shared build
*/
#define ORDO_TEST_API ORDO_DLL

#endif
