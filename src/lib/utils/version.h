/*
* Version Information
* (C) 1999-2011,2015 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#ifndef ORDO_VERSION_H_
#define ORDO_VERSION_H_

#include <ordo/types.h>
#include <string>

namespace Ordo {

/**
* A single line naming this build of Ordo, including the release type
* and, for a release, its date. No particular format should be assumed.
*/
ORDO_PUBLIC_API(1, 0) std::string version_string();

/**
* As version_string, as a pointer to a static string
*/
ORDO_PUBLIC_API(1, 0) const char* version_cstr();

/**
* The version as "MAJOR.MINOR.PATCH"
*/
ORDO_PUBLIC_API(1, 0) std::string short_version_string();

/**
* As short_version_string, as a pointer to a static string
*/
ORDO_PUBLIC_API(1, 0) const char* short_version_cstr();

/**
* @return release date as YYYYMMDD, or zero if this is not a release
*/
ORDO_PUBLIC_API(1, 0) uint32_t version_datestamp();

ORDO_PUBLIC_API(1, 0) uint32_t version_major();

ORDO_PUBLIC_API(1, 0) uint32_t version_minor();

ORDO_PUBLIC_API(1, 0) uint32_t version_patch();

/**
* Compare the version of the library loaded at runtime against the one
* an application was compiled with, given as the ORDO_VERSION_MAJOR,
* ORDO_VERSION_MINOR and ORDO_VERSION_PATCH macros.
*
* @return an empty string if the versions match, otherwise a warning
*         describing the mismatch
*/
ORDO_PUBLIC_API(1, 0) std::string runtime_version_check(uint32_t major, uint32_t minor, uint32_t patch);

}  // namespace Ordo

#endif
