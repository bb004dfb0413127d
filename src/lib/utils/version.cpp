/*
* Version Information
* (C) 1999-2013,2015 Jack Lloyd
*     2025 Ordo Developers
*
* Ordo is released under the Simplified BSD License (see license.txt)
*/

#include <ordo/version.h>

#include <ordo/internal/fmt.h>

namespace Ordo {

const char* short_version_cstr() {
   return ORDO_SHORT_VERSION_STRING;
}

const char* version_cstr() {
   return ORDO_FULL_VERSION_STRING;
}

std::string version_string() {
   return version_cstr();
}

std::string short_version_string() {
   return short_version_cstr();
}

uint32_t version_datestamp() {
   return ORDO_VERSION_DATESTAMP;
}

uint32_t version_major() {
   return ORDO_VERSION_MAJOR;
}

uint32_t version_minor() {
   return ORDO_VERSION_MINOR;
}

uint32_t version_patch() {
   return ORDO_VERSION_PATCH;
}

std::string runtime_version_check(uint32_t major, uint32_t minor, uint32_t patch) {
   if(major == version_major() && minor == version_minor() && patch == version_patch()) {
      return "";
   }

   return fmt("Warning: Ordo {} was loaded, but this program was built against {}.{}.{}\n",
              short_version_cstr(),
              major,
              minor,
              patch);
}

}  // namespace Ordo
