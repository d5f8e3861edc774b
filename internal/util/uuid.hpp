#pragma once

#include <string>

namespace cms::util {

/*
  Random RFC4122 version 4 identifier in canonical 8-4-4-4-12 form.
  Used for upload session handles, which are never persisted.
*/
std::string RandomUuid();

} // namespace cms::util
