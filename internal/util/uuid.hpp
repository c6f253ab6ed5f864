#pragma once

#include <string>

namespace goalgraph::util {

// Fresh goal id: an RFC4122 version 4 UUID in canonical 8-4-4-4-12 form.
std::string GenerateId();

} // namespace goalgraph::util
