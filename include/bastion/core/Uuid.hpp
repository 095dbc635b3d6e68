#pragma once

#include <string>

namespace bastion {

// RFC 4122 version-4 UUID, canonical lowercase form. Thread-safe.
std::string newUuid();

} // namespace bastion
