#pragma once

#include <string>

namespace gateway {

// Random (version 4) UUID in canonical 8-4-4-4-12 lowercase form.
std::string NewUuid();

bool LooksLikeUuid(const std::string& s);

std::string NewId(const std::string& prefix);

}  // namespace gateway
