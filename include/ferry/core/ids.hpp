#pragma once

#include <string>

namespace ferry::core {

/// Random (v4) UUID in canonical text form.
std::string generate_id();

bool is_valid_id(const std::string& text);

} // namespace ferry::core
