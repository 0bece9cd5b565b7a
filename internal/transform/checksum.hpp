#pragma once

#include <string>
#include <string_view>

namespace relay::transform {

// Lowercase hex SHA-256 of data.
std::string Sha256Hex(std::string_view data);

} // namespace relay::transform
