#pragma once

#include <string>
#include <string_view>

namespace fraud_fusion::utils {

// Strips spaces, tabs and line breaks from both ends.
std::string Trim(std::string_view s);

} // namespace fraud_fusion::utils
