#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace regflow::util {

// Standard alphabet with '=' padding, as used by HTTP Basic credentials.
std::string Base64Encode(std::string_view input);

// Rejects characters outside the alphabet and data after padding; ASCII
// whitespace is ignored.
std::optional<std::string> Base64Decode(std::string_view input);

}  // namespace regflow::util
