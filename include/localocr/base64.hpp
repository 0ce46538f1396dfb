#pragma once

#include <optional>
#include <string_view>
#include <vector>

namespace localocr {

// Standard alphabet (RFC 4648). ASCII whitespace is ignored; anything else
// outside the alphabet, misplaced padding, or a truncated final quantum makes
// the whole payload invalid.
std::optional<std::vector<unsigned char>> base64_decode(std::string_view encoded);

} // namespace localocr
