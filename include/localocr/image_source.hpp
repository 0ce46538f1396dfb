#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace localocr {

struct InlineData {
    std::string mime_type; // e.g. "image/png"
    std::vector<unsigned char> bytes;
};

struct LocalPath {
    std::string path;
};

struct RemoteUrl {
    std::string url;
};

using ImageReference = std::variant<InlineData, LocalPath, RemoteUrl>;

inline constexpr std::string_view kInlineImagePrefix = "data:image/";

// Ordered, purely syntactic: inline data, then http(s) URL, else a path.
// Throws ToolError (InvalidFormat, DecodeFailure) for malformed inline data.
ImageReference classify_image(const std::string& raw);

// "image/jpeg" -> "jpg"; unknown subtypes map to "png".
std::string extension_for_mime_type(std::string_view mime_type);

} // namespace localocr
