#include "../include/localocr/image_source.hpp"
#include "../include/localocr/base64.hpp"
#include "../include/localocr/errors.hpp"

#include <algorithm>
#include <cctype>

namespace localocr {

namespace {

const char* const kInvalidFormatMessage = "Invalid base64 format. Expected format: data:image/xxx;base64,...";

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

InlineData decode_inline(const std::string& raw) {
    const std::size_t marker = raw.find("base64,");
    if (marker == std::string::npos) {
        throw ToolError(ErrorKind::InvalidFormat, kInvalidFormatMessage);
    }
    const std::size_t subtype_start = kInlineImagePrefix.size();
    const std::size_t subtype_end = raw.find(';', subtype_start);
    if (subtype_end == std::string::npos) {
        throw ToolError(ErrorKind::InvalidFormat, kInvalidFormatMessage);
    }

    const std::string_view payload = std::string_view(raw).substr(marker + 7);
    auto bytes = base64_decode(payload);
    if (!bytes || bytes->empty()) {
        throw ToolError(ErrorKind::DecodeFailure, "Failed to decode image data");
    }

    InlineData data;
    data.mime_type = "image/" + raw.substr(subtype_start, subtype_end - subtype_start);
    data.bytes = std::move(*bytes);
    return data;
}

} // namespace

ImageReference classify_image(const std::string& raw) {
    if (raw.rfind(kInlineImagePrefix, 0) == 0) {
        return decode_inline(raw);
    }
    if (raw.rfind("http://", 0) == 0 || raw.rfind("https://", 0) == 0) {
        return RemoteUrl{raw};
    }
    return LocalPath{raw};
}

std::string extension_for_mime_type(std::string_view mime_type) {
    std::string subtype = to_lower(mime_type);
    if (subtype.rfind("image/", 0) == 0) {
        subtype.erase(0, 6);
    }
    if (subtype == "jpeg" || subtype == "jpg") {
        return "jpg";
    }
    if (subtype == "png" || subtype == "gif" || subtype == "webp" || subtype == "tiff") {
        return subtype;
    }
    if (subtype == "bmp" || subtype == "x-bmp") {
        return "bmp";
    }
    return "png";
}

} // namespace localocr
