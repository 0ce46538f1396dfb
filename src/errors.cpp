#include "../include/localocr/errors.hpp"

namespace localocr {

std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidFormat: return "invalid-format";
    case ErrorKind::DecodeFailure: return "decode-failure";
    case ErrorKind::NotFound: return "not-found";
    case ErrorKind::Unreadable: return "unreadable";
    case ErrorKind::DownloadFailure: return "download-failure";
    case ErrorKind::DownloadTimeout: return "download-timeout";
    case ErrorKind::UnsupportedScheme: return "unsupported-scheme";
    case ErrorKind::PayloadTooLarge: return "payload-too-large";
    case ErrorKind::TempFileFailure: return "temp-file-failure";
    case ErrorKind::NoTextFound: return "no-text-found";
    case ErrorKind::ProcessingFailed: return "processing-error";
    case ErrorKind::UnknownTool: return "unknown-tool";
    case ErrorKind::MissingParameter: return "missing-parameter";
    case ErrorKind::InvalidParameter: return "invalid-parameter";
    }
    return "unknown";
}

ToolError ToolError::missing_parameter(const std::string& name) {
    return ToolError(ErrorKind::MissingParameter, "Missing required parameter: " + name);
}

ToolError ToolError::invalid_parameter(const std::string& name, const std::string& reason) {
    return ToolError(ErrorKind::InvalidParameter, "Invalid parameter '" + name + "': " + reason);
}

} // namespace localocr
