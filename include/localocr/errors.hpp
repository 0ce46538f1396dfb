#pragma once

#include <stdexcept>
#include <string>

namespace localocr {

enum class ErrorKind {
    InvalidFormat,
    DecodeFailure,
    NotFound,
    Unreadable,
    DownloadFailure,
    DownloadTimeout,
    UnsupportedScheme,
    PayloadTooLarge,
    TempFileFailure,
    NoTextFound,
    ProcessingFailed,
    UnknownTool,
    MissingParameter,
    InvalidParameter
};

std::string error_kind_to_string(ErrorKind kind);

// Raised anywhere along resolve -> OCR -> result; reported to the caller as
// an isError tool result, never as a process failure.
class ToolError : public std::runtime_error {
public:
    ToolError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const noexcept { return m_kind; }

    static ToolError missing_parameter(const std::string& name);
    static ToolError invalid_parameter(const std::string& name, const std::string& reason);

private:
    ErrorKind m_kind;
};

} // namespace localocr
