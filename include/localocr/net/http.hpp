#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace localocr::net {

struct HttpResponse {
    long status = 0;
    std::string content_type;
    std::string body;
};

struct GetOptions {
    long timeout_ms = 30000;
    std::size_t max_body_bytes = 10 * 1024 * 1024;
};

class HttpError : public std::runtime_error {
public:
    enum class Reason {
        Timeout,
        TooLarge,
        UnsupportedScheme,
        Transport
    };

    HttpError(Reason reason, const std::string& message)
        : std::runtime_error(message), m_reason(reason) {}

    Reason reason() const noexcept { return m_reason; }

private:
    Reason m_reason;
};

// Follows redirects over http/https only. Any status is returned; only
// transport-level failures throw.
HttpResponse get(const std::string& url, const GetOptions& options = GetOptions());

} // namespace localocr::net
