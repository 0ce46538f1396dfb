#include "../../include/localocr/net/http.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

using localocr::net::HttpError;

class CurlGlobal {
public:
    CurlGlobal() {
        const CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    }

    ~CurlGlobal() {
        curl_global_cleanup();
    }

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

void ensure_curl_global() {
    static CurlGlobal global;
}

struct BodySink {
    std::string* buffer = nullptr;
    std::size_t limit = 0;
    bool overflowed = false;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* sink = static_cast<BodySink*>(userdata);
    if (sink->buffer->size() + total > sink->limit) {
        sink->overflowed = true;
        return 0; // aborts the transfer with CURLE_WRITE_ERROR
    }
    sink->buffer->append(ptr, total);
    return total;
}

bool has_http_scheme(const std::string& url) {
    std::string prefix = url.substr(0, 8);
    std::transform(prefix.begin(), prefix.end(), prefix.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return prefix.rfind("http://", 0) == 0 || prefix.rfind("https://", 0) == 0;
}

[[noreturn]] void throw_transfer_error(const std::string& url, CURLcode code, bool overflowed, long timeout_ms) {
    std::ostringstream oss;
    oss << "[http] GET " << url << " failed ";
    switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
        oss << "after " << timeout_ms << " ms (timeout)";
        throw HttpError(HttpError::Reason::Timeout, oss.str());
    case CURLE_FILESIZE_EXCEEDED:
        oss << "(response exceeds size limit)";
        throw HttpError(HttpError::Reason::TooLarge, oss.str());
    case CURLE_WRITE_ERROR:
        if (overflowed) {
            oss << "(response exceeds size limit)";
            throw HttpError(HttpError::Reason::TooLarge, oss.str());
        }
        break;
    case CURLE_UNSUPPORTED_PROTOCOL:
        oss << curl_easy_strerror(code);
        throw HttpError(HttpError::Reason::UnsupportedScheme, oss.str());
    default:
        break;
    }
    oss << curl_easy_strerror(code);
    throw HttpError(HttpError::Reason::Transport, oss.str());
}

} // namespace

namespace localocr::net {

HttpResponse get(const std::string& url, const GetOptions& options) {
    if (!has_http_scheme(url)) {
        throw HttpError(HttpError::Reason::UnsupportedScheme, "[http] only http and https URLs are supported: " + url);
    }

    ensure_curl_global();

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> handle(curl_easy_init(), curl_easy_cleanup);
    if (!handle) {
        throw std::runtime_error("curl_easy_init failed");
    }

    HttpResponse response;
    BodySink sink;
    sink.buffer = &response.body;
    sink.limit = options.max_body_bytes;

    CURL* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, static_cast<long>(CURLPROTO_HTTP | CURLPROTO_HTTPS));
#endif
    curl_easy_setopt(curl, CURLOPT_MAXCONNECTS, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, options.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(options.max_body_bytes));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "local-ocr/1.0");
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);

    const CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        throw_transfer_error(url, code, sink.overflowed, options.timeout_ms);
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    char* content_type = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
        response.content_type = content_type;
    }
    return response;
}

} // namespace localocr::net
