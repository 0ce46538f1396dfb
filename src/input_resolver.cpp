#include "../include/localocr/input_resolver.hpp"
#include "../include/localocr/errors.hpp"
#include "../include/localocr/log.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>

namespace localocr {

namespace {

constexpr const char* kTempPrefix = "local-ocr-";

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char ch) { return std::isspace(ch) != 0; });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char ch) { return std::isspace(ch) != 0; }).base();
    if (begin >= end) {
        return std::string();
    }
    return std::string(begin, end);
}

// "Image/PNG; charset=binary" -> "image/png"
std::string media_type(const std::string& content_type) {
    return to_lower(trim(content_type.substr(0, content_type.find(';'))));
}

std::string unique_token() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << rng() << std::setw(16) << rng();
    return oss.str();
}

std::string url_path_extension(const std::string& url) {
    std::size_t start = url.find("://");
    start = start == std::string::npos ? 0 : start + 3;
    const std::size_t path_start = url.find('/', start);
    if (path_start == std::string::npos) {
        return {};
    }
    const std::size_t path_end = url.find_first_of("?#", path_start);
    const std::string path = url.substr(path_start, path_end == std::string::npos ? std::string::npos : path_end - path_start);
    const std::size_t slash = path.rfind('/');
    const std::size_t dot = path.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return {};
    }
    std::string extension = to_lower(path.substr(dot + 1));
    if (extension.empty() || extension.size() > 5) {
        return {};
    }
    const bool alnum = std::all_of(extension.begin(), extension.end(), [](unsigned char c) {
        return std::isalnum(c) != 0;
    });
    return alnum ? extension : std::string();
}

} // namespace

std::string extension_for_download(const std::string& content_type, const std::string& url) {
    static const std::array<const char*, 8> known = {
        "image/jpeg", "image/jpg", "image/png", "image/gif", "image/webp", "image/bmp", "image/x-bmp", "image/tiff"};
    const std::string type = media_type(content_type);
    if (std::find(known.begin(), known.end(), type) != known.end()) {
        return extension_for_mime_type(type);
    }
    std::string from_url = url_path_extension(url);
    if (!from_url.empty()) {
        return from_url;
    }
    return "jpg";
}

InputResolver::InputResolver(Options options, Fetcher fetcher)
    : m_options(std::move(options)), m_fetcher(std::move(fetcher)) {
    if (!m_fetcher) {
        net::GetOptions get_options;
        get_options.timeout_ms = m_options.download_timeout_ms;
        get_options.max_body_bytes = m_options.max_download_bytes;
        m_fetcher = [get_options](const std::string& url) { return net::get(url, get_options); };
    }
}

ResolvedImage InputResolver::resolve(const std::string& raw) const {
    return materialize(classify_image(raw));
}

ResolvedImage InputResolver::materialize(const ImageReference& reference) const {
    return std::visit([this](const auto& source) -> ResolvedImage {
        using T = std::decay_t<decltype(source)>;
        if constexpr (std::is_same_v<T, InlineData>) {
            return resolve_inline(source);
        } else if constexpr (std::is_same_v<T, LocalPath>) {
            return resolve_local(source);
        } else {
            static_assert(std::is_same_v<T, RemoteUrl>, "unhandled image source");
            return resolve_remote(source);
        }
    }, reference);
}

ResolvedImage InputResolver::write_temporary(const std::string& extension, std::string_view bytes) const {
    std::error_code ec;
    std::filesystem::create_directories(m_options.temp_dir, ec);
    if (ec) {
        log_error("Resolver", "cannot create temp directory " + m_options.temp_dir.string() + ": " + ec.message());
        throw ToolError(ErrorKind::TempFileFailure, "Failed to create temporary file");
    }

    ResolvedImage image;
    image.path = m_options.temp_dir / (kTempPrefix + unique_token() + "." + extension);
    image.is_temporary = true;

    std::ofstream out(image.path, std::ios::binary | std::ios::trunc);
    if (out) {
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.close();
    }
    if (!out) {
        release(image);
        throw ToolError(ErrorKind::TempFileFailure, "Failed to create temporary file");
    }
    log_debug("Resolver", "wrote " + std::to_string(bytes.size()) + " bytes to " + image.path.string());
    return image;
}

ResolvedImage InputResolver::resolve_inline(const InlineData& data) const {
    const std::string_view bytes(reinterpret_cast<const char*>(data.bytes.data()), data.bytes.size());
    return write_temporary(extension_for_mime_type(data.mime_type), bytes);
}

ResolvedImage InputResolver::resolve_local(const LocalPath& local) const {
    const std::filesystem::path path(local.path);
    std::error_code ec;
    if (local.path.empty() || !std::filesystem::exists(path, ec)) {
        throw ToolError(ErrorKind::NotFound, "File not found: " + local.path);
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw ToolError(ErrorKind::Unreadable, "File is not readable: " + local.path);
    }
    std::ifstream readable(path, std::ios::binary);
    if (!readable) {
        throw ToolError(ErrorKind::Unreadable, "File is not readable: " + local.path);
    }
    ResolvedImage image;
    image.path = path;
    image.is_temporary = false;
    return image;
}

ResolvedImage InputResolver::resolve_remote(const RemoteUrl& remote) const {
    log_debug("Resolver", "downloading " + remote.url);
    net::HttpResponse response;
    try {
        response = m_fetcher(remote.url);
    } catch (const net::HttpError& ex) {
        switch (ex.reason()) {
        case net::HttpError::Reason::Timeout:
            throw ToolError(ErrorKind::DownloadTimeout,
                            "Download timed out after " + std::to_string(m_options.download_timeout_ms / 1000) +
                                " seconds: " + remote.url + " (the request may be retried)");
        case net::HttpError::Reason::TooLarge:
            throw ToolError(ErrorKind::PayloadTooLarge,
                            "Image exceeds the maximum download size of " +
                                std::to_string(m_options.max_download_bytes) + " bytes: " + remote.url);
        case net::HttpError::Reason::UnsupportedScheme:
            throw ToolError(ErrorKind::UnsupportedScheme, "Unsupported URL scheme (only http and https): " + remote.url);
        case net::HttpError::Reason::Transport:
            break;
        }
        throw ToolError(ErrorKind::DownloadFailure, std::string("Failed to download image: ") + ex.what());
    } catch (const std::exception& ex) {
        throw ToolError(ErrorKind::DownloadFailure, std::string("Failed to download image: ") + ex.what());
    }

    if (response.status < 200 || response.status >= 300) {
        throw ToolError(ErrorKind::DownloadFailure,
                        "Failed to download image: HTTP " + std::to_string(response.status) + " from " + remote.url);
    }
    const std::string type = media_type(response.content_type);
    if (!type.empty() && type.rfind("image/", 0) != 0) {
        throw ToolError(ErrorKind::DownloadFailure,
                        "URL did not return an image (Content-Type: " + type + "): " + remote.url);
    }
    if (response.body.size() > m_options.max_download_bytes) {
        throw ToolError(ErrorKind::PayloadTooLarge,
                        "Image exceeds the maximum download size of " + std::to_string(m_options.max_download_bytes) +
                            " bytes: " + remote.url);
    }
    if (response.body.empty()) {
        throw ToolError(ErrorKind::DownloadFailure, "Failed to download image: empty response from " + remote.url);
    }

    const std::string extension = extension_for_download(response.content_type, remote.url);
    return write_temporary(extension, response.body);
}

bool InputResolver::owns_path(const std::filesystem::path& path) const {
    std::filesystem::path root = m_options.temp_dir.lexically_normal();
    if (!root.has_filename()) {
        root = root.parent_path();
    }
    const std::filesystem::path candidate = path.lexically_normal();
    if (root.empty() || candidate.parent_path() != root) {
        return false;
    }
    return candidate.filename().string().rfind(kTempPrefix, 0) == 0;
}

void InputResolver::release(const ResolvedImage& image) const noexcept {
    if (!image.is_temporary) {
        return;
    }
    try {
        if (!owns_path(image.path)) {
            log_warning("Resolver", "refusing to delete path outside temp root: " + image.path.string());
            return;
        }
        std::error_code ec;
        std::filesystem::remove(image.path, ec);
        if (ec) {
            log_warning("Resolver", "could not delete " + image.path.string() + ": " + ec.message());
        }
    } catch (const std::exception& ex) {
        log_warning("Resolver", std::string("temp file cleanup failed: ") + ex.what());
    }
}

} // namespace localocr
