#pragma once

#include "image_source.hpp"
#include "net/http.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace localocr {

struct ResolvedImage {
    std::filesystem::path path;
    bool is_temporary = false;
};

class InputResolver {
public:
    using Fetcher = std::function<net::HttpResponse(const std::string& url)>;

    struct Options {
        std::filesystem::path temp_dir;
        long download_timeout_ms = 30000;
        std::size_t max_download_bytes = 10 * 1024 * 1024;
    };

    // An empty fetcher means net::get with the configured timeout and size cap.
    explicit InputResolver(Options options, Fetcher fetcher = Fetcher());

    ResolvedImage resolve(const std::string& raw) const;
    ResolvedImage materialize(const ImageReference& reference) const;

    // No-op for caller-owned files. Temporary files are deleted best-effort,
    // and only when they live under the temp root. Safe to call repeatedly.
    void release(const ResolvedImage& image) const noexcept;

    bool owns_path(const std::filesystem::path& path) const;
    const std::filesystem::path& temp_dir() const noexcept { return m_options.temp_dir; }

private:
    Options m_options;
    Fetcher m_fetcher;

    ResolvedImage write_temporary(const std::string& extension, std::string_view bytes) const;
    ResolvedImage resolve_inline(const InlineData& data) const;
    ResolvedImage resolve_local(const LocalPath& local) const;
    ResolvedImage resolve_remote(const RemoteUrl& remote) const;
};

// Releases the image when the owning scope exits, whichever way it exits.
class ResolvedImageGuard {
public:
    ResolvedImageGuard(const InputResolver& resolver, ResolvedImage image)
        : m_resolver(resolver), m_image(std::move(image)) {}
    ~ResolvedImageGuard() { m_resolver.release(m_image); }

    ResolvedImageGuard(const ResolvedImageGuard&) = delete;
    ResolvedImageGuard& operator=(const ResolvedImageGuard&) = delete;

    const ResolvedImage& image() const noexcept { return m_image; }

private:
    const InputResolver& m_resolver;
    ResolvedImage m_image;
};

std::string extension_for_download(const std::string& content_type, const std::string& url);

} // namespace localocr
