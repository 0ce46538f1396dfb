#include "localocr/errors.hpp"
#include "localocr/input_resolver.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace localocr;
namespace fs = std::filesystem;

namespace {

fs::path make_scratch_dir(const std::string& label) {
    std::random_device rd;
    fs::path dir = fs::temp_directory_path() / ("localocr-test-" + label + "-" + std::to_string(rd()));
    fs::create_directories(dir);
    return dir;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::size_t count_entries(const fs::path& dir) {
    if (!fs::exists(dir)) {
        return 0;
    }
    return static_cast<std::size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator()));
}

class InputResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_scratch = make_scratch_dir("resolver");
        m_options.temp_dir = m_scratch / "temp";
        m_options.max_download_bytes = 64;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(m_scratch, ec);
    }

    InputResolver resolver_with(net::HttpResponse response) {
        return InputResolver(m_options, [response, this](const std::string& url) {
            m_fetched.push_back(url);
            return response;
        });
    }

    ErrorKind resolve_error(const InputResolver& resolver, const std::string& raw, std::string* message = nullptr) {
        try {
            resolver.resolve(raw);
        } catch (const ToolError& ex) {
            if (message) {
                *message = ex.what();
            }
            return ex.kind();
        }
        ADD_FAILURE() << "expected resolve to throw for " << raw;
        return ErrorKind::ProcessingFailed;
    }

    fs::path m_scratch;
    InputResolver::Options m_options;
    std::vector<std::string> m_fetched;
};

} // namespace

TEST_F(InputResolverTest, InlineImageIsWrittenToTempFileAndReleased) {
    InputResolver resolver(m_options);
    const ResolvedImage image = resolver.resolve("data:image/png;base64,UE5HREFUQQ==");

    EXPECT_TRUE(image.is_temporary);
    EXPECT_EQ(image.path.parent_path(), m_options.temp_dir);
    EXPECT_EQ(image.path.extension(), ".png");
    EXPECT_EQ(image.path.filename().string().rfind("local-ocr-", 0), 0u);
    EXPECT_EQ(read_file(image.path), "PNGDATA");

    resolver.release(image);
    EXPECT_FALSE(fs::exists(image.path));
    resolver.release(image);
}

TEST_F(InputResolverTest, TempFileNamesAreUnique) {
    InputResolver resolver(m_options);
    const ResolvedImage first = resolver.resolve("data:image/jpeg;base64,UE5HREFUQQ==");
    const ResolvedImage second = resolver.resolve("data:image/jpeg;base64,UE5HREFUQQ==");
    EXPECT_NE(first.path, second.path);
    EXPECT_EQ(first.path.extension(), ".jpg");
    resolver.release(first);
    resolver.release(second);
    EXPECT_EQ(count_entries(m_options.temp_dir), 0u);
}

TEST_F(InputResolverTest, LocalFileIsUsedInPlaceAndNeverDeleted) {
    const fs::path file = m_scratch / "shot.png";
    std::ofstream(file) << "pixels";

    InputResolver resolver(m_options);
    const ResolvedImage image = resolver.resolve(file.string());
    EXPECT_FALSE(image.is_temporary);
    EXPECT_EQ(image.path, file);

    resolver.release(image);
    resolver.release(image);
    EXPECT_TRUE(fs::exists(file));
    EXPECT_EQ(read_file(file), "pixels");
}

TEST_F(InputResolverTest, MissingLocalFileIsNotFound) {
    InputResolver resolver(m_options);
    const std::string missing = (m_scratch / "nope.png").string();
    std::string message;
    EXPECT_EQ(resolve_error(resolver, missing, &message), ErrorKind::NotFound);
    EXPECT_EQ(message, "File not found: " + missing);
}

TEST_F(InputResolverTest, DirectoryIsUnreadable) {
    InputResolver resolver(m_options);
    EXPECT_EQ(resolve_error(resolver, m_scratch.string()), ErrorKind::Unreadable);
}

TEST_F(InputResolverTest, RemoteImageIsDownloadedToTempFile) {
    InputResolver resolver = resolver_with({200, "image/webp", "remote-bytes"});
    const ResolvedImage image = resolver.resolve("https://example.com/pic");

    ASSERT_EQ(m_fetched.size(), 1u);
    EXPECT_EQ(m_fetched.front(), "https://example.com/pic");
    EXPECT_TRUE(image.is_temporary);
    EXPECT_EQ(image.path.extension(), ".webp");
    EXPECT_EQ(read_file(image.path), "remote-bytes");
    resolver.release(image);
    EXPECT_FALSE(fs::exists(image.path));
}

TEST_F(InputResolverTest, HighAndNulBytesSurviveTheTempFile) {
    const std::string png_header("\x89PNG\r\n\x1a\n\0\xff", 10);
    InputResolver remote = resolver_with({200, "image/png", png_header});
    const ResolvedImage downloaded = remote.resolve("https://example.com/header.png");
    EXPECT_EQ(read_file(downloaded.path), png_header);
    remote.release(downloaded);

    // "/9j/4AA=" is the start of a JPEG stream: FF D8 FF E0 00.
    InputResolver resolver(m_options);
    const ResolvedImage inline_image = resolver.resolve("data:image/jpeg;base64,/9j/4AA=");
    EXPECT_EQ(read_file(inline_image.path), std::string("\xff\xd8\xff\xe0\0", 5));
    resolver.release(inline_image);
}

TEST_F(InputResolverTest, NonImageContentTypeLeavesNoTempFile) {
    InputResolver resolver = resolver_with({200, "text/html; charset=utf-8", "<html></html>"});
    std::string message;
    EXPECT_EQ(resolve_error(resolver, "https://example.com/page", &message), ErrorKind::DownloadFailure);
    EXPECT_NE(message.find("text/html"), std::string::npos);
    EXPECT_EQ(count_entries(m_options.temp_dir), 0u);
}

TEST_F(InputResolverTest, HttpErrorStatusIsDownloadFailure) {
    InputResolver resolver = resolver_with({404, "image/png", "missing"});
    std::string message;
    EXPECT_EQ(resolve_error(resolver, "http://example.com/a.png", &message), ErrorKind::DownloadFailure);
    EXPECT_NE(message.find("HTTP 404"), std::string::npos);
}

TEST_F(InputResolverTest, OversizeBodyIsRejected) {
    InputResolver resolver = resolver_with({200, "image/png", std::string(65, 'x')});
    EXPECT_EQ(resolve_error(resolver, "https://example.com/a.png"), ErrorKind::PayloadTooLarge);
    EXPECT_EQ(count_entries(m_options.temp_dir), 0u);
}

TEST_F(InputResolverTest, TransportErrorsAreMapped) {
    const auto failing = [this](net::HttpError::Reason reason) {
        return InputResolver(m_options, [reason](const std::string&) -> net::HttpResponse {
            throw net::HttpError(reason, "boom");
        });
    };
    std::string message;
    EXPECT_EQ(resolve_error(failing(net::HttpError::Reason::Timeout), "https://slow.example", &message),
              ErrorKind::DownloadTimeout);
    EXPECT_NE(message.find("retried"), std::string::npos);
    EXPECT_EQ(resolve_error(failing(net::HttpError::Reason::TooLarge), "https://big.example"),
              ErrorKind::PayloadTooLarge);
    EXPECT_EQ(resolve_error(failing(net::HttpError::Reason::Transport), "https://down.example"),
              ErrorKind::DownloadFailure);
}

TEST_F(InputResolverTest, ReleaseRefusesPathsOutsideTempRoot) {
    const fs::path outside = m_scratch / "local-ocr-keep.png";
    std::ofstream(outside) << "keep";

    InputResolver resolver(m_options);
    resolver.release(ResolvedImage{outside, true});
    EXPECT_TRUE(fs::exists(outside));
    EXPECT_FALSE(resolver.owns_path(outside));
    EXPECT_TRUE(resolver.owns_path(m_options.temp_dir / "local-ocr-abc.png"));
    EXPECT_FALSE(resolver.owns_path(m_options.temp_dir / "other.png"));
}

TEST_F(InputResolverTest, GuardReleasesWhenScopeUnwinds) {
    InputResolver resolver(m_options);
    fs::path path;
    try {
        ResolvedImageGuard guard(resolver, resolver.resolve("data:image/png;base64,UE5HREFUQQ=="));
        path = guard.image().path;
        ASSERT_TRUE(fs::exists(path));
        throw std::runtime_error("engine exploded");
    } catch (const std::runtime_error&) {
    }
    EXPECT_FALSE(fs::exists(path));
}

TEST(DownloadExtensionTest, PrefersContentTypeThenUrl) {
    EXPECT_EQ(extension_for_download("image/jpeg", "https://example.com/a.png"), "jpg");
    EXPECT_EQ(extension_for_download("", "https://example.com/dir/Photo.PNG?size=2"), "png");
    EXPECT_EQ(extension_for_download("application/octet-stream", "https://example.com/noext"), "jpg");
    EXPECT_EQ(extension_for_download("", "https://example.com/v1.2/img"), "jpg");
}
