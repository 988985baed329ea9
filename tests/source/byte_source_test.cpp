#include "chunkup/source/byte_source.hpp"
#include "chunkup/source/file_source.hpp"
#include "chunkup/source/url_source.hpp"

#include "../support/fake_transport.hpp"
#include "../support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <string>

using chunkup::ErrorCode;
using chunkup::network::HttpMethod;
using chunkup::source::ByteSource;
using chunkup::source::FileSource;
using chunkup::source::SourceSpec;
using chunkup::source::UrlSource;
using chunkup::test::FakeTransport;
using chunkup::test::make_response;

namespace fs = std::filesystem;

namespace {

/// Drain a source, failing the test on error.
std::string read_all(ByteSource& source, std::size_t* fragments = nullptr) {
    std::string out;
    std::size_t count = 0;
    for (;;) {
        auto fragment = source.next();
        EXPECT_TRUE(fragment.is_ok());
        if (fragment.is_error() || !fragment.value()) {
            break;
        }
        EXPECT_FALSE(fragment.value()->empty());
        out.append(fragment.value()->begin(), fragment.value()->end());
        ++count;
    }
    if (fragments != nullptr) {
        *fragments = count;
    }
    return out;
}

} // namespace

class FileSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = chunkup::test::create_temp_dir();
    }

    void TearDown() override {
        if (!root_.empty()) {
            fs::remove_all(root_);
        }
    }

    fs::path root_;
};

TEST_F(FileSourceTest, ReadsWholeFileInFragments) {
    const auto content = chunkup::test::pattern_bytes(10000);
    const auto path = root_ / "payload.bin";
    chunkup::test::write_file(path, content);

    FileSource source(path, 4096);
    std::size_t fragments = 0;
    EXPECT_EQ(read_all(source, &fragments), content);
    EXPECT_EQ(fragments, 3u);
    EXPECT_EQ(source.bytes_read(), 10000u);

    // Stays exhausted
    auto again = source.next();
    ASSERT_TRUE(again.is_ok());
    EXPECT_FALSE(again.value().has_value());
}

TEST_F(FileSourceTest, EmptyFileEndsImmediately) {
    const auto path = root_ / "empty.bin";
    chunkup::test::write_file(path, "");

    FileSource source(path);
    auto first = source.next();
    ASSERT_TRUE(first.is_ok());
    EXPECT_FALSE(first.value().has_value());
}

TEST_F(FileSourceTest, MissingFileIsSourceError) {
    FileSource source(root_ / "does-not-exist.bin");

    auto first = source.next();
    ASSERT_TRUE(first.is_error());
    EXPECT_EQ(first.error().code, ErrorCode::Source);
    EXPECT_EQ(source.describe(), "file:" + (root_ / "does-not-exist.bin").string());
}

TEST(UrlSourceTest, StreamsResponseBody) {
    FakeTransport transport;
    transport.push_stream(make_response(200), {"hello ", "chunked ", "world"});

    UrlSource source("https://files.example.com/data.bin", transport);
    EXPECT_EQ(read_all(source), "hello chunked world");
    EXPECT_EQ(source.bytes_read(), 19u);

    ASSERT_EQ(transport.opened.size(), 1u);
    EXPECT_EQ(transport.opened[0].method, HttpMethod::GET);
    EXPECT_EQ(transport.opened[0].url, "https://files.example.com/data.bin");
    EXPECT_TRUE(transport.sent.empty());
}

TEST(UrlSourceTest, NothingIsRequestedBeforeFirstRead) {
    FakeTransport transport;
    UrlSource source("https://files.example.com/data.bin", transport);

    EXPECT_TRUE(transport.requests.empty());
    EXPECT_EQ(source.describe(), "url:https://files.example.com/data.bin");
}

TEST(UrlSourceTest, FollowsRedirects) {
    FakeTransport transport;
    transport.push_stream(make_response(302, "", {{"Location", "/mirror/data.bin"}}), {});
    transport.push_stream(make_response(307, "", {{"location", "https://cdn.example.net/data.bin"}}), {});
    transport.push_stream(make_response(200), {"payload"});

    UrlSource source("https://files.example.com/data.bin", transport);
    EXPECT_EQ(read_all(source), "payload");
    EXPECT_EQ(source.effective_url(), "https://cdn.example.net/data.bin");

    ASSERT_EQ(transport.opened.size(), 3u);
    EXPECT_EQ(transport.opened[1].url, "https://files.example.com/mirror/data.bin");
    EXPECT_EQ(transport.opened[2].url, "https://cdn.example.net/data.bin");
}

TEST(UrlSourceTest, StopsAfterTooManyRedirects) {
    FakeTransport transport;
    for (int i = 0; i < 3; ++i) {
        transport.push_stream(make_response(301, "", {{"Location", "/loop"}}), {});
    }

    UrlSource source("http://files.example.com/loop", transport, 2);
    auto first = source.next();
    ASSERT_TRUE(first.is_error());
    EXPECT_EQ(first.error().code, ErrorCode::Source);
    EXPECT_EQ(first.error().status, 301);
    EXPECT_EQ(transport.opened.size(), 3u);
}

TEST(UrlSourceTest, ErrorStatusCarriesBody) {
    FakeTransport transport;
    transport.push_stream(make_response(404, R"({"error":"not found"})"), {});

    UrlSource source("https://files.example.com/missing.bin", transport);
    auto first = source.next();
    ASSERT_TRUE(first.is_error());
    EXPECT_EQ(first.error().code, ErrorCode::Source);
    EXPECT_EQ(first.error().status, 404);
    EXPECT_EQ(first.error().body["error"], "not found");

    // The failure is final
    auto again = source.next();
    ASSERT_TRUE(again.is_ok());
    EXPECT_FALSE(again.value().has_value());
}

TEST(UrlSourceTest, ConnectionFailureIsSourceError) {
    FakeTransport transport;
    transport.push_open_error(chunkup::Error::transport("Connect to files.example.com:443 failed"));

    UrlSource source("https://files.example.com/data.bin", transport);
    auto first = source.next();
    ASSERT_TRUE(first.is_error());
    EXPECT_EQ(first.error().code, ErrorCode::Source);
    EXPECT_NE(first.error().message.find("Connect to files.example.com:443 failed"), std::string::npos);
}

TEST(UrlSourceTest, MidStreamFailureIsSourceError) {
    FakeTransport transport;
    transport.push_stream(make_response(200), {"partial"}, chunkup::Error::transport("Read timed out"));

    UrlSource source("https://files.example.com/data.bin", transport);
    auto first = source.next();
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(first.value().has_value());

    auto second = source.next();
    ASSERT_TRUE(second.is_error());
    EXPECT_EQ(second.error().code, ErrorCode::Source);
    EXPECT_EQ(source.bytes_read(), 7u);
}

TEST(MakeByteSourceTest, RequiresExactlyOneSource) {
    FakeTransport transport;

    auto neither = chunkup::source::make_byte_source(SourceSpec{}, transport);
    ASSERT_TRUE(neither.is_error());
    EXPECT_EQ(neither.error().code, ErrorCode::Config);

    auto both = chunkup::source::make_byte_source(SourceSpec{"/tmp/a.bin", "https://x.example/a"}, transport);
    ASSERT_TRUE(both.is_error());
    EXPECT_EQ(both.error().code, ErrorCode::Config);

    auto file = chunkup::source::make_byte_source(SourceSpec{"/tmp/a.bin", ""}, transport);
    ASSERT_TRUE(file.is_ok());
    EXPECT_EQ(file.value()->describe(), "file:/tmp/a.bin");

    auto url = chunkup::source::make_byte_source(SourceSpec{"", "https://x.example/a"}, transport);
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value()->describe(), "url:https://x.example/a");

    EXPECT_TRUE(transport.requests.empty());
}
