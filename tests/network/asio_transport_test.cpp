#include "chunkup/network/asio_transport.hpp"

#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using chunkup::ErrorCode;
using chunkup::network::AsioHttpTransport;
using chunkup::network::HttpMethod;
using chunkup::network::HttpRequest;
using chunkup::network::TransportOptions;
using chunkup::network::Url;

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

/**
 * Accepts connections on 127.0.0.1 one after another, records each raw
 * request and answers with the next canned response. An empty response
 * means "never answer": the connection is held until the client gives up.
 */
class LoopbackServer {
public:
    explicit LoopbackServer(std::vector<std::string> responses)
        : acceptor_(io_context_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
        , port_(acceptor_.local_endpoint().port())
        , responses_(std::move(responses)) {
        thread_ = std::thread([this] { serve(); });
    }

    ~LoopbackServer() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void wait() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(port_) + target;
    }

    const std::vector<std::string>& requests() const { return requests_; }

private:
    void serve() {
        for (const auto& response : responses_) {
            tcp::socket socket(io_context_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (ec) {
                return;
            }
            requests_.push_back(read_request(socket));

            if (response.empty()) {
                std::vector<char> sink(1024);
                while (!ec) {
                    socket.read_some(asio::buffer(sink), ec);
                }
                continue;
            }
            asio::write(socket, asio::buffer(response), ec);
            socket.shutdown(tcp::socket::shutdown_both, ec);
        }
    }

    static std::string read_request(tcp::socket& socket) {
        asio::streambuf buffer;
        boost::system::error_code ec;
        const std::size_t header_size = asio::read_until(socket, buffer, "\r\n\r\n", ec);
        if (ec) {
            return {};
        }

        std::string data(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
        const std::string head = data.substr(0, header_size);

        std::size_t content_length = 0;
        const auto pos = head.find("Content-Length: ");
        if (pos != std::string::npos) {
            content_length = std::stoul(head.substr(pos + 16, head.find("\r\n", pos) - pos - 16));
        }

        const std::size_t have = data.size() - header_size;
        if (have < content_length) {
            std::vector<char> rest(content_length - have);
            asio::read(socket, asio::buffer(rest), ec);
            data.append(rest.begin(), rest.end());
        }
        return data;
    }

    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::uint16_t port_;
    std::vector<std::string> responses_;
    std::vector<std::string> requests_;
    std::thread thread_;
};

/**
 * Accepts one request and drains its body in fixed slices with a pause
 * between them. The 308 goes out as soon as the head is read, so it is
 * already waiting when the client finishes writing.
 */
class PacedReader {
public:
    PacedReader(std::size_t slice_size, std::chrono::milliseconds pause)
        : acceptor_(io_context_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
        , port_(acceptor_.local_endpoint().port())
        , slice_size_(slice_size)
        , pause_(pause) {
        thread_ = std::thread([this] { serve(); });
    }

    ~PacedReader() { wait(); }

    void wait() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string url(const std::string& target) const {
        return "http://127.0.0.1:" + std::to_string(port_) + target;
    }

    std::size_t body_bytes() const { return body_bytes_; }

private:
    void serve() {
        tcp::socket socket(io_context_);
        boost::system::error_code ec;
        acceptor_.accept(socket, ec);
        if (ec) {
            return;
        }

        asio::streambuf buffer;
        const std::size_t header_size = asio::read_until(socket, buffer, "\r\n\r\n", ec);
        if (ec) {
            return;
        }
        const std::string head(asio::buffers_begin(buffer.data()),
                               asio::buffers_begin(buffer.data()) + header_size);
        const auto pos = head.find("Content-Length: ");
        const std::size_t content_length =
            pos == std::string::npos ? 0 : std::stoul(head.substr(pos + 16, head.find("\r\n", pos) - pos - 16));
        body_bytes_ = buffer.size() - header_size;

        const std::string response = "HTTP/1.1 308 Resume Incomplete\r\nContent-Length: 0\r\n\r\n";
        asio::write(socket, asio::buffer(response), ec);

        std::vector<char> slice(slice_size_);
        while (!ec && body_bytes_ < content_length) {
            std::this_thread::sleep_for(pause_);
            const std::size_t want = std::min(slice.size(), content_length - body_bytes_);
            body_bytes_ += asio::read(socket, asio::buffer(slice.data(), want), ec);
        }
    }

    asio::io_context io_context_;
    tcp::acceptor acceptor_;
    std::uint16_t port_;
    std::size_t slice_size_;
    std::chrono::milliseconds pause_;
    std::size_t body_bytes_ = 0;
    std::thread thread_;
};

HttpRequest make_put(const std::string& url, const std::string& range, const std::string& body) {
    HttpRequest request;
    request.method = HttpMethod::PUT;
    request.url = url;
    request.set_header("Content-Range", range);
    request.body.assign(body.begin(), body.end());
    return request;
}

} // namespace

TEST(SerializeRequestHeadTest, GeneratesFramingHeaders) {
    auto url = Url::parse("http://upload.example.com:8080/session?id=9");
    ASSERT_TRUE(url.is_ok());

    auto request = make_put(url.value().to_string(), "bytes 0-3/8", "abcd");
    request.set_header("Content-Length", "999");
    request.set_header("Host", "spoofed");

    const auto head = chunkup::network::serialize_request_head(request, url.value(), "chunkup-test");

    EXPECT_EQ(head.rfind("PUT /session?id=9 HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(head.find("Host: upload.example.com:8080\r\n"), std::string::npos);
    EXPECT_NE(head.find("Content-Length: 4\r\n"), std::string::npos);
    EXPECT_NE(head.find("Content-Range: bytes 0-3/8\r\n"), std::string::npos);
    EXPECT_NE(head.find("User-Agent: chunkup-test\r\n"), std::string::npos);
    EXPECT_EQ(head.find("999"), std::string::npos);
    EXPECT_EQ(head.find("spoofed"), std::string::npos);
    const std::string tail = "Connection: close\r\n\r\n";
    EXPECT_EQ(head.substr(head.size() - tail.size()), tail);
}

TEST(SerializeRequestHeadTest, GetWithoutBodyHasNoContentLength) {
    auto url = Url::parse("https://files.example.com/big.bin");
    ASSERT_TRUE(url.is_ok());

    HttpRequest request;
    request.url = url.value().to_string();

    const auto head = chunkup::network::serialize_request_head(request, url.value(), "");
    EXPECT_EQ(head.find("Content-Length"), std::string::npos);
    EXPECT_NE(head.find("Host: files.example.com\r\n"), std::string::npos);
}

TEST(AsioHttpTransportTest, SendsChunkAndReadsResumeIncomplete) {
    LoopbackServer server({
        "HTTP/1.1 308 Resume Incomplete\r\nRange: bytes=0-3\r\nContent-Length: 0\r\n\r\n"
    });

    AsioHttpTransport transport;
    auto response = transport.send(make_put(server.url("/upload?id=1"), "bytes 0-3/8", "abcd"));
    server.wait();

    ASSERT_TRUE(response.is_ok()) << response.error().describe();
    EXPECT_EQ(response.value().status_code, 308);
    EXPECT_EQ(response.value().get_header("range"), "bytes=0-3");

    ASSERT_EQ(server.requests().size(), 1u);
    const auto& raw = server.requests()[0];
    EXPECT_EQ(raw.rfind("PUT /upload?id=1 HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(raw.find("Content-Range: bytes 0-3/8\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Content-Length: 4\r\n"), std::string::npos);
    EXPECT_NE(raw.find("Connection: close\r\n"), std::string::npos);
    EXPECT_EQ(raw.substr(raw.size() - 4), "abcd");
}

TEST(AsioHttpTransportTest, ReadsChunkedResponseBody) {
    LoopbackServer server({
        "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nTransfer-Encoding: chunked\r\n\r\n"
        "7\r\n{\"id\":1\r\n1\r\n}\r\n0\r\n\r\n"
    });

    AsioHttpTransport transport;
    auto response = transport.send(make_put(server.url("/upload"), "bytes 4-7/8", "efgh"));
    server.wait();

    ASSERT_TRUE(response.is_ok()) << response.error().describe();
    EXPECT_EQ(response.value().status_code, 200);
    EXPECT_EQ(response.value().body_as_string(), "{\"id\":1}");
}

TEST(AsioHttpTransportTest, StreamsCloseDelimitedBody) {
    const std::string payload(200000, 'x');
    LoopbackServer server({"HTTP/1.0 200 OK\r\n\r\n" + payload});

    AsioHttpTransport transport;
    HttpRequest request;
    request.url = server.url("/big.bin");

    auto opened = transport.open(request);
    ASSERT_TRUE(opened.is_ok()) << opened.error().describe();
    auto reader = opened.take_value();
    EXPECT_EQ(reader->head().status_code, 200);

    std::string received;
    for (;;) {
        auto fragment = reader->read_some();
        ASSERT_TRUE(fragment.is_ok()) << fragment.error().describe();
        if (!fragment.value()) {
            break;
        }
        EXPECT_FALSE(fragment.value()->empty());
        received.append(fragment.value()->begin(), fragment.value()->end());
    }
    server.wait();

    EXPECT_EQ(received, payload);
    ASSERT_EQ(server.requests().size(), 1u);
    EXPECT_EQ(server.requests()[0].rfind("GET /big.bin HTTP/1.1\r\n", 0), 0u);
}

TEST(AsioHttpTransportTest, RefusedConnectionIsTransportError) {
    std::uint16_t port = 0;
    {
        asio::io_context io;
        tcp::acceptor acceptor(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        port = acceptor.local_endpoint().port();
    }

    AsioHttpTransport transport;
    auto response = transport.send(make_put("http://127.0.0.1:" + std::to_string(port) + "/x", "bytes 0-0/1", "a"));

    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().code, ErrorCode::Transport);
}

TEST(AsioHttpTransportTest, SilentPeerTimesOut) {
    LoopbackServer server({""});

    TransportOptions options;
    options.timeout = std::chrono::milliseconds{200};
    AsioHttpTransport transport(options);

    auto response = transport.send(make_put(server.url("/slow"), "bytes 0-0/1", "a"));

    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().code, ErrorCode::Transport);
    EXPECT_NE(response.error().message.find("timed out"), std::string::npos);
}

TEST(AsioHttpTransportTest, SlowSteadyPeerOutlastsPerOperationTimeout) {
    // ~6 MB/s against a 1 s limit: the whole body takes well over a second,
    // but no single write waits that long.
    PacedReader server(64 * 1024, std::chrono::milliseconds{10});

    TransportOptions options;
    options.timeout = std::chrono::milliseconds{1000};
    AsioHttpTransport transport(options);

    const std::string body(16 * 1024 * 1024, 'x');
    auto response = transport.send(make_put(server.url("/upload"), "bytes 0-16777215/33554432", body));
    server.wait();

    ASSERT_TRUE(response.is_ok()) << response.error().describe();
    EXPECT_EQ(response.value().status_code, 308);
    EXPECT_EQ(server.body_bytes(), body.size());
}

TEST(AsioHttpTransportTest, TruncatedResponseIsProtocolError) {
    LoopbackServer server({"HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nshort"});

    AsioHttpTransport transport;
    auto response = transport.send(make_put(server.url("/upload"), "bytes 0-0/1", "a"));
    server.wait();

    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().code, ErrorCode::Protocol);
}

TEST(AsioHttpTransportTest, InvalidUrlIsRejectedWithoutConnecting) {
    AsioHttpTransport transport;
    auto response = transport.send(make_put("ftp://example.com/x", "bytes 0-0/1", "a"));

    ASSERT_TRUE(response.is_error());
    EXPECT_EQ(response.error().code, ErrorCode::Transport);
}
