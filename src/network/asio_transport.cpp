#include "chunkup/network/asio_transport.hpp"

#include <spdlog/spdlog.h>

#include <openssl/ssl.h>

#include <optional>
#include <utility>

namespace chunkup::network {
namespace {

constexpr std::size_t kWriteSliceSize = 256 * 1024;

bool is_generated_header(const std::string& name) {
    return header_name_equals(name, "Host") ||
           header_name_equals(name, "Content-Length") ||
           header_name_equals(name, "Connection") ||
           header_name_equals(name, "Transfer-Encoding");
}

/**
 * @brief Streams the body of an open connection
 *
 * Owns the connection; bytes the parser already holds are handed out before
 * the socket is read again.
 */
class AsioBodyReader : public HttpBodyReader {
public:
    AsioBodyReader(std::unique_ptr<HttpConnection> connection, HttpResponseParser parser)
        : connection_(std::move(connection))
        , parser_(std::move(parser)) {
        head_ = parser_.response();
        head_.body.clear();
    }

    const HttpResponse& head() const override { return head_; }

    Result<std::optional<Bytes>> read_some() override {
        for (;;) {
            Bytes pending = parser_.take_body();
            if (!pending.empty()) {
                return Ok(std::optional<Bytes>(std::move(pending)));
            }
            if (parser_.is_complete()) {
                connection_->close();
                return Ok(std::optional<Bytes>());
            }
            auto pumped = connection_->pump(parser_);
            if (pumped.is_error()) {
                return Err<std::optional<Bytes>>(pumped.error());
            }
        }
    }

private:
    std::unique_ptr<HttpConnection> connection_;
    HttpResponseParser parser_;
    HttpResponse head_;
};

} // namespace

std::string serialize_request_head(const HttpRequest& request, const Url& url, const std::string& user_agent) {
    std::string head = std::string(method_name(request.method)) + " " + url.target + " HTTP/1.1\r\n";
    head += "Host: " + url.host_header() + "\r\n";
    if (!request.has_header("User-Agent") && !user_agent.empty()) {
        head += "User-Agent: " + user_agent + "\r\n";
    }
    for (const auto& [name, value] : request.headers) {
        if (is_generated_header(name)) {
            continue;
        }
        head += name + ": " + value + "\r\n";
    }
    if (request.method != HttpMethod::GET || !request.body.empty()) {
        head += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
    }
    head += "Connection: close\r\n\r\n";
    return head;
}

// ──────────────────────────────────────────────────────────
// HttpConnection Implementation
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(asio::ssl::context& ssl_context, const TransportOptions& options)
    : io_context_()
    , resolver_(io_context_)
    , stream_(io_context_, ssl_context)
    , timeout_(options.timeout)
    , user_agent_(options.user_agent)
    , buffer_(options.read_buffer_size == 0 ? 4096 : options.read_buffer_size) {
}

Result<std::size_t> HttpConnection::run(const std::function<void(Completion)>& initiate,
                                        const std::string& what,
                                        bool eof_is_success) {
    boost::system::error_code result_ec;
    std::size_t transferred = 0;
    bool done = false;

    initiate([&](const boost::system::error_code& ec, std::size_t n) {
        result_ec = ec;
        transferred = n;
        done = true;
    });

    io_context_.restart();
    if (timeout_.count() > 0) {
        io_context_.run_for(timeout_);
    } else {
        io_context_.run();
    }

    if (!done) {
        // Abort the pending operation and let its handler run before the
        // locals it captured go out of scope.
        boost::system::error_code ignored;
        resolver_.cancel();
        stream_.lowest_layer().close(ignored);
        io_context_.restart();
        io_context_.run();
        return Err<std::size_t>(Error::transport(what + " to " + peer_ + " timed out after " +
                                                 std::to_string(timeout_.count()) + "ms"));
    }

    if (result_ec) {
        if (eof_is_success &&
            (result_ec == asio::error::eof || result_ec == asio::ssl::error::stream_truncated)) {
            return Ok<std::size_t>(0);
        }
        return Err<std::size_t>(Error::transport(what + " to " + peer_ + " failed: " + result_ec.message()));
    }

    return Ok(transferred);
}

Result<void> HttpConnection::connect(const Url& url) {
    tls_ = url.is_tls();
    peer_ = url.host + ":" + std::to_string(url.port);

    tcp::resolver::results_type endpoints;
    auto resolved = run([&](Completion done) {
        resolver_.async_resolve(url.host, std::to_string(url.port),
            [&endpoints, done](const boost::system::error_code& ec, tcp::resolver::results_type results) {
                endpoints = std::move(results);
                done(ec, 0);
            });
    }, "Resolve");
    if (resolved.is_error()) {
        return Err<void>(resolved.error());
    }

    auto connected = run([&](Completion done) {
        asio::async_connect(stream_.lowest_layer(), endpoints,
            [done](const boost::system::error_code& ec, const tcp::endpoint&) {
                done(ec, 0);
            });
    }, "Connect");
    if (connected.is_error()) {
        return Err<void>(connected.error());
    }

    spdlog::debug("Connected to {} ({})", peer_, tls_ ? "TLS" : "TCP");

    if (!tls_) {
        return Ok();
    }

    // SNI, required by virtually every cloud endpoint
    if (!SSL_set_tlsext_host_name(stream_.native_handle(), url.host.c_str())) {
        return Err<void>(Error::transport("Failed to set TLS server name for " + url.host));
    }
    stream_.set_verify_callback(asio::ssl::host_name_verification(url.host));

    auto handshake = run([&](Completion done) {
        stream_.async_handshake(asio::ssl::stream_base::client,
            [done](const boost::system::error_code& ec) {
                done(ec, 0);
            });
    }, "TLS handshake");
    if (handshake.is_error()) {
        return Err<void>(handshake.error());
    }
    return Ok();
}

Result<void> HttpConnection::write_request(const HttpRequest& request, const Url& url) {
    const std::string head = serialize_request_head(request, url, user_agent_);
    if (auto res = write_all(asio::buffer(head)); res.is_error()) {
        return res;
    }
    if (auto res = write_all(asio::buffer(request.body)); res.is_error()) {
        return res;
    }

    spdlog::debug("Sent {} bytes to {}", head.size() + request.body.size(), peer_);
    return Ok();
}

// One deadline per write_some: the timeout limits how long the peer may stall,
// not how long a large body may take on a slow link.
Result<void> HttpConnection::write_all(asio::const_buffer data) {
    while (data.size() > 0) {
        const asio::const_buffer slice = asio::buffer(data, kWriteSliceSize);
        auto written = run([&](Completion done) {
            if (tls_) {
                stream_.async_write_some(slice, done);
            } else {
                stream_.next_layer().async_write_some(slice, done);
            }
        }, "Write");
        if (written.is_error()) {
            return Err<void>(written.error());
        }
        data += written.value();
    }
    return Ok();
}

Result<bool> HttpConnection::pump(HttpResponseParser& parser) {
    auto received = run([&](Completion done) {
        if (tls_) {
            stream_.async_read_some(asio::buffer(buffer_), done);
        } else {
            stream_.next_layer().async_read_some(asio::buffer(buffer_), done);
        }
    }, "Read", true);
    if (received.is_error()) {
        return Err<bool>(received.error());
    }

    if (received.value() == 0) {
        auto finished = parser.finish();
        if (finished.is_error()) {
            return Err<bool>(finished.error());
        }
        return Ok(true);
    }

    return parser.parse(buffer_.data(), received.value());
}

void HttpConnection::close() {
    boost::system::error_code ignored;
    stream_.lowest_layer().shutdown(tcp::socket::shutdown_both, ignored);
    stream_.lowest_layer().close(ignored);
}

// ──────────────────────────────────────────────────────────
// AsioHttpTransport Implementation
// ──────────────────────────────────────────────────────────

AsioHttpTransport::AsioHttpTransport(TransportOptions options)
    : options_(std::move(options))
    , ssl_context_(asio::ssl::context::tls_client) {
    if (options_.verify_peer) {
        boost::system::error_code ec;
        ssl_context_.set_default_verify_paths(ec);
        if (ec) {
            spdlog::warn("Failed to load system CA certificates: {}", ec.message());
        }
        ssl_context_.set_verify_mode(asio::ssl::verify_peer);
    } else {
        ssl_context_.set_verify_mode(asio::ssl::verify_none);
    }
}

Result<std::unique_ptr<HttpConnection>> AsioHttpTransport::start(const HttpRequest& request, const Url& url) {
    auto connection = std::make_unique<HttpConnection>(ssl_context_, options_);

    if (auto res = connection->connect(url); res.is_error()) {
        return Err<std::unique_ptr<HttpConnection>>(res.error());
    }
    if (auto res = connection->write_request(request, url); res.is_error()) {
        return Err<std::unique_ptr<HttpConnection>>(res.error());
    }
    return Ok(std::move(connection));
}

Result<HttpResponse> AsioHttpTransport::send(const HttpRequest& request) {
    auto url = Url::parse(request.url);
    if (url.is_error()) {
        return Err<HttpResponse>(Error::transport(url.error().message));
    }

    auto started = start(request, url.value());
    if (started.is_error()) {
        return Err<HttpResponse>(started.error());
    }
    auto& connection = started.value();

    HttpResponseParser parser;
    for (;;) {
        auto pumped = connection->pump(parser);
        if (pumped.is_error()) {
            return Err<HttpResponse>(pumped.error());
        }
        if (pumped.value()) {
            break;
        }
    }
    connection->close();

    spdlog::debug("{} {} -> {}", method_name(request.method), request.url,
                  parser.response().status_code);
    return Ok(parser.response());
}

Result<std::unique_ptr<HttpBodyReader>> AsioHttpTransport::open(const HttpRequest& request) {
    auto url = Url::parse(request.url);
    if (url.is_error()) {
        return Err<std::unique_ptr<HttpBodyReader>>(Error::transport(url.error().message));
    }

    auto started = start(request, url.value());
    if (started.is_error()) {
        return Err<std::unique_ptr<HttpBodyReader>>(started.error());
    }
    auto connection = started.take_value();

    HttpResponseParser parser;
    while (!parser.headers_complete() && !parser.is_complete()) {
        auto pumped = connection->pump(parser);
        if (pumped.is_error()) {
            return Err<std::unique_ptr<HttpBodyReader>>(pumped.error());
        }
    }

    spdlog::debug("{} {} -> {} (streaming)", method_name(request.method), request.url,
                  parser.response().status_code);
    std::unique_ptr<HttpBodyReader> reader =
        std::make_unique<AsioBodyReader>(std::move(connection), std::move(parser));
    return Ok(std::move(reader));
}

} // namespace chunkup::network
