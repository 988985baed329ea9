#pragma once

#include "chunkup/network/http_parser.hpp"
#include "chunkup/network/http_transport.hpp"
#include "chunkup/network/url.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace chunkup::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct TransportOptions {
    /// Upper bound for every single network operation (resolve, connect,
    /// handshake, one partial write, one read), so a peer that keeps
    /// accepting bytes never times out. Zero disables the limit.
    std::chrono::milliseconds timeout{60000};
    bool verify_peer = true;
    std::size_t read_buffer_size = 64 * 1024;
    std::string user_agent = "chunkup/1.0";
};

/**
 * @brief Request line and header block for one request, CRLF terminated
 *
 * Host, Content-Length and Connection are always generated here; values the
 * caller put in request.headers for those names are ignored. GET requests
 * carry no Content-Length.
 */
std::string serialize_request_head(const HttpRequest& request, const Url& url, const std::string& user_agent);

/**
 * @brief One request/response exchange over TCP or TLS
 *
 * Each operation is started asynchronously and the private io_context is run
 * until it completes or the timeout expires; on expiry the socket is closed
 * so the pending operation aborts. Connections are never reused.
 */
class HttpConnection {
public:
    HttpConnection(asio::ssl::context& ssl_context, const TransportOptions& options);

    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    Result<void> connect(const Url& url);
    Result<void> write_request(const HttpRequest& request, const Url& url);

    /**
     * @brief Read once from the peer and feed the parser
     *
     * @return true when the parser holds a complete response
     */
    Result<bool> pump(HttpResponseParser& parser);

    void close();

private:
    using Completion = std::function<void(const boost::system::error_code&, std::size_t)>;

    Result<std::size_t> run(const std::function<void(Completion)>& initiate,
                            const std::string& what,
                            bool eof_is_success = false);

    Result<void> write_all(asio::const_buffer data);

    asio::io_context io_context_;
    tcp::resolver resolver_;
    asio::ssl::stream<tcp::socket> stream_;
    std::chrono::milliseconds timeout_;
    std::string user_agent_;
    std::vector<char> buffer_;
    bool tls_ = false;
    std::string peer_;
};

/**
 * @brief Production HttpTransport on Boost.Asio
 *
 * http and https URLs; TLS peers are verified against the system trust store
 * unless TransportOptions::verify_peer is false.
 */
class AsioHttpTransport : public HttpTransport {
public:
    explicit AsioHttpTransport(TransportOptions options = {});

    Result<HttpResponse> send(const HttpRequest& request) override;
    Result<std::unique_ptr<HttpBodyReader>> open(const HttpRequest& request) override;

private:
    Result<std::unique_ptr<HttpConnection>> start(const HttpRequest& request, const Url& url);

    TransportOptions options_;
    asio::ssl::context ssl_context_;
};

} // namespace chunkup::network
