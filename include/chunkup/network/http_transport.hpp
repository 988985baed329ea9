#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/network/http_types.hpp"

#include <memory>
#include <optional>

namespace chunkup::network {

/**
 * @brief Body of a response that is still arriving
 *
 * head() is available as soon as the status line and headers are in;
 * read_some() then yields body bytes in arrival order and std::nullopt once
 * the body is complete. Never yields an empty fragment.
 */
class HttpBodyReader {
public:
    virtual ~HttpBodyReader() = default;

    /// Status line and headers (body empty).
    virtual const HttpResponse& head() const = 0;

    virtual Result<std::optional<Bytes>> read_some() = 0;
};

/**
 * @brief The only way the upload pipeline talks to the network
 *
 * Implementations must not follow redirects and must not retry; both are
 * decisions of the caller.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /// Send a request and read the complete response.
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;

    /// Send a request and return as soon as the response headers arrived.
    virtual Result<std::unique_ptr<HttpBodyReader>> open(const HttpRequest& request) = 0;
};

} // namespace chunkup::network
