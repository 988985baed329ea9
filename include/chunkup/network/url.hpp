#pragma once

#include "chunkup/core/result.hpp"

#include <cstdint>
#include <string>

namespace chunkup::network {

/**
 * @brief Absolute http/https URL split into the parts a client needs
 *
 * Only the forms used by upload endpoints are accepted:
 * scheme "://" host [":" port] [target]. IPv6 hosts must be bracketed.
 * Userinfo and fragments are rejected / dropped respectively.
 */
struct Url {
    std::string scheme;   // "http" or "https"
    std::string host;     // without brackets
    std::uint16_t port = 0;
    std::string target;   // path + query, always starts with '/'

    static Result<Url> parse(const std::string& text);

    [[nodiscard]] bool is_tls() const noexcept { return scheme == "https"; }
    [[nodiscard]] bool has_default_port() const noexcept;

    /// Value for the Host header (port omitted when it is the scheme default).
    [[nodiscard]] std::string host_header() const;

    /// scheme://host[:port]
    [[nodiscard]] std::string origin() const;

    [[nodiscard]] std::string to_string() const { return origin() + target; }

    /**
     * @brief Resolve a Location header value against this URL
     *
     * Anything starting with a scheme is returned unchanged; "//host/..."
     * inherits the scheme, "/path" inherits the origin, "?query" keeps this
     * URL's path and a bare relative path replaces its last segment.
     */
    [[nodiscard]] std::string resolve(const std::string& location) const;
};

/// True when `reference` starts with "scheme:" (RFC 3986), i.e. is not relative.
bool has_scheme(const std::string& reference);

} // namespace chunkup::network
