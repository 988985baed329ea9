#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/network/http_transport.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace chunkup::upload {

/**
 * @brief Opens a resumable upload session
 *
 * POSTs the JSON metadata to the session endpoint and returns the URL from
 * the Location header of a 2xx answer. Anything else is a Session error with
 * the response status and parsed body. Never retries.
 */
class SessionNegotiator {
public:
    explicit SessionNegotiator(network::HttpTransport& transport);

    Result<std::string> negotiate(const std::string& session_endpoint,
                                  const nlohmann::json& metadata,
                                  const std::optional<std::string>& access_token) const;

    /// The POST negotiate() sends; exposed for logging and tests.
    static network::HttpRequest build_request(const std::string& session_endpoint,
                                              const nlohmann::json& metadata,
                                              const std::optional<std::string>& access_token);

private:
    network::HttpTransport& transport_;
};

} // namespace chunkup::upload
