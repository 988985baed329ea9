#include "chunkup/upload/session_negotiator.hpp"

#include "chunkup/network/url.hpp"

#include <spdlog/spdlog.h>

namespace chunkup::upload {

using network::HttpMethod;
using network::HttpRequest;

SessionNegotiator::SessionNegotiator(network::HttpTransport& transport)
    : transport_(transport) {
}

HttpRequest SessionNegotiator::build_request(const std::string& session_endpoint,
                                             const nlohmann::json& metadata,
                                             const std::optional<std::string>& access_token) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = session_endpoint;
    request.set_header("Content-Type", "application/json");
    if (access_token && !access_token->empty()) {
        request.set_header("Authorization", "Bearer " + *access_token);
    }

    const std::string body = metadata.is_null() ? std::string("{}") : metadata.dump();
    request.body.assign(body.begin(), body.end());
    return request;
}

Result<std::string> SessionNegotiator::negotiate(const std::string& session_endpoint,
                                                 const nlohmann::json& metadata,
                                                 const std::optional<std::string>& access_token) const {
    const auto request = build_request(session_endpoint, metadata, access_token);

    auto response = transport_.send(request);
    if (response.is_error()) {
        return Err<std::string>(Error::session("Failed to open upload session: " + response.error().message));
    }

    const auto& reply = response.value();
    if (!reply.is_success()) {
        return Err<std::string>(Error::session("Upload session request was rejected",
                                               reply.status_code, parse_body(reply.body_as_string())));
    }

    const std::string location = reply.get_header("Location");
    if (location.empty()) {
        return Err<std::string>(Error::session("Upload session response has no Location header",
                                               reply.status_code, parse_body(reply.body_as_string())));
    }

    std::string session_url = location;
    if (!network::has_scheme(location)) {
        auto base = network::Url::parse(session_endpoint);
        if (base.is_ok()) {
            session_url = base.value().resolve(location);
        }
    }

    spdlog::debug("Upload session opened at {} (status {})", session_url, reply.status_code);
    return Ok(std::move(session_url));
}

} // namespace chunkup::upload
