#include "chunkup/source/url_source.hpp"

#include "chunkup/network/url.hpp"

#include <spdlog/spdlog.h>

namespace chunkup::source {

using network::HttpMethod;
using network::HttpRequest;

UrlSource::UrlSource(std::string url, network::HttpTransport& transport, int max_redirects)
    : url_(std::move(url))
    , effective_url_(url_)
    , transport_(transport)
    , max_redirects_(max_redirects) {
}

Result<std::optional<Bytes>> UrlSource::next() {
    if (ended_) {
        return Ok(std::optional<Bytes>());
    }

    if (!reader_) {
        if (auto res = open(); res.is_error()) {
            ended_ = true;
            return Err<std::optional<Bytes>>(res.error());
        }
    }

    auto fragment = reader_->read_some();
    if (fragment.is_error()) {
        ended_ = true;
        reader_.reset();
        return Err<std::optional<Bytes>>(Error::source(
            "Download from " + effective_url_ + " failed after " + std::to_string(bytes_read_) +
            " bytes: " + fragment.error().message));
    }

    if (!fragment.value()) {
        ended_ = true;
        reader_.reset();
        spdlog::debug("Download from {} finished ({} bytes)", effective_url_, bytes_read_);
        return Ok(std::optional<Bytes>());
    }

    bytes_read_ += fragment.value()->size();
    return Ok(fragment.take_value());
}

std::string UrlSource::describe() const {
    return "url:" + url_;
}

Result<void> UrlSource::open() {
    std::string current = url_;
    for (int hop = 0;; ++hop) {
        HttpRequest request;
        request.method = HttpMethod::GET;
        request.url = current;

        auto opened = transport_.open(request);
        if (opened.is_error()) {
            return Err<void>(Error::source("Failed to download " + current + ": " + opened.error().message));
        }
        auto reader = opened.take_value();
        const auto& head = reader->head();

        if (head.is_redirect() && head.has_header("Location")) {
            if (hop >= max_redirects_) {
                return Err<void>(Error::source("Too many redirects while downloading " + url_, head.status_code));
            }
            auto base = network::Url::parse(current);
            if (base.is_error()) {
                return Err<void>(Error::source(base.error().message));
            }
            const std::string next = base.value().resolve(head.get_header("Location"));
            spdlog::debug("Download redirected ({}) to {}", head.status_code, next);
            current = next;
            continue;
        }

        if (!head.is_success()) {
            return Err<void>(error_from_response(reader));
        }

        effective_url_ = current;
        reader_ = std::move(reader);
        spdlog::debug("Streaming upload content from {}", effective_url_);
        return Ok();
    }
}

Error UrlSource::error_from_response(std::unique_ptr<network::HttpBodyReader>& reader) {
    const int status = reader->head().status_code;
    std::string text;
    while (text.size() < kMaxErrorBodyBytes) {
        auto fragment = reader->read_some();
        if (fragment.is_error() || !fragment.value()) {
            break;
        }
        text.append(fragment.value()->begin(), fragment.value()->end());
    }
    return Error::source("Download of " + url_ + " returned status " + std::to_string(status),
                         status, parse_body(text));
}

} // namespace chunkup::source
