#pragma once

#include "chunkup/source/byte_source.hpp"

#include <cstdint>

namespace chunkup::source {

/**
 * @brief Streams the body of a GET response
 *
 * The request is issued on the first next() call. Redirects are followed up
 * to max_redirects hops; a final non-2xx answer becomes a Source error
 * carrying that status and the (parsed) error body.
 */
class UrlSource : public ByteSource {
public:
    static constexpr int kDefaultMaxRedirects = 5;
    static constexpr std::size_t kMaxErrorBodyBytes = 64 * 1024;

    UrlSource(std::string url, network::HttpTransport& transport, int max_redirects = kDefaultMaxRedirects);

    Result<std::optional<Bytes>> next() override;
    std::string describe() const override;

    [[nodiscard]] std::uint64_t bytes_read() const noexcept { return bytes_read_; }

    /// URL actually streamed from, after redirects.
    [[nodiscard]] const std::string& effective_url() const noexcept { return effective_url_; }

private:
    Result<void> open();
    Error error_from_response(std::unique_ptr<network::HttpBodyReader>& reader);

    std::string url_;
    std::string effective_url_;
    network::HttpTransport& transport_;
    int max_redirects_;
    std::unique_ptr<network::HttpBodyReader> reader_;
    bool ended_ = false;
    std::uint64_t bytes_read_ = 0;
};

} // namespace chunkup::source
