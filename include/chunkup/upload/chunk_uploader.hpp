#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/network/http_transport.hpp"
#include "chunkup/upload/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace chunkup::upload {

using network::Bytes;

/// 308: the chunk is stored, send the next one.
struct ContinueTransition {
    std::int64_t bytes_confirmed = 0;
};

/// 200: the server assembled the whole upload.
struct DoneTransition {
    UploadResult result;
};

/// Retries exhausted (FatalChunk) or the chunk could not be sent at all.
struct FailedTransition {
    Error error;
};

using Transition = std::variant<ContinueTransition, DoneTransition, FailedTransition>;

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Sends one chunk and turns the server's answer into a Transition
 *
 * The request is built once (PUT session_url, Content-Range from
 * bytes_confirmed) and resent unchanged on every retry. Completion is
 * decided by the status code alone: 200 is Done, 308 is Continue, anything
 * else (or a transport failure) is retried until the policy runs out.
 */
class ChunkUploader {
public:
    ChunkUploader(network::HttpTransport& transport,
                  events::EventBus& bus,
                  RetryPolicy policy = {},
                  Sleeper sleeper = {});

    Transition send_chunk(UploadSession& session, const Bytes& chunk, bool is_final_chunk);

    /// "bytes first-last/total"
    static std::string content_range(std::int64_t first_byte, std::size_t length, std::int64_t total_size);

    static network::HttpRequest build_request(const UploadSession& session, const Bytes& chunk);

private:
    network::HttpTransport& transport_;
    events::EventBus& bus_;
    RetryPolicy policy_;
    Sleeper sleeper_;
};

} // namespace chunkup::upload
