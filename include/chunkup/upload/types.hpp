#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace chunkup::upload {

constexpr std::size_t kChunkGranularity = 256 * 1024;
constexpr std::size_t kDefaultChunkSize = 16 * 1024 * 1024;
/// A chunk is held in memory while in flight, so it has to stay reasonable.
constexpr std::size_t kMaxChunkSize = 4096 * kChunkGranularity;
constexpr int kDefaultMaxRetries = 3;

enum class UploadState {
    Init,
    NegotiatingSession,
    Streaming,
    Uploading,
    Done,
    Failed
};

const char* to_string(UploadState state) noexcept;

/**
 * @brief Legal controller transitions
 *
 * Init -> NegotiatingSession -> Streaming <-> Uploading -> Done.
 * Failed is reachable from every non-terminal state; Done and Failed are
 * final. Staying in the same state is always allowed.
 */
bool can_transition(UploadState current, UploadState target) noexcept;

/**
 * @brief Server-side session as seen by the client
 *
 * Created when negotiation succeeds; only ChunkUploader moves
 * bytes_confirmed and retry_count.
 */
struct UploadSession {
    std::string session_url;
    std::int64_t total_size = 0;
    std::size_t chunk_size = kDefaultChunkSize;
    std::int64_t bytes_confirmed = 0;
    int retry_count = 0;
    UploadState state = UploadState::Streaming;
};

/**
 * @brief Body of the final 200 response
 *
 * `json` is set when the body parsed as JSON; `text` always holds the raw body.
 */
struct UploadResult {
    int status = 0;
    std::optional<nlohmann::json> json;
    std::string text;

    [[nodiscard]] bool is_json() const noexcept { return json.has_value(); }

    /// The parsed document, or the raw text as a JSON string.
    [[nodiscard]] nlohmann::json value() const { return json ? *json : nlohmann::json(text); }
};

/**
 * @brief How a failed chunk attempt is retried
 *
 * Defaults retry immediately, three times. With a non-zero initial_backoff
 * the delay before retry n is initial_backoff * multiplier^(n-1), capped at
 * max_backoff.
 */
struct RetryPolicy {
    int max_retries = kDefaultMaxRetries;
    std::chrono::milliseconds initial_backoff{0};
    double backoff_multiplier = 2.0;
    std::chrono::milliseconds max_backoff{30000};

    [[nodiscard]] std::chrono::milliseconds delay_for(int attempt) const;
};

} // namespace chunkup::upload
