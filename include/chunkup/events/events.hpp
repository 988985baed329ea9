/**
 * @file events.hpp
 * @brief Event types emitted while an upload runs
 *
 * NAMING CONVENTION:
 * - Events are past-tense: SessionOpenedEvent, ChunkAcceptedEvent
 *
 * Byte offsets are inclusive, matching the Content-Range header that was
 * sent ("bytes start-end/total").
 */

#pragma once

#include "chunkup/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace chunkup::events {

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted after configuration was validated, before any I/O
 *
 * WHO EMITS: UploadController
 */
struct UploadStartedEvent {
    std::string source;
    std::string session_endpoint;
    std::int64_t total_size = 0;
    std::size_t chunk_size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted once the server handed out the session URL
 */
struct SessionOpenedEvent {
    std::string session_url;
    std::int64_t total_size = 0;
    std::size_t chunk_size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Chunk Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted when the server acknowledged a chunk (200 or 308)
 *
 * WHO EMITS: ChunkUploader
 * WHO SUBSCRIBES: LoggerComponent (progress line), MetricsComponent
 */
struct ChunkAcceptedEvent {
    std::int64_t first_byte = 0;
    std::int64_t last_byte = 0;
    std::int64_t total_size = 0;
    std::int64_t bytes_confirmed = 0;
    bool final_chunk = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted before a chunk is resent
 *
 * `status` is 0 when the previous attempt failed below HTTP.
 */
struct ChunkRetryEvent {
    int attempt = 0;
    int max_retries = 0;
    std::int64_t first_byte = 0;
    std::int64_t last_byte = 0;
    std::int64_t total_size = 0;
    int status = 0;
    std::string response_text;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Terminal Events
// ════════════════════════════════════════════════════════

struct UploadCompletedEvent {
    std::int64_t total_size = 0;
    int status = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct UploadFailedEvent {
    Error error;
    std::int64_t bytes_confirmed = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace chunkup::events
