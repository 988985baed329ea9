/**
 * @file components.hpp
 * @brief Observers attached to the upload event bus
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * resumable_upload(config, transport, bus);
 */

#pragma once

#include "chunkup/events/event_bus.hpp"
#include "chunkup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace chunkup::events {

/**
 * @brief Logger component - turns upload events into log lines
 *
 * Progress is logged at info level, failures at error.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent& e) {
            on_upload_started(e);
        });

        bus_.subscribe<SessionOpenedEvent>([this](const SessionOpenedEvent& e) {
            on_session_opened(e);
        });

        bus_.subscribe<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
            on_chunk_accepted(e);
        });

        bus_.subscribe<ChunkRetryEvent>([this](const ChunkRetryEvent& e) {
            on_chunk_retry(e);
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            on_upload_completed(e);
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            on_upload_failed(e);
        });
    }

private:
    void on_upload_started(const UploadStartedEvent& e) {
        spdlog::info("[UploadStarted] source={} endpoint={} bytes={} chunk_size={}",
                     e.source, e.session_endpoint, e.total_size, e.chunk_size);
    }

    void on_session_opened(const SessionOpenedEvent& e) {
        spdlog::info("[SessionOpened] upload session URL obtained");
        spdlog::debug("[SessionOpened] url={}", e.session_url);
    }

    void on_chunk_accepted(const ChunkAcceptedEvent& e) {
        spdlog::info("[Progress{}] bytes {}-{} of {} confirmed",
                     e.final_chunk ? "(last)" : "", e.first_byte, e.last_byte, e.total_size);
    }

    // ChunkUploader already warns about every retry; only the body is added here
    void on_chunk_retry(const ChunkRetryEvent& e) {
        if (!e.response_text.empty()) {
            spdlog::debug("[Retry] attempt {} response: {}", e.attempt, e.response_text);
        }
    }

    void on_upload_completed(const UploadCompletedEvent& e) {
        spdlog::info("[UploadCompleted] bytes={} status={} duration={}ms",
                     e.total_size, e.status, e.duration.count());
    }

    void on_upload_failed(const UploadFailedEvent& e) {
        spdlog::error("[UploadFailed] {} after {} confirmed bytes", e.error.describe(), e.bytes_confirmed);
    }

    EventBus& bus_;
};

/**
 * @brief Metrics component - counts what happened during uploads
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> sessions_opened{0};
        std::atomic<uint64_t> chunks_accepted{0};
        std::atomic<uint64_t> bytes_confirmed{0};
        std::atomic<uint64_t> retries{0};
        std::atomic<uint64_t> uploads_completed{0};
        std::atomic<uint64_t> uploads_failed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SessionOpenedEvent>([this](const SessionOpenedEvent&) {
            stats_.sessions_opened++;
        });

        bus_.subscribe<ChunkAcceptedEvent>([this](const ChunkAcceptedEvent& e) {
            stats_.chunks_accepted++;
            stats_.bytes_confirmed += static_cast<uint64_t>(e.last_byte - e.first_byte + 1);
        });

        bus_.subscribe<ChunkRetryEvent>([this](const ChunkRetryEvent&) {
            stats_.retries++;
        });

        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent&) {
            stats_.uploads_completed++;
        });

        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent&) {
            stats_.uploads_failed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Upload Statistics:");
        spdlog::info("  Sessions opened: {}", stats_.sessions_opened.load());
        spdlog::info("  Chunks accepted: {}", stats_.chunks_accepted.load());
        spdlog::info("  Bytes confirmed: {}", stats_.bytes_confirmed.load());
        spdlog::info("  Retries:         {}", stats_.retries.load());
        spdlog::info("  Completed:       {}", stats_.uploads_completed.load());
        spdlog::info("  Failed:          {}", stats_.uploads_failed.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace chunkup::events
