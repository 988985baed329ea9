#pragma once

#include "chunkup/config/config.hpp"
#include "chunkup/core/result.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/network/http_transport.hpp"
#include "chunkup/upload/chunk_uploader.hpp"
#include "chunkup/upload/types.hpp"

namespace chunkup::upload {

/**
 * @brief Runs one resumable upload from configuration to final response
 *
 * STATE MACHINE:
 *   Init -> NegotiatingSession -> Streaming <-> Uploading -> Done
 *   any non-terminal state -> Failed
 *
 * The pipeline is strictly sequential: one chunk is assembled, sent and
 * answered before the source is read again. Invalid configuration fails in
 * Init without touching the network.
 *
 * EXAMPLE:
 *   AsioHttpTransport transport;
 *   EventBus bus;
 *   UploadController controller(config, transport, bus);
 *   auto result = controller.run();
 */
class UploadController {
public:
    UploadController(config::UploadConfig config,
                     network::HttpTransport& transport,
                     events::EventBus& bus,
                     Sleeper sleeper = {});

    /// Only the first call uploads; later calls fail with a Config error.
    Result<UploadResult> run();

    UploadState state() const { return state_; }

    /// Zero until a session was opened.
    const UploadSession& session() const { return session_; }

private:
    Result<UploadResult> upload();
    Result<UploadResult> fail(Error error);
    Result<void> transition_to(UploadState target);

    config::UploadConfig config_;
    network::HttpTransport& transport_;
    events::EventBus& bus_;
    Sleeper sleeper_;

    UploadState state_ = UploadState::Init;
    UploadSession session_;
};

/// Convenience wrapper: build a controller and run it once.
Result<UploadResult> resumable_upload(const config::UploadConfig& config,
                                      network::HttpTransport& transport,
                                      events::EventBus& bus);

} // namespace chunkup::upload
