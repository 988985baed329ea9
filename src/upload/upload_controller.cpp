#include "chunkup/upload/upload_controller.hpp"

#include "chunkup/events/events.hpp"
#include "chunkup/source/byte_source.hpp"
#include "chunkup/upload/chunk_assembler.hpp"
#include "chunkup/upload/session_negotiator.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace chunkup::upload {
namespace {

std::string describe_source(const source::SourceSpec& spec) {
    return spec.file_path.empty() ? "url:" + spec.url : "file:" + spec.file_path;
}

} // namespace

UploadController::UploadController(config::UploadConfig config,
                                   network::HttpTransport& transport,
                                   events::EventBus& bus,
                                   Sleeper sleeper)
    : config_(std::move(config))
    , transport_(transport)
    , bus_(bus)
    , sleeper_(std::move(sleeper)) {
    session_.state = state_;
}

Result<UploadResult> UploadController::run() {
    if (state_ != UploadState::Init) {
        return Err<UploadResult>(Error::config(
            std::string("Upload already ran (state ") + to_string(state_) + ")"));
    }
    return upload();
}

Result<UploadResult> UploadController::upload() {
    const auto started = std::chrono::steady_clock::now();

    if (auto valid = config::validate(config_); valid.is_error()) {
        return fail(valid.error());
    }

    bus_.emit(events::UploadStartedEvent{describe_source(config_.source), config_.session_endpoint,
                                         config_.total_size, config_.chunk_size});

    if (auto res = transition_to(UploadState::NegotiatingSession); res.is_error()) {
        return fail(res.error());
    }

    SessionNegotiator negotiator(transport_);
    auto session_url = negotiator.negotiate(config_.session_endpoint, config_.metadata, config_.access_token);
    if (session_url.is_error()) {
        return fail(session_url.error());
    }

    session_.session_url = session_url.value();
    session_.total_size = config_.total_size;
    session_.chunk_size = config_.chunk_size;
    session_.bytes_confirmed = 0;
    session_.retry_count = 0;
    bus_.emit(events::SessionOpenedEvent{session_.session_url, session_.total_size, session_.chunk_size});

    if (auto res = transition_to(UploadState::Streaming); res.is_error()) {
        return fail(res.error());
    }

    auto source = source::make_byte_source(config_.source, transport_);
    if (source.is_error()) {
        return fail(source.error());
    }

    ChunkAssembler assembler(*source.value(), session_.chunk_size);
    ChunkUploader uploader(transport_, bus_, config_.retry, sleeper_);

    for (;;) {
        auto next = assembler.next_chunk();
        if (next.is_error()) {
            return fail(next.error());
        }
        if (!next.value()) {
            // The last answer was 308, so the server is still waiting for bytes
            return fail(Error::source("Source ended after " + std::to_string(session_.bytes_confirmed) +
                                      " of " + std::to_string(session_.total_size) + " bytes"));
        }

        const Bytes& chunk = *next.value();
        const bool is_final_chunk = assembler.exhausted() ||
            session_.bytes_confirmed + static_cast<std::int64_t>(chunk.size()) >= session_.total_size;

        if (auto res = transition_to(UploadState::Uploading); res.is_error()) {
            return fail(res.error());
        }

        Transition outcome = uploader.send_chunk(session_, chunk, is_final_chunk);

        if (auto* failed = std::get_if<FailedTransition>(&outcome)) {
            return fail(std::move(failed->error));
        }

        if (auto* done = std::get_if<DoneTransition>(&outcome)) {
            if (auto res = transition_to(UploadState::Done); res.is_error()) {
                return fail(res.error());
            }
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            bus_.emit(events::UploadCompletedEvent{session_.bytes_confirmed, done->result.status, elapsed});
            return Ok(std::move(done->result));
        }

        if (auto res = transition_to(UploadState::Streaming); res.is_error()) {
            return fail(res.error());
        }
    }
}

Result<UploadResult> UploadController::fail(Error error) {
    if (auto res = transition_to(UploadState::Failed); res.is_error()) {
        spdlog::error("{}", res.error().describe());
    }
    bus_.emit(events::UploadFailedEvent{error, session_.bytes_confirmed});
    return Err<UploadResult>(std::move(error));
}

Result<void> UploadController::transition_to(UploadState target) {
    if (!can_transition(state_, target)) {
        return Err<void>(Error::config(std::string("Illegal upload state transition ") +
                                       to_string(state_) + " -> " + to_string(target)));
    }
    spdlog::debug("Upload state {} -> {}", to_string(state_), to_string(target));
    state_ = target;
    session_.state = target;
    return Ok();
}

Result<UploadResult> resumable_upload(const config::UploadConfig& config,
                                      network::HttpTransport& transport,
                                      events::EventBus& bus) {
    UploadController controller(config, transport, bus);
    return controller.run();
}

} // namespace chunkup::upload
