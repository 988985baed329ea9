#include "chunkup/upload/chunk_uploader.hpp"

#include "chunkup/events/events.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace chunkup::upload {

using network::HttpMethod;
using network::HttpRequest;
using network::HttpStatus;

ChunkUploader::ChunkUploader(network::HttpTransport& transport,
                             events::EventBus& bus,
                             RetryPolicy policy,
                             Sleeper sleeper)
    : transport_(transport)
    , bus_(bus)
    , policy_(policy)
    , sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

std::string ChunkUploader::content_range(std::int64_t first_byte, std::size_t length, std::int64_t total_size) {
    const std::int64_t last_byte = first_byte + static_cast<std::int64_t>(length) - 1;
    return "bytes " + std::to_string(first_byte) + "-" + std::to_string(last_byte) + "/" +
           std::to_string(total_size);
}

HttpRequest ChunkUploader::build_request(const UploadSession& session, const Bytes& chunk) {
    HttpRequest request;
    request.method = HttpMethod::PUT;
    request.url = session.session_url;
    request.set_header("Content-Range", content_range(session.bytes_confirmed, chunk.size(), session.total_size));
    request.body = chunk;
    return request;
}

Transition ChunkUploader::send_chunk(UploadSession& session, const Bytes& chunk, bool is_final_chunk) {
    const std::int64_t first_byte = session.bytes_confirmed;
    const std::int64_t length = static_cast<std::int64_t>(chunk.size());
    const std::int64_t last_byte = first_byte + length - 1;

    if (chunk.empty()) {
        return FailedTransition{Error::source("Refusing to upload an empty chunk")};
    }
    if (first_byte + length > session.total_size) {
        return FailedTransition{Error::source(
            "Source produced more than the declared " + std::to_string(session.total_size) + " bytes")};
    }

    spdlog::debug("Uploading{} bytes {}-{} of {}", is_final_chunk ? " last chunk," : "",
                  first_byte, last_byte, session.total_size);

    // Built once: every retry resends exactly these headers and bytes
    const HttpRequest request = build_request(session, chunk);

    for (;;) {
        int status = 0;
        std::string text;

        auto response = transport_.send(request);
        if (response.is_ok()) {
            status = response.value().status_code;
            text = response.value().body_as_string();
        } else {
            text = response.error().message;
        }

        if (status == static_cast<int>(HttpStatus::OK)) {
            session.bytes_confirmed += length;
            session.retry_count = 0;
            bus_.emit(events::ChunkAcceptedEvent{first_byte, last_byte, session.total_size,
                                                 session.bytes_confirmed, true});

            UploadResult result;
            result.status = status;
            auto parsed = nlohmann::json::parse(text, nullptr, false);
            if (!parsed.is_discarded()) {
                result.json = std::move(parsed);
            }
            result.text = std::move(text);
            return DoneTransition{std::move(result)};
        }

        if (status == static_cast<int>(HttpStatus::RESUME_INCOMPLETE)) {
            session.bytes_confirmed += length;
            session.retry_count = 0;
            bus_.emit(events::ChunkAcceptedEvent{first_byte, last_byte, session.total_size,
                                                 session.bytes_confirmed, is_final_chunk});
            return ContinueTransition{session.bytes_confirmed};
        }

        if (session.retry_count >= policy_.max_retries) {
            Error error;
            error.code = ErrorCode::FatalChunk;
            error.message = "Upload of bytes " + std::to_string(first_byte) + "-" + std::to_string(last_byte) +
                            " failed after " + std::to_string(session.retry_count) + " retries";
            error.status = status;
            error.body = parse_body(text);
            return FailedTransition{std::move(error)};
        }

        ++session.retry_count;
        const Error transient{ErrorCode::TransientChunk,
                              status == 0 ? text : "unexpected response status", status, nullptr};
        spdlog::warn("Retry: {} / {} for bytes {}-{} after {}",
                     session.retry_count, policy_.max_retries, first_byte, last_byte, transient.describe());
        bus_.emit(events::ChunkRetryEvent{session.retry_count, policy_.max_retries, first_byte, last_byte,
                                          session.total_size, status, text});

        const auto delay = policy_.delay_for(session.retry_count);
        if (delay.count() > 0) {
            sleeper_(delay);
        }
    }
}

} // namespace chunkup::upload
