#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace chunkup {

/**
 * @brief Failure categories reported by the upload pipeline
 *
 * Config, Session, Source and FatalChunk reach the caller. TransientChunk
 * describes a single failed chunk attempt that is still being retried.
 * Transport and Protocol come out of the HTTP layer and are translated by
 * whoever issued the request.
 */
enum class ErrorCode {
    Config,
    Session,
    Source,
    TransientChunk,
    FatalChunk,
    Transport,
    Protocol
};

const char* to_string(ErrorCode code) noexcept;

/**
 * @brief Structured error carried by chunkup::Result
 *
 * `status` is the last HTTP status observed (0 when the failure happened
 * before a response arrived). `body` holds the parsed response body, or the
 * raw text as a JSON string when the body was not JSON.
 */
struct Error {
    ErrorCode code = ErrorCode::Transport;
    std::string message;
    int status = 0;
    nlohmann::json body;

    static Error config(std::string message);
    static Error session(std::string message, int status = 0, nlohmann::json body = nullptr);
    static Error source(std::string message, int status = 0, nlohmann::json body = nullptr);
    static Error transport(std::string message);
    static Error protocol(std::string message);

    /// Caller-facing `{"status": ..., "error": ...}` shape.
    [[nodiscard]] nlohmann::json to_json() const;

    /// One-line human readable form for logs.
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief Interpret an HTTP body as JSON when possible
 *
 * Returns the parsed document, or the text itself as a JSON string.
 */
nlohmann::json parse_body(const std::string& text);

} // namespace chunkup
