#include "chunkup/core/error.hpp"

#include <utility>

namespace chunkup {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Config: return "ConfigError";
        case ErrorCode::Session: return "SessionError";
        case ErrorCode::Source: return "SourceError";
        case ErrorCode::TransientChunk: return "TransientChunkError";
        case ErrorCode::FatalChunk: return "FatalChunkError";
        case ErrorCode::Transport: return "TransportError";
        case ErrorCode::Protocol: return "ProtocolError";
    }
    return "UnknownError";
}

Error Error::config(std::string message) {
    return Error{ErrorCode::Config, std::move(message), 0, nullptr};
}

Error Error::session(std::string message, int status, nlohmann::json body) {
    return Error{ErrorCode::Session, std::move(message), status, std::move(body)};
}

Error Error::source(std::string message, int status, nlohmann::json body) {
    return Error{ErrorCode::Source, std::move(message), status, std::move(body)};
}

Error Error::transport(std::string message) {
    return Error{ErrorCode::Transport, std::move(message), 0, nullptr};
}

Error Error::protocol(std::string message) {
    return Error{ErrorCode::Protocol, std::move(message), 0, nullptr};
}

nlohmann::json Error::to_json() const {
    nlohmann::json j;
    j["kind"] = to_string(code);
    j["status"] = status;
    j["error"] = body.is_null() ? nlohmann::json(message) : body;
    if (!message.empty()) {
        j["message"] = message;
    }
    return j;
}

std::string Error::describe() const {
    std::string text = std::string(to_string(code)) + ": " + message;
    if (status != 0) {
        text += " (status " + std::to_string(status) + ")";
    }
    return text;
}

nlohmann::json parse_body(const std::string& text) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return nlohmann::json(text);
    }
    return parsed;
}

} // namespace chunkup
