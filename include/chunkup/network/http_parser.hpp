#pragma once

#include "http_types.hpp"
#include "chunkup/core/result.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <utility>

namespace chunkup {
namespace network {

/**
 * @brief State machine states for HTTP response parsing
 *
 * HTTP Response Format:
 * VERSION SP STATUS SP REASON CRLF  <- Status line
 * Header-Name: Header-Value CRLF    <- Headers (multiple)
 * CRLF                              <- Empty line
 * [Body]                            <- Content-Length, chunked, or until close
 */
enum class ParseState {
    VERSION,           // Parsing "HTTP/1.x"
    STATUS_CODE,       // Parsing the three digit status
    REASON,            // Parsing the reason phrase
    HEADER_NAME,       // Parsing header field name
    HEADER_VALUE,      // Parsing header field value
    BODY,              // Reading a Content-Length delimited body
    BODY_UNTIL_CLOSE,  // No framing header: body ends when the peer closes
    CHUNK_SIZE,        // Chunked encoding: hex size line
    CHUNK_EXTENSION,   // Chunked encoding: ignored ";ext" up to CRLF
    CHUNK_DATA,        // Chunked encoding: chunk payload
    CHUNK_DATA_END,    // Chunked encoding: CRLF after the payload
    TRAILER,           // Chunked encoding: trailer fields up to the empty line
    COMPLETE,          // Response fully received
    PARSE_ERROR        // Malformed input
};

/**
 * @brief Incremental HTTP/1.x response parser
 *
 * Feed it whatever the socket returned; it keeps its position between
 * calls. Body bytes accumulate in the response and can be drained with
 * take_body() while the response is still arriving, which is how the URL
 * byte source streams a download without buffering all of it.
 *
 * Usage example:
 * ```cpp
 * HttpResponseParser parser;
 * while (!parser.is_complete()) {
 *     auto n = read_some(buffer);
 *     if (n == 0) { parser.finish(); break; }      // peer closed
 *     auto result = parser.parse(buffer.data(), n);
 *     if (result.is_error()) { ... }
 * }
 * HttpResponse response = parser.response();
 * ```
 *
 * Interim 1xx responses are skipped. 204 and 304 never carry a body.
 */
class HttpResponseParser {
public:
    static constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

    HttpResponseParser() { reset(); }

    /**
     * @brief Parse incoming data
     *
     * @return true once the response is complete, false if more data is
     *         needed, or a Protocol error for malformed input
     */
    Result<bool> parse(const char* data, std::size_t len) {
        std::size_t i = 0;
        while (i < len) {
            switch (state_) {
                case ParseState::BODY: {
                    const std::size_t take = std::min(len - i, body_remaining_);
                    append_body(data + i, take);
                    i += take;
                    body_remaining_ -= take;
                    if (body_remaining_ == 0) {
                        state_ = ParseState::COMPLETE;
                    }
                    break;
                }

                case ParseState::BODY_UNTIL_CLOSE:
                    append_body(data + i, len - i);
                    i = len;
                    break;

                case ParseState::CHUNK_DATA: {
                    const std::size_t take = std::min(len - i, chunk_remaining_);
                    append_body(data + i, take);
                    i += take;
                    chunk_remaining_ -= take;
                    if (chunk_remaining_ == 0) {
                        state_ = ParseState::CHUNK_DATA_END;
                    }
                    break;
                }

                case ParseState::COMPLETE:
                    return Ok(true);

                case ParseState::PARSE_ERROR:
                    return Err<bool>(Error::protocol("Parser in error state"));

                default: {
                    const char c = data[i++];
                    if (c == '\n') {
                        line_++;
                    }
                    if (++header_bytes_ > kMaxHeaderBytes && !headers_complete_) {
                        state_ = ParseState::PARSE_ERROR;
                        return Err<bool>(Error::protocol("Response header section too large"));
                    }
                    if (!step(c)) {
                        state_ = ParseState::PARSE_ERROR;
                        return Err<bool>(Error::protocol(error_ + " at line " + std::to_string(line_)));
                    }
                    break;
                }
            }

            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
        }

        // More data needed
        return Ok(state_ == ParseState::COMPLETE);
    }

    /**
     * @brief Signal that the peer closed the connection
     *
     * Completes a close-delimited body; anywhere else a close means the
     * response was truncated.
     */
    Result<void> finish() {
        if (state_ == ParseState::BODY_UNTIL_CLOSE) {
            state_ = ParseState::COMPLETE;
        }
        if (state_ != ParseState::COMPLETE) {
            state_ = ParseState::PARSE_ERROR;
            return Err<void>(Error::protocol("Connection closed before the response was complete"));
        }
        return Ok();
    }

    const HttpResponse& response() const { return response_; }

    /// Move out the body bytes received so far.
    Bytes take_body() {
        Bytes out;
        out.swap(response_.body);
        return out;
    }

    bool headers_complete() const { return headers_complete_; }
    bool is_complete() const { return state_ == ParseState::COMPLETE; }
    ParseState state() const { return state_; }

    void reset() {
        state_ = ParseState::VERSION;
        response_ = HttpResponse();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        body_remaining_ = 0;
        chunk_remaining_ = 0;
        header_bytes_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        headers_complete_ = false;
    }

private:
    ParseState state_;
    HttpResponse response_;
    std::string buffer_;                // Temporary buffer for current token
    std::string current_header_name_;
    std::string error_;
    std::size_t body_remaining_;
    std::size_t chunk_remaining_;
    std::size_t header_bytes_;
    std::size_t line_;
    bool last_char_was_cr_;
    bool headers_complete_;

    void append_body(const char* data, std::size_t len) {
        response_.body.insert(response_.body.end(),
                              reinterpret_cast<const std::uint8_t*>(data),
                              reinterpret_cast<const std::uint8_t*>(data) + len);
    }

    bool fail(const char* message) {
        error_ = message;
        return false;
    }

    bool step(char c) {
        switch (state_) {
            case ParseState::VERSION: return parse_version(c);
            case ParseState::STATUS_CODE: return parse_status_code(c);
            case ParseState::REASON: return parse_reason(c);
            case ParseState::HEADER_NAME: return parse_header_name(c);
            case ParseState::HEADER_VALUE: return parse_header_value(c);
            case ParseState::CHUNK_SIZE: return parse_chunk_size(c);
            case ParseState::CHUNK_EXTENSION: return parse_chunk_extension(c);
            case ParseState::CHUNK_DATA_END: return parse_chunk_data_end(c);
            case ParseState::TRAILER: return parse_trailer(c);
            default: return fail("Unexpected parser state");
        }
    }

    /**
     * Example: "HTTP/1.1 308 Resume Incomplete\r\n"
     *           ^-- we're here
     */
    bool parse_version(char c) {
        if (c == ' ') {
            if (buffer_ != "HTTP/1.1" && buffer_ != "HTTP/1.0") {
                return fail("Unsupported HTTP version");
            }
            buffer_.clear();
            state_ = ParseState::STATUS_CODE;
            return true;
        }
        if (buffer_.size() >= 8) {
            return fail("Malformed HTTP version");
        }
        buffer_ += c;
        return true;
    }

    bool parse_status_code(char c) {
        if (c == ' ' || c == '\r') {
            if (buffer_.size() != 3) {
                return fail("Malformed status code");
            }
            response_.status_code = std::stoi(buffer_);
            buffer_.clear();
            last_char_was_cr_ = (c == '\r');
            state_ = ParseState::REASON;
            return true;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return fail("Malformed status code");
        }
        buffer_ += c;
        return true;
    }

    bool parse_reason(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            response_.reason_phrase = buffer_;
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    static bool is_token_char(char c) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            return true;
        }
        static const std::string extra = "!#$%&'*+-.^_`|~";
        return extra.find(c) != std::string::npos;
    }

    /**
     * Empty line (CRLF) indicates end of headers.
     */
    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            if (!buffer_.empty()) {
                return fail("Header line without colon");
            }
            return on_headers_complete();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return fail("Empty header name");
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!is_token_char(c)) {
            return fail("Invalid character in header name");
        }

        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        // Skip leading whitespace after colon
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            // Repeats are folded into the first spelling seen, whatever their case
            auto it = find_header(response_.headers, current_header_name_);
            if (it == response_.headers.end()) {
                response_.headers.emplace(current_header_name_, buffer_);
            } else {
                it->second += ", " + buffer_;
            }
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool on_headers_complete() {
        const int status = response_.status_code;
        if (status >= 100 && status < 200) {
            // Interim response; the real one follows on the same connection
            const auto line = line_;
            reset();
            line_ = line;
            return true;
        }

        headers_complete_ = true;

        if (status == 204 || status == 304) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        std::string transfer_encoding = response_.get_header("Transfer-Encoding");
        std::transform(transfer_encoding.begin(), transfer_encoding.end(), transfer_encoding.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (transfer_encoding.find("chunked") != std::string::npos) {
            state_ = ParseState::CHUNK_SIZE;
            return true;
        }

        const std::string content_length = response_.get_header("Content-Length");
        if (!content_length.empty()) {
            if (content_length.size() > 18 ||
                !std::all_of(content_length.begin(), content_length.end(),
                             [](unsigned char ch) { return std::isdigit(ch); })) {
                return fail("Invalid Content-Length");
            }
            body_remaining_ = static_cast<std::size_t>(std::stoull(content_length));
            if (body_remaining_ > 0) {
                response_.body.reserve(std::min<std::size_t>(body_remaining_, 1 << 20));
                state_ = ParseState::BODY;
            } else {
                state_ = ParseState::COMPLETE;
            }
            return true;
        }

        state_ = ParseState::BODY_UNTIL_CLOSE;
        return true;
    }

    bool parse_chunk_size(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return on_chunk_size_line();
        }
        last_char_was_cr_ = false;
        if (c == ';') {
            state_ = ParseState::CHUNK_EXTENSION;
            return true;
        }
        if (c == ' ' || c == '\t') {
            return true;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c)) || buffer_.size() >= 15) {
            return fail("Invalid chunk size");
        }
        buffer_ += c;
        return true;
    }

    bool parse_chunk_extension(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return on_chunk_size_line();
        }
        last_char_was_cr_ = false;
        return true;
    }

    bool on_chunk_size_line() {
        if (buffer_.empty()) {
            return fail("Missing chunk size");
        }
        chunk_remaining_ = static_cast<std::size_t>(std::stoull(buffer_, nullptr, 16));
        buffer_.clear();
        state_ = chunk_remaining_ == 0 ? ParseState::TRAILER : ParseState::CHUNK_DATA;
        return true;
    }

    bool parse_chunk_data_end(char c) {
        if (c == '\r' && !last_char_was_cr_) {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            state_ = ParseState::CHUNK_SIZE;
            return true;
        }
        return fail("Missing CRLF after chunk data");
    }

    bool parse_trailer(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            if (buffer_.empty()) {
                state_ = ParseState::COMPLETE;
            }
            buffer_.clear();
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }
};

} // namespace network
} // namespace chunkup
