#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkup::network {

using Bytes = std::vector<std::uint8_t>;

/// Header names keep the case they were sent or received with.
using HeaderMap = std::unordered_map<std::string, std::string>;

/// The three methods the uploader needs: GET a remote source, POST a session, PUT a chunk.
enum class HttpMethod { GET, POST, PUT };

inline const char* method_name(HttpMethod method) {
    switch (method) {
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::GET: break;
    }
    return "GET";
}

/**
 * @brief Status codes the upload protocol gives meaning to
 *
 * 308 is "Permanent Redirect" in RFC 7538, but resumable upload servers
 * reuse it as "Resume Incomplete": the chunk was stored and more is expected.
 */
enum class HttpStatus {
    OK = 200,
    RESUME_INCOMPLETE = 308
};

inline bool header_name_equals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

template<typename Map>
auto find_header(Map& headers, const std::string& name) {
    return std::find_if(headers.begin(), headers.end(),
                        [&name](const auto& entry) { return header_name_equals(entry.first, name); });
}

/// Case-insensitive lookup; empty when absent.
inline std::string header_value(const HeaderMap& headers, const std::string& name) {
    auto it = find_header(headers, name);
    return it == headers.end() ? std::string() : it->second;
}

/**
 * @brief An outgoing HTTP request
 *
 * `url` is absolute (scheme://host[:port]/target). The transport derives the
 * request line, the Host header and the framing headers from it; `headers`
 * only carries what the caller wants on top of that.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HeaderMap headers;
    Bytes body;

    std::string get_header(const std::string& name) const { return header_value(headers, name); }
    bool has_header(const std::string& name) const { return !get_header(name).empty(); }
    /// Replaces any existing header of the same name, regardless of case.
    void set_header(const std::string& name, const std::string& value) {
        auto it = find_header(headers, name);
        if (it != headers.end()) {
            it->second = value;
        } else {
            headers.emplace(name, value);
        }
    }
};

/**
 * @brief A received HTTP response
 *
 * For streamed downloads only the status line and headers are filled in
 * here; the body arrives through a BodyReader.
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    HeaderMap headers;
    Bytes body;

    std::string get_header(const std::string& name) const { return header_value(headers, name); }
    bool has_header(const std::string& name) const { return !get_header(name).empty(); }

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    bool is_redirect() const {
        switch (status_code) {
            case 301: case 302: case 303: case 307: case 308:
                return true;
            default:
                return false;
        }
    }
};

} // namespace chunkup::network
