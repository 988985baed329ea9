#include "chunkup/network/url.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>

namespace chunkup::network {
namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

std::uint16_t default_port(const std::string& scheme) {
    return scheme == "https" ? 443 : 80;
}

} // namespace

Result<Url> Url::parse(const std::string& text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return Err<Url>(Error::config("URL is missing a scheme: " + text));
    }

    Url url;
    url.scheme = to_lower(text.substr(0, scheme_end));
    if (url.scheme != "http" && url.scheme != "https") {
        return Err<Url>(Error::config("Unsupported URL scheme '" + url.scheme + "' in " + text));
    }

    const auto authority_begin = scheme_end + 3;
    auto authority_end = text.find_first_of("/?#", authority_begin);
    if (authority_end == std::string::npos) {
        authority_end = text.size();
    }
    const std::string authority = text.substr(authority_begin, authority_end - authority_begin);
    if (authority.empty()) {
        return Err<Url>(Error::config("URL has no host: " + text));
    }
    if (authority.find('@') != std::string::npos) {
        return Err<Url>(Error::config("Credentials in URLs are not supported: " + text));
    }

    std::string port_text;
    if (authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return Err<Url>(Error::config("Unterminated IPv6 host in " + text));
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return Err<Url>(Error::config("Malformed host in " + text));
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon == std::string::npos) {
            url.host = authority;
        } else {
            url.host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
        }
    }

    if (url.host.empty()) {
        return Err<Url>(Error::config("URL has no host: " + text));
    }

    if (port_text.empty()) {
        url.port = default_port(url.scheme);
    } else {
        if (port_text.size() > 5 ||
            !std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return Err<Url>(Error::config("Invalid port in " + text));
        }
        const unsigned long value = std::stoul(port_text);
        if (value == 0 || value > 65535) {
            return Err<Url>(Error::config("Port out of range in " + text));
        }
        url.port = static_cast<std::uint16_t>(value);
    }

    std::string rest = text.substr(authority_end);
    const auto fragment = rest.find('#');
    if (fragment != std::string::npos) {
        rest.erase(fragment);
    }
    if (rest.empty() || rest.front() != '/') {
        rest.insert(rest.begin(), '/');
    }
    url.target = rest;
    return Ok(std::move(url));
}

bool Url::has_default_port() const noexcept {
    return port == default_port(scheme);
}

std::string Url::host_header() const {
    std::string value = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (!has_default_port()) {
        value += ":" + std::to_string(port);
    }
    return value;
}

std::string Url::origin() const {
    return scheme + "://" + host_header();
}

bool has_scheme(const std::string& reference) {
    const auto colon = reference.find(':');
    if (colon == std::string::npos || colon == 0 ||
        !std::isalpha(static_cast<unsigned char>(reference.front()))) {
        return false;
    }
    return std::all_of(reference.begin(), reference.begin() + static_cast<std::ptrdiff_t>(colon),
                       [](unsigned char c) { return std::isalnum(c) || c == '+' || c == '-' || c == '.'; });
}

std::string Url::resolve(const std::string& location) const {
    if (has_scheme(location)) {
        return location;
    }
    if (location.rfind("//", 0) == 0) {
        return scheme + ":" + location;
    }
    if (!location.empty() && location.front() == '/') {
        return origin() + location;
    }

    std::string path = target.substr(0, target.find('?'));
    if (location.empty()) {
        return to_string();
    }
    if (location.front() == '?') {
        return origin() + path + location;
    }
    if (location.front() == '#') {
        return to_string();
    }

    const auto last_slash = path.rfind('/');
    path.erase(last_slash + 1);
    return origin() + path + location;
}

} // namespace chunkup::network
