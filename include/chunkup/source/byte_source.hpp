#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/network/http_transport.hpp"
#include "chunkup/network/http_types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace chunkup::source {

using network::Bytes;

/**
 * @brief Where upload bytes come from
 *
 * An ordered, finite, non-restartable sequence of fragments of arbitrary
 * size. next() returns std::nullopt once the content is exhausted (and on
 * every call after that); it never returns an empty fragment. Any failure is
 * reported as ErrorCode::Source.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual Result<std::optional<Bytes>> next() = 0;

    /// Short description for log lines ("file:/tmp/a.bin").
    virtual std::string describe() const = 0;
};

/**
 * @brief Which source to read from; exactly one field must be non-empty
 */
struct SourceSpec {
    std::string file_path;
    std::string url;
};

Result<void> validate_source(const SourceSpec& spec);

/**
 * @brief Build the configured source
 *
 * Nothing is opened here: files are opened and URLs requested on the first
 * call to next().
 */
Result<std::unique_ptr<ByteSource>> make_byte_source(const SourceSpec& spec,
                                                     network::HttpTransport& transport);

} // namespace chunkup::source
