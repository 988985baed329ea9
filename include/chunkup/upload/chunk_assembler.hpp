#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/source/byte_source.hpp"

#include <cstddef>
#include <optional>

namespace chunkup::upload {

using network::Bytes;

/**
 * @brief Re-cuts source fragments into fixed-size chunks
 *
 * Every chunk is exactly chunk_size bytes except the last, which holds
 * whatever is left once the source ends. Chunks are never empty and their
 * concatenation is the source content. The source is only read from inside
 * next_chunk(), so nothing is pulled while a chunk is being uploaded.
 */
class ChunkAssembler {
public:
    ChunkAssembler(source::ByteSource& source, std::size_t chunk_size);

    /**
     * @return the next chunk, std::nullopt once everything was handed out,
     *         or the source's error
     */
    Result<std::optional<Bytes>> next_chunk();

    /// The source reported its end (buffered bytes may remain).
    [[nodiscard]] bool source_ended() const noexcept { return source_ended_; }

    /// The source ended and every byte was handed out.
    [[nodiscard]] bool exhausted() const noexcept { return source_ended_ && buffer_.empty(); }

    [[nodiscard]] std::size_t buffered() const noexcept { return buffer_.size(); }
    [[nodiscard]] std::size_t chunk_size() const noexcept { return chunk_size_; }

private:
    source::ByteSource& source_;
    std::size_t chunk_size_;
    Bytes buffer_;
    bool source_ended_ = false;
};

} // namespace chunkup::upload
