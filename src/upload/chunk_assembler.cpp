#include "chunkup/upload/chunk_assembler.hpp"

#include <iterator>

namespace chunkup::upload {

ChunkAssembler::ChunkAssembler(source::ByteSource& source, std::size_t chunk_size)
    : source_(source)
    , chunk_size_(chunk_size) {
}

Result<std::optional<Bytes>> ChunkAssembler::next_chunk() {
    if (chunk_size_ == 0) {
        return Err<std::optional<Bytes>>(Error::config("chunkSize must be greater than 0"));
    }

    while (buffer_.size() < chunk_size_ && !source_ended_) {
        auto fragment = source_.next();
        if (fragment.is_error()) {
            return Err<std::optional<Bytes>>(fragment.error());
        }
        if (!fragment.value()) {
            source_ended_ = true;
            break;
        }
        const Bytes& data = *fragment.value();
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

    if (buffer_.size() >= chunk_size_) {
        Bytes chunk(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(chunk_size_));
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(chunk_size_));
        return Ok(std::optional<Bytes>(std::move(chunk)));
    }

    if (!buffer_.empty()) {
        // Source ended: the remainder is the final, short chunk
        Bytes chunk;
        chunk.swap(buffer_);
        return Ok(std::optional<Bytes>(std::move(chunk)));
    }

    return Ok(std::optional<Bytes>());
}

} // namespace chunkup::upload
