#include "chunkup/source/file_source.hpp"

#include <spdlog/spdlog.h>

namespace chunkup::source {

FileSource::FileSource(std::filesystem::path path, std::size_t fragment_size)
    : path_(std::move(path))
    , fragment_size_(fragment_size == 0 ? kDefaultFragmentSize : fragment_size) {
}

Result<std::optional<Bytes>> FileSource::next() {
    if (ended_) {
        return Ok(std::optional<Bytes>());
    }

    if (!opened_) {
        input_.open(path_, std::ios::binary);
        if (!input_) {
            ended_ = true;
            return Err<std::optional<Bytes>>(Error::source("Failed to open source file: " + path_.string()));
        }
        opened_ = true;
        spdlog::debug("Reading upload content from {}", path_.string());
    }

    Bytes buffer(fragment_size_);
    input_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(fragment_size_));
    const auto bytes_read = static_cast<std::size_t>(input_.gcount());

    if (input_.bad()) {
        ended_ = true;
        return Err<std::optional<Bytes>>(Error::source("Failed to read source file: " + path_.string()));
    }

    if (bytes_read == 0) {
        ended_ = true;
        input_.close();
        return Ok(std::optional<Bytes>());
    }

    buffer.resize(bytes_read);
    bytes_read_ += bytes_read;
    return Ok(std::optional<Bytes>(std::move(buffer)));
}

std::string FileSource::describe() const {
    return "file:" + path_.string();
}

} // namespace chunkup::source
