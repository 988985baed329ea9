#pragma once

#include "chunkup/source/byte_source.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>

namespace chunkup::source {

class FileSource : public ByteSource {
public:
    static constexpr std::size_t kDefaultFragmentSize = 64 * 1024;

    explicit FileSource(std::filesystem::path path, std::size_t fragment_size = kDefaultFragmentSize);

    Result<std::optional<Bytes>> next() override;
    std::string describe() const override;

    [[nodiscard]] std::uint64_t bytes_read() const noexcept { return bytes_read_; }

private:
    std::filesystem::path path_;
    std::size_t fragment_size_;
    std::ifstream input_;
    bool opened_ = false;
    bool ended_ = false;
    std::uint64_t bytes_read_ = 0;
};

} // namespace chunkup::source
