#include "chunkup/source/byte_source.hpp"

#include "chunkup/source/file_source.hpp"
#include "chunkup/source/url_source.hpp"

namespace chunkup::source {

Result<void> validate_source(const SourceSpec& spec) {
    const bool has_file = !spec.file_path.empty();
    const bool has_url = !spec.url.empty();
    if (has_file == has_url) {
        return Err<void>(Error::config("Please set exactly one of filePath or fileUrl"));
    }
    return Ok();
}

Result<std::unique_ptr<ByteSource>> make_byte_source(const SourceSpec& spec,
                                                     network::HttpTransport& transport) {
    if (auto res = validate_source(spec); res.is_error()) {
        return Err<std::unique_ptr<ByteSource>>(res.error());
    }

    std::unique_ptr<ByteSource> source;
    if (!spec.file_path.empty()) {
        source = std::make_unique<FileSource>(spec.file_path);
    } else {
        source = std::make_unique<UrlSource>(spec.url, transport);
    }
    return Ok(std::move(source));
}

} // namespace chunkup::source
