#pragma once

#include "chunkup/core/result.hpp"
#include "chunkup/source/byte_source.hpp"
#include "chunkup/upload/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace chunkup::config {

constexpr const char* kAccessTokenEnv = "CHUNKUP_ACCESS_TOKEN";

/**
 * @brief Everything one upload needs
 *
 * JSON files use the keys filePath, fileUrl, resumableUrl, dataSize,
 * accessToken, metadata, chunkSize, maxRetries, retryBackoffMs,
 * retryBackoffMaxMs and timeoutMs.
 */
struct UploadConfig {
    source::SourceSpec source;
    std::string session_endpoint;
    std::int64_t total_size = 0;
    std::optional<std::string> access_token;
    nlohmann::json metadata = nlohmann::json::object();
    std::size_t chunk_size = upload::kDefaultChunkSize;
    upload::RetryPolicy retry;
    std::chrono::milliseconds timeout{60000};
};

/**
 * @brief Reject configurations that cannot be uploaded
 *
 * Runs before any I/O. A chunk size that is not a multiple of 256 KiB is
 * accepted with a warning.
 */
Result<void> validate(const UploadConfig& config);

/// Overlay the keys present in `doc` onto `config`.
Result<void> apply_json(const nlohmann::json& doc, UploadConfig& config);

Result<UploadConfig> from_json(const nlohmann::json& doc);

Result<UploadConfig> load_config_file(const std::string& path);

struct CliOptions {
    UploadConfig config;
    bool verbose = false;
    bool show_help = false;
};

/**
 * @brief Build the configuration from argv
 *
 * --config is loaded first, every other flag overrides it. When no size is
 * given for a file source the file's size is used, and the access token
 * falls back to $CHUNKUP_ACCESS_TOKEN. The result is not validated.
 */
Result<CliOptions> parse_arguments(int argc, const char* const argv[]);

std::string usage(const std::string& program);

} // namespace chunkup::config
