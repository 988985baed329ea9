#include "chunkup/config/config.hpp"

#include "chunkup/network/url.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace chunkup::config {
namespace {

Result<void> type_error(const std::string& key, const char* expected) {
    return Err<void>(Error::config("Option '" + key + "' must be " + expected));
}

Error chunk_size_too_large() {
    return Error::config("chunkSize must not exceed " + std::to_string(upload::kMaxChunkSize) + " bytes");
}

Result<std::int64_t> json_integer(const std::string& key, const nlohmann::json& value) {
    if (!value.is_number_integer()) {
        return Err<std::int64_t>(Error::config("Option '" + key + "' must be an integer"));
    }
    return Ok(value.get<std::int64_t>());
}

Result<std::int64_t> parse_integer(const std::string& flag, const std::string& text) {
    std::int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last) {
        return Err<std::int64_t>(Error::config("Invalid number for " + flag + ": '" + text + "'"));
    }
    return Ok(value);
}

Result<void> set_chunk_size(std::int64_t value, UploadConfig& config) {
    if (value <= 0) {
        return Err<void>(Error::config("chunkSize must be positive"));
    }
    if (static_cast<std::uint64_t>(value) > upload::kMaxChunkSize) {
        return Err<void>(chunk_size_too_large());
    }
    config.chunk_size = static_cast<std::size_t>(value);
    return Ok();
}

Result<void> set_max_retries(std::int64_t value, UploadConfig& config) {
    if (value < 0) {
        return Err<void>(Error::config("maxRetries must not be negative"));
    }
    config.retry.max_retries = static_cast<int>(value);
    return Ok();
}

} // namespace

Result<void> validate(const UploadConfig& config) {
    if (auto res = source::validate_source(config.source); res.is_error()) {
        return res;
    }
    if (!config.source.url.empty()) {
        if (auto url = network::Url::parse(config.source.url); url.is_error()) {
            return Err<void>(Error::config("Invalid fileUrl: " + url.error().message));
        }
    }

    if (config.session_endpoint.empty()) {
        return Err<void>(Error::config("resumableUrl (session endpoint) is required"));
    }
    if (auto url = network::Url::parse(config.session_endpoint); url.is_error()) {
        return Err<void>(Error::config("Invalid resumableUrl: " + url.error().message));
    }

    if (config.total_size <= 0) {
        return Err<void>(Error::config("dataSize must be greater than zero"));
    }
    if (config.chunk_size == 0) {
        return Err<void>(Error::config("chunkSize must be positive"));
    }
    if (config.chunk_size > upload::kMaxChunkSize) {
        return Err<void>(chunk_size_too_large());
    }
    if (config.retry.max_retries < 0) {
        return Err<void>(Error::config("maxRetries must not be negative"));
    }
    if (config.retry.initial_backoff.count() < 0 || config.retry.max_backoff.count() < 0) {
        return Err<void>(Error::config("Retry backoff must not be negative"));
    }
    if (config.timeout.count() <= 0) {
        return Err<void>(Error::config("timeoutMs must be positive"));
    }
    if (!config.metadata.is_object()) {
        return Err<void>(Error::config("metadata must be a JSON object"));
    }

    if (config.chunk_size % upload::kChunkGranularity != 0) {
        spdlog::warn("chunkSize {} is not a multiple of {} bytes; the server may reject chunks",
                     config.chunk_size, upload::kChunkGranularity);
    }
    return Ok();
}

Result<void> apply_json(const nlohmann::json& doc, UploadConfig& config) {
    if (!doc.is_object()) {
        return Err<void>(Error::config("Configuration must be a JSON object"));
    }

    for (auto it = doc.begin(); it != doc.end(); ++it) {
        const std::string& key = it.key();
        const nlohmann::json& value = it.value();

        if (key == "filePath" || key == "fileUrl" || key == "resumableUrl") {
            if (!value.is_string()) {
                return type_error(key, "a string");
            }
            const auto text = value.get<std::string>();
            if (key == "filePath") {
                config.source.file_path = text;
            } else if (key == "fileUrl") {
                config.source.url = text;
            } else {
                config.session_endpoint = text;
            }
        } else if (key == "accessToken") {
            if (value.is_null()) {
                config.access_token.reset();
            } else if (value.is_string()) {
                config.access_token = value.get<std::string>();
            } else {
                return type_error(key, "a string");
            }
        } else if (key == "metadata") {
            if (value.is_null()) {
                config.metadata = nlohmann::json::object();
            } else if (value.is_object()) {
                config.metadata = value;
            } else {
                return type_error(key, "a JSON object");
            }
        } else {
            auto number = json_integer(key, value);
            if (number.is_error()) {
                if (key != "dataSize" && key != "chunkSize" && key != "maxRetries" &&
                    key != "retryBackoffMs" && key != "retryBackoffMaxMs" && key != "timeoutMs") {
                    return Err<void>(Error::config("Unknown option '" + key + "'"));
                }
                return Err<void>(number.error());
            }

            const std::int64_t n = number.value();
            Result<void> res = Ok();
            if (key == "dataSize") {
                config.total_size = n;
            } else if (key == "chunkSize") {
                res = set_chunk_size(n, config);
            } else if (key == "maxRetries") {
                res = set_max_retries(n, config);
            } else if (key == "retryBackoffMs") {
                config.retry.initial_backoff = std::chrono::milliseconds{n};
            } else if (key == "retryBackoffMaxMs") {
                config.retry.max_backoff = std::chrono::milliseconds{n};
            } else if (key == "timeoutMs") {
                config.timeout = std::chrono::milliseconds{n};
            } else {
                return Err<void>(Error::config("Unknown option '" + key + "'"));
            }
            if (res.is_error()) {
                return res;
            }
        }
    }
    return Ok();
}

Result<UploadConfig> from_json(const nlohmann::json& doc) {
    UploadConfig config;
    if (auto res = apply_json(doc, config); res.is_error()) {
        return Err<UploadConfig>(res.error());
    }
    return Ok(std::move(config));
}

Result<UploadConfig> load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Err<UploadConfig>(Error::config("Cannot open config file " + path));
    }

    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        return Err<UploadConfig>(Error::config("Config file " + path + " is not valid JSON"));
    }

    spdlog::debug("Loaded configuration from {}", path);
    return from_json(doc);
}

Result<CliOptions> parse_arguments(int argc, const char* const argv[]) {
    CliOptions options;
    bool size_given = false;

    // --config is applied first so that every other flag overrides it
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                return Err<CliOptions>(Error::config("--config needs a value"));
            }
            auto loaded = load_config_file(argv[i + 1]);
            if (loaded.is_error()) {
                return Err<CliOptions>(loaded.error());
            }
            options.config = loaded.take_value();
            size_given = options.config.total_size != 0;
            break;
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
            continue;
        }

        if (arg.rfind("--", 0) != 0) {
            return Err<CliOptions>(Error::config("Unexpected argument '" + arg + "'"));
        }
        if (i + 1 >= argc) {
            return Err<CliOptions>(Error::config(arg + " needs a value"));
        }
        const std::string value = argv[++i];
        auto& config = options.config;

        if (arg == "--config") {
            continue;
        } else if (arg == "--file") {
            config.source.file_path = value;
        } else if (arg == "--url") {
            config.source.url = value;
        } else if (arg == "--endpoint") {
            config.session_endpoint = value;
        } else if (arg == "--token") {
            config.access_token = value;
        } else if (arg == "--metadata") {
            auto doc = nlohmann::json::parse(value, nullptr, false);
            if (doc.is_discarded() || !doc.is_object()) {
                return Err<CliOptions>(Error::config("--metadata must be a JSON object"));
            }
            config.metadata = std::move(doc);
        } else {
            auto number = parse_integer(arg, value);
            if (number.is_error()) {
                return Err<CliOptions>(number.error());
            }
            const std::int64_t n = number.value();

            Result<void> res = Ok();
            if (arg == "--size") {
                config.total_size = n;
                size_given = true;
            } else if (arg == "--chunk-size") {
                res = set_chunk_size(n, config);
            } else if (arg == "--max-retries") {
                res = set_max_retries(n, config);
            } else if (arg == "--backoff-ms") {
                config.retry.initial_backoff = std::chrono::milliseconds{n};
            } else if (arg == "--timeout-ms") {
                config.timeout = std::chrono::milliseconds{n};
            } else {
                return Err<CliOptions>(Error::config("Unknown option '" + arg + "'"));
            }
            if (res.is_error()) {
                return Err<CliOptions>(res.error());
            }
        }
    }

    if (!size_given && !options.config.source.file_path.empty()) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(options.config.source.file_path, ec);
        if (!ec) {
            options.config.total_size = static_cast<std::int64_t>(size);
        }
    }

    if (!options.config.access_token) {
        if (const char* token = std::getenv(kAccessTokenEnv); token != nullptr && *token != '\0') {
            options.config.access_token = std::string(token);
        }
    }

    return Ok(std::move(options));
}

std::string usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "\n"
           "Source (exactly one):\n"
           "  --file <path>          Upload a local file\n"
           "  --url <url>            Upload the body of an http(s) GET\n"
           "\n"
           "Session:\n"
           "  --endpoint <url>       Resumable session endpoint (POST)\n"
           "  --size <bytes>         Total upload size (defaults to the file size)\n"
           "  --token <token>        Bearer token (or $CHUNKUP_ACCESS_TOKEN)\n"
           "  --metadata <json>      JSON object sent when opening the session\n"
           "\n"
           "Tuning:\n"
           "  --chunk-size <bytes>   Chunk size, multiple of 262144 (default 16777216)\n"
           "  --max-retries <n>      Retries per chunk (default 3)\n"
           "  --backoff-ms <ms>      Delay before the first retry (default 0)\n"
           "  --timeout-ms <ms>      Per-request timeout (default 60000)\n"
           "\n"
           "  --config <file>        JSON file with the same options\n"
           "  --verbose              Debug logging\n"
           "  --help                 Show this help\n";
}

} // namespace chunkup::config
