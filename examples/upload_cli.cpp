/**
 * @file upload_cli.cpp
 * @brief Uploads a local file or a remote URL to a resumable upload endpoint
 *
 * Run with:
 *   ./build/examples/chunkup_upload --file ./video.mp4 \
 *       --endpoint https://storage.example.com/upload/resumable \
 *       --token "$TOKEN" --metadata '{"name":"video.mp4"}'
 *
 * The final response (JSON, or the raw text as a JSON string) is printed to
 * stdout. On failure the structured error is printed instead. Logs go to
 * stderr.
 *
 * Exit codes: 0 success, 2 configuration error, 1 any other failure.
 */

#include "chunkup/config/config.hpp"
#include "chunkup/events/components.hpp"
#include "chunkup/events/event_bus.hpp"
#include "chunkup/network/asio_transport.hpp"
#include "chunkup/upload/upload_controller.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <string>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitConfig = 2;

int report(const chunkup::Error& error) {
    std::cout << error.to_json().dump(2) << std::endl;
    return error.code == chunkup::ErrorCode::Config ? kExitConfig : kExitFailure;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("chunkup"));
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    const std::string program = argc > 0 ? argv[0] : "chunkup_upload";

    auto parsed = chunkup::config::parse_arguments(argc, argv);
    if (parsed.is_error()) {
        std::cerr << parsed.error().message << "\n\n" << chunkup::config::usage(program);
        return report(parsed.error());
    }

    const auto& options = parsed.value();
    if (options.show_help) {
        std::cout << chunkup::config::usage(program);
        return kExitOk;
    }
    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    chunkup::events::EventBus event_bus;
    chunkup::events::LoggerComponent logger(event_bus);
    chunkup::events::MetricsComponent metrics(event_bus);

    chunkup::network::TransportOptions transport_options;
    transport_options.timeout = options.config.timeout;
    chunkup::network::AsioHttpTransport transport(transport_options);

    auto result = chunkup::upload::resumable_upload(options.config, transport, event_bus);

    if (options.verbose) {
        metrics.print_stats();
    }

    if (result.is_error()) {
        return report(result.error());
    }

    std::cout << result.value().value().dump(2) << std::endl;
    return kExitOk;
}
