#include "rangexfer/console_progress.hpp"
#include "rangexfer/curl_http_client.hpp"
#include "rangexfer/detail/curl_utils.hpp"
#include "rangexfer/transfer_coordinator.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

extern "C" void onInterrupt(int) {
    g_interrupted = 1;
}

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] download <url> <file>\n"
              << "       " << programName << " [options] upload <url> <file>" << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Download directory (default: current directory)\n"
              << "  -t <workers>     Parallel ranges per transfer, 1-64 (default: 8)\n"
              << "  -r <retries>     Retries per range before giving up (default: 3)\n"
              << "  -k <token>       Access token sent as the \"token\" query parameter\n"
              << "  -n <name>        Remote file name for uploads (default: local file name)\n"
              << "  -v               Verbose (debug) logging\n"
              << "  -q               Do not draw the progress line\n"
              << "  -h, --help       Show this message" << std::endl;
}

int parseInt(const std::string& option, const char* value) {
    try {
        std::size_t consumed = 0;
        const int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + std::string(value));
    }
}

void setupLogging(bool verbose) {
    auto logger = spdlog::stderr_color_mt("rangexfer");
    logger->set_pattern("%H:%M:%S.%e %^%l%$ %v");
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_default_logger(std::move(logger));
}

void printFailure(const rangexfer::TransferResult& result) {
    std::cerr << "Transfer failed: " << result.message << std::endl;
    for (const auto& failure : result.failures) {
        std::cerr << "  range " << failure.index << ": " << rangexfer::toString(failure.kind) << " - "
                  << failure.message << std::endl;
    }
    std::cerr << "Reached " << static_cast<int>(result.percent) << "% ("
              << rangexfer::ConsoleProgress::formatSize(result.transferred) << ")" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    try {
        rangexfer::TransferConfig config;
        rangexfer::TransferSpec spec;
        std::filesystem::path download_dir = std::filesystem::current_path();
        bool verbose = false;
        bool quiet = false;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-v") {
                verbose = true;
                ++arg_index;
                continue;
            }
            if (option == "-q") {
                quiet = true;
                ++arg_index;
                continue;
            }
            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            }
            if (option != "-d" && option != "-t" && option != "-r" && option != "-k" && option != "-n") {
                printUsage(argv[0]);
                return 1;
            }
            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }

            const char* value = argv[arg_index + 1];
            if (option == "-d") {
                download_dir = value;
            } else if (option == "-t") {
                config.workers = parseInt(option, value);
                if (config.workers <= 0 || config.workers > 64) {
                    throw std::runtime_error("Worker count must be between 1 and 64.");
                }
            } else if (option == "-r") {
                config.max_retries = parseInt(option, value);
                if (config.max_retries < 0) {
                    throw std::runtime_error("Retry count must not be negative.");
                }
            } else if (option == "-k") {
                spec.token = value;
            } else {
                spec.remote_name = value;
            }
            arg_index += 2;
        }

        if (argc - arg_index != 3) {
            printUsage(argv[0]);
            return 1;
        }

        const std::string command = argv[arg_index];
        spec.url = argv[arg_index + 1];
        if (command == "download") {
            spec.direction = rangexfer::Direction::Download;
            std::error_code ec;
            std::filesystem::create_directories(download_dir, ec);
            if (ec) {
                throw std::runtime_error("Failed to create download directory: " + download_dir.string() +
                                         " - " + ec.message());
            }
            spec.local_path = (download_dir / argv[arg_index + 2]).string();
        } else if (command == "upload") {
            spec.direction = rangexfer::Direction::Upload;
            spec.local_path = argv[arg_index + 2];
        } else {
            printUsage(argv[0]);
            return 1;
        }

        setupLogging(verbose);
        rangexfer::detail::ensureCurlInitialized();
        spdlog::debug("Using {}", rangexfer::detail::curlVersion());

        std::signal(SIGINT, onInterrupt);

        rangexfer::TransferCoordinator coordinator(std::make_shared<rangexfer::CurlHttpClient>(config), config);

        auto console = std::make_shared<rangexfer::ConsoleProgress>(spec.local_path, std::cout);
        rangexfer::ProgressSink sink;
        if (!quiet) {
            sink = [console](const rangexfer::ProgressSample& sample) { console->update(sample); };
        }

        auto handle = coordinator.start(spec, std::move(sink));

        std::optional<rangexfer::TransferResult> result;
        bool cancel_sent = false;
        while (!(result = coordinator.waitFor(handle, std::chrono::milliseconds(200)))) {
            if (g_interrupted && !cancel_sent) {
                cancel_sent = true;
                coordinator.cancel(handle);
            }
        }
        console->finish();

        switch (result->status) {
        case rangexfer::TransferStatus::Complete:
            spdlog::info("Done: {} ({})", spec.local_path,
                         rangexfer::ConsoleProgress::formatSize(result->transferred));
            return 0;
        case rangexfer::TransferStatus::Cancelled:
            std::cerr << "Cancelled at " << static_cast<int>(result->percent)
                      << "%. Run the same command again to resume." << std::endl;
            return 130;
        case rangexfer::TransferStatus::Failed:
            printFailure(*result);
            return 2;
        default:
            std::cerr << "Transfer stopped in state " << rangexfer::toString(result->status) << std::endl;
            return 2;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
