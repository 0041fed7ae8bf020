#include "dirmirror/cancellation.hpp"
#include "dirmirror/curl_http_client.hpp"
#include "dirmirror/detail/curl_utils.hpp"
#include "dirmirror/errors.hpp"
#include "dirmirror/options.hpp"
#include "dirmirror/orchestrator.hpp"
#include "dirmirror/url.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitError = 1;
constexpr int kExitPartialFailure = 2;

dirmirror::CancellationToken g_cancel;

extern "C" void onSignal(int) {
    g_cancel.cancel();
}

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <url>" << std::endl;
    std::cerr << "Options:\n"
              << "  -f <folder>      Target folder to download (relative to the URL)\n"
              << "  -o <directory>   Output directory (default: downloads)\n"
              << "  -t <threads>     Number of download threads (default: 8)\n"
              << "  -r <retries>     Maximum attempts per file and per chunk (default: 5)\n"
              << "  -c               Download large files in parallel chunks\n"
              << "  -s <MB>          Chunk size in megabytes (default: 10)\n"
              << "  -T <seconds>     Request timeout (default: 30)\n"
              << "  -v               Verbose logging\n"
              << "  -h, --help       Show this message" << std::endl;
}

int parseInt(const std::string& option, const char* value, int min, int max) {
    int parsed = 0;
    try {
        parsed = std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + std::string(value));
    }
    if (parsed < min || parsed > max) {
        throw std::runtime_error("Value for " + option + " must be between " + std::to_string(min) + " and " +
                                 std::to_string(max));
    }
    return parsed;
}

} // namespace

int main(int argc, char** argv) {
    try {
        dirmirror::detail::ensureCurlInitialized();
        spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

        dirmirror::MirrorOptions options;
        std::string folder;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return kExitSuccess;
            }
            if (option == "-c") {
                options.chunked = true;
                ++arg_index;
                continue;
            }
            if (option == "-v") {
                spdlog::set_level(spdlog::level::debug);
                ++arg_index;
                continue;
            }
            if (option != "-f" && option != "-o" && option != "-t" && option != "-r" && option != "-s" &&
                option != "-T") {
                printUsage(argv[0]);
                return kExitError;
            }
            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return kExitError;
            }

            const char* value = argv[arg_index + 1];
            if (option == "-f") {
                folder = value;
            } else if (option == "-o") {
                options.output_dir = value;
            } else if (option == "-t") {
                options.workers = parseInt(option, value, 1, 64);
            } else if (option == "-r") {
                options.retry.max_attempts = parseInt(option, value, 1, 100);
            } else if (option == "-s") {
                options.chunk_size = static_cast<std::uint64_t>(parseInt(option, value, 1, 4096)) * 1024 * 1024;
            } else {
                options.timeouts.request = std::chrono::seconds(parseInt(option, value, 1, 3600));
            }
            arg_index += 2;
        }

        if (argc - arg_index != 1) {
            printUsage(argv[0]);
            return kExitError;
        }

        options.base_url = argv[arg_index];
        if (!dirmirror::hasSchemeAndHost(options.base_url)) {
            std::cerr << "Error: Invalid URL provided" << std::endl;
            return kExitError;
        }

        std::error_code ec;
        std::filesystem::create_directories(options.output_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create output directory: "
                 + options.output_dir.string() + " - " + ec.message());
        }

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        dirmirror::CurlHttpClient client(options.timeouts, g_cancel);
        dirmirror::DownloadOrchestrator orchestrator(std::move(options), client, g_cancel);
        const auto summary = orchestrator.run(folder);

        return summary.allSucceeded() ? kExitSuccess : kExitPartialFailure;
    } catch (const dirmirror::Interrupted&) {
        std::cerr << "\nDownload interrupted by user" << std::endl;
        return kExitError;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return kExitError;
    }
}
