#include "bulkfetch/artifact_materializer.hpp"
#include "bulkfetch/curl_transport.hpp"
#include "bulkfetch/detail/curl_utils.hpp"
#include "bulkfetch/errors.hpp"
#include "bulkfetch/logging.hpp"
#include "bulkfetch/progress_panel.hpp"
#include "bulkfetch/transfer_controller.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

void onInterrupt(int) {
    g_interrupted.store(true);
}

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [options] <folder> <filename>\n"
              << "       " << programName
              << " [options] --bulk <recording-id> [<recording-id> ...]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -u <url>         API base URL (default: http://localhost:8001)\n"
              << "  -d <directory>   Download directory (default: current directory)\n"
              << "  -l <level>       Log level: trace, debug, info, warn, err, off (default: warn)\n"
              << "  -o <file>        Also write the log to <file>\n"
              << "  -i <seconds>     Idle read timeout, 0 disables (default: 60)\n"
              << "  -h, --help       Show this message" << std::endl;
}

constexpr int kExitCancelled = 130;

} // namespace

int main(int argc, char** argv) {
    try {
        bulkfetch::detail::ensureCurlInitialized();
        std::string api_url = "http://localhost:8001";
        std::filesystem::path download_dir = std::filesystem::current_path();
        auto log_level = bulkfetch::logging::Level::warn;
        std::optional<std::string> log_file;
        bulkfetch::CurlTransportOptions transport_options;
        bool bulk = false;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "--bulk") {
                bulk = true;
                arg_index += 1;
                break;
            }
            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            }
            if (option != "-u" && option != "-d" && option != "-l" && option != "-o" && option != "-i") {
                printUsage(argv[0]);
                return 1;
            }
            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }

            const std::string value = argv[arg_index + 1];
            if (option == "-u") {
                api_url = value;
            } else if (option == "-d") {
                download_dir = value;
                std::error_code ec;
                std::filesystem::create_directories(download_dir, ec);
                if (ec) {
                    throw std::runtime_error("Failed to create download directory: "
                         + download_dir.string() + " - " + ec.message());
                }
            } else if (option == "-l") {
                log_level = bulkfetch::logging::parseLevel(value);
            } else if (option == "-o") {
                log_file = value;
            } else {
                int seconds = 0;
                try {
                    seconds = std::stoi(value);
                } catch (const std::exception&) {
                    throw std::runtime_error("Invalid idle timeout: " + value);
                }
                if (seconds < 0) {
                    throw std::runtime_error("Idle timeout must not be negative.");
                }
                transport_options.idle_timeout = std::chrono::seconds(seconds);
            }
            arg_index += 2;
        }

        bulkfetch::logging::init(log_level, log_file);

        bulkfetch::TransferRequest request;
        if (bulk) {
            if (arg_index >= argc) {
                printUsage(argv[0]);
                return 1;
            }
            const std::vector<std::string> ids(argv + arg_index, argv + argc);
            request = bulkfetch::bulkRecordingsDownload(api_url, ids);
        } else {
            if (argc - arg_index != 2) {
                printUsage(argv[0]);
                return 1;
            }
            request = bulkfetch::recordingDownload(api_url, argv[arg_index], argv[arg_index + 1]);
        }

        auto transport = std::make_shared<bulkfetch::CurlTransport>(transport_options);
        auto sink = std::make_shared<bulkfetch::DirectorySink>(download_dir);
        // Staging next to the destination keeps the final save a rename.
        bulkfetch::ArtifactMaterializer materializer{sink, download_dir};
        bulkfetch::TransferController controller{transport, std::move(materializer)};

        std::signal(SIGINT, onInterrupt);

        bulkfetch::ProgressPanel panel{std::cout};
        auto outcome = controller.startAsync(request);
        while (true) {
            if (g_interrupted.exchange(false)) {
                controller.cancel();
            }
            panel.render(controller.state().snapshot());
            if (outcome.wait_for(std::chrono::milliseconds(200)) == std::future_status::ready) {
                break;
            }
        }

        try {
            const auto result = outcome.get();
            panel.clear();
            if (result == bulkfetch::TransferOutcome::Cancelled) {
                std::cerr << "Download cancelled" << std::endl;
                return kExitCancelled;
            }
            const auto saved = controller.lastSavedPath();
            std::cout << "Saved " << (saved ? saved->string() : request.destination_filename) << std::endl;
        } catch (const bulkfetch::RequestFailed& ex) {
            panel.clear();
            std::cerr << "Download failed (HTTP " << ex.statusCode() << "): " << ex.what() << std::endl;
            return 1;
        }

    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
