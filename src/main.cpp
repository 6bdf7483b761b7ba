#include "coursedl/detail/curl_utils.hpp"
#include "coursedl/download_manager.hpp"
#include "coursedl/engine_context.hpp"
#include "coursedl/log.hpp"
#include "coursedl/manifest.hpp"
#include "coursedl/progress_panel.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <fmt/format.h>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void onSignal(int) { g_interrupted = 1; }

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <manifest.json>" << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>       Base directory for relative destinations (default: current directory)\n"
              << "  -t <workers>         Concurrent downloads, 1-10 (default: 3)\n"
              << "  -r <attempts>        Attempts per task, 1-10 (default: 3)\n"
              << "  --rate <bytes/s>     Aggregate download rate limit\n"
              << "  --delay <ms>         Pause between tasks of one worker (default: 1000)\n"
              << "  --status <file>      Status document (default: <directory>/.coursedl-status.json)\n"
              << "  --no-validate        Only check that files exist after download\n"
              << "  --no-resume          Always restart partial files from byte 0\n"
              << "  --purge              Drop status records of tasks not in the manifest\n"
              << "  --log-level <level>  trace, debug, info, warn, error (default: info)\n"
              << "  --log-file <file>    Also write the log to a file\n"
              << "  -q, --quiet          Do not draw the progress panel\n"
              << "  -h, --help           Show this message" << std::endl;
}

int parseInt(const std::string& option, const char* value) {
    try {
        std::size_t used = 0;
        const int parsed = std::stoi(value, &used);
        if (used != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Invalid value for {}: {}", option, value));
    }
}

std::uint64_t parseUnsigned(const std::string& option, const char* value) {
    try {
        std::size_t used = 0;
        const unsigned long long parsed = std::stoull(value, &used);
        if (used != std::string(value).size() || value[0] == '-') {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error(fmt::format("Invalid value for {}: {}", option, value));
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        coursedl::detail::ensureCurlInitialized();

        coursedl::EngineConfig config;
        std::filesystem::path download_dir = std::filesystem::current_path();
        std::filesystem::path manifest_path;
        bool purge = false;
        bool quiet = false;

        int arg_index = 1;
        while (arg_index < argc) {
            const std::string option = argv[arg_index];
            const bool has_value = arg_index + 1 < argc;

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else if (option == "--no-validate") {
                config.validate_integrity = false;
            } else if (option == "--no-resume") {
                config.resume_on_restart = false;
            } else if (option == "--purge") {
                purge = true;
            } else if (option == "-q" || option == "--quiet") {
                quiet = true;
            } else if (option == "-d" || option == "-t" || option == "-r" || option == "--rate" ||
                       option == "--delay" || option == "--status" || option == "--log-level" ||
                       option == "--log-file") {
                if (!has_value) {
                    printUsage(argv[0]);
                    return 1;
                }
                const char* value = argv[++arg_index];
                if (option == "-d") {
                    download_dir = value;
                } else if (option == "-t") {
                    config.concurrency = parseInt(option, value);
                } else if (option == "-r") {
                    config.retry_attempts = parseInt(option, value);
                } else if (option == "--rate") {
                    config.rate_limit_bytes_per_sec = parseUnsigned(option, value);
                } else if (option == "--delay") {
                    config.inter_task_delay =
                        std::chrono::milliseconds(static_cast<long long>(parseUnsigned(option, value)));
                } else if (option == "--status") {
                    config.status_file = value;
                } else if (option == "--log-level") {
                    coursedl::log::setLevelFromString(value);
                } else if (!coursedl::log::addFileSink(value)) {
                    return 1;
                }
            } else if (!option.empty() && option[0] == '-') {
                printUsage(argv[0]);
                return 1;
            } else if (manifest_path.empty()) {
                manifest_path = option;
            } else {
                printUsage(argv[0]);
                return 1;
            }
            ++arg_index;
        }

        if (manifest_path.empty()) {
            printUsage(argv[0]);
            return 1;
        }

        std::error_code ec;
        std::filesystem::create_directories(download_dir, ec);
        if (ec) {
            throw std::runtime_error("Failed to create download directory: " + download_dir.string() + " - " +
                                     ec.message());
        }
        if (config.status_file.empty()) {
            config.status_file = download_dir / ".coursedl-status.json";
        }

        const auto tasks = coursedl::loadManifest(manifest_path, download_dir);

        coursedl::EngineContext context(config);
        std::unique_ptr<coursedl::ProgressPanel> panel;
        if (!quiet) {
            panel = std::make_unique<coursedl::ProgressPanel>(std::cout);
            for (const auto& task : tasks) {
                panel->setLabel(task.id, task.destination.filename().string());
            }
            context.setProgressSink([&panel](const coursedl::ProgressEvent& event) { panel->onEvent(event); });
        }

        coursedl::DownloadManager manager(context);
        manager.submit(tasks);
        if (purge) {
            manager.purgeUnreferenced();
        }

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        // Watches for Ctrl-C and redraws the panel while the run is in progress.
        std::atomic<bool> finished{false};
        std::thread watcher([&]() {
            bool cancelled = false;
            while (!finished) {
                if (g_interrupted && !cancelled) {
                    manager.cancel();
                    cancelled = true;
                }
                if (panel) {
                    panel->redraw();
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        });

        coursedl::RunSummary summary;
        try {
            summary = manager.run();
        } catch (...) {
            finished = true;
            watcher.join();
            throw;
        }
        finished = true;
        watcher.join();
        if (panel) {
            panel->redraw();
        }

        std::cout << fmt::format("{} completed, {} up to date, {} failed, {} paused, {} not started\n",
                                 summary.completed, summary.skipped, summary.failed, summary.paused,
                                 summary.not_started);
        for (const auto& failure : summary.failures) {
            std::cerr << fmt::format("  {}: {}\n", failure.task_id, failure.error.describe());
        }
        if (summary.persistence_degraded) {
            std::cerr << "Warning: the status document could not always be written; "
                         "resume information may be stale\n";
        }
        return summary.failed > 0 ? 1 : 0;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
