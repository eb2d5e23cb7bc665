/**
 * QSDE - Quick Secure Download Engine
 *
 * Command line driver: runs one batch described by a JSON manifest and
 * prints the batch summary as JSON.
 *
 * @version 1.0.0
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "core/transfer/Engine.hpp"
#include "core/transfer/EngineConfig.hpp"
#include "core/transfer/Manifest.hpp"
#include "ui/ConsoleReporter.hpp"
#include "utils/JsonUtils.hpp"

namespace fs = std::filesystem;

using qsde::core::Config;
using qsde::core::Logger;
using qsde::core::LogLevel;
namespace transfer = qsde::core::transfer;

namespace {

// Set from the signal handler, consumed by the watcher thread
std::atomic<bool> g_stopRequested{false};

constexpr int kExitSuccess = 0;
constexpr int kExitIncomplete = 1;
constexpr int kExitUsage = 2;

struct Options {
    fs::path manifestPath;
    std::optional<fs::path> configPath;
    std::optional<fs::path> outputPath;
    std::optional<size_t> maxConcurrency;
    bool debug{false};
    bool quiet{false};
};

/**
 * Signal handler: only flags the request, the watcher thread cancels
 */
void signalHandler(int /*signal*/) {
    g_stopRequested = true;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void printUsage(const char* program) {
    std::cout << "QSDE - concurrent verified downloads\n"
              << "\nUsage: " << program << " [options] <manifest.json>\n"
              << "\nOptions:\n"
              << "  -c, --config FILE       Load engine configuration from FILE\n"
              << "  -j, --concurrency N     Maximum simultaneous transfers\n"
              << "  -o, --output FILE       Also write the JSON summary to FILE\n"
              << "  -q, --quiet             No progress lines\n"
              << "  -d, --debug             Enable debug logging\n"
              << "  -h, --help              Show this help message\n"
              << "  -v, --version           Show version information\n"
              << std::endl;
}

/**
 * Parse command line arguments
 * @return Options, or the exit code to return immediately
 */
std::variant<Options, int> parseArguments(int argc, char* argv[]) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        auto nextValue = [&](const std::string& name) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return kExitSuccess;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "qsde v1.0.0" << std::endl;
            return kExitSuccess;
        } else if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--quiet" || arg == "-q") {
            options.quiet = true;
        } else if (arg == "--config" || arg == "-c") {
            auto value = nextValue(arg);
            if (!value) return kExitUsage;
            options.configPath = *value;
        } else if (arg == "--output" || arg == "-o") {
            auto value = nextValue(arg);
            if (!value) return kExitUsage;
            options.outputPath = *value;
        } else if (arg == "--concurrency" || arg == "-j") {
            auto value = nextValue(arg);
            if (!value) return kExitUsage;
            char* end = nullptr;
            const unsigned long long limit = std::strtoull(value->c_str(), &end, 10);
            if (end == value->c_str() || *end != '\0' || limit == 0) {
                std::cerr << "Invalid concurrency: " << *value << std::endl;
                return kExitUsage;
            }
            options.maxConcurrency = static_cast<size_t>(limit);
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return kExitUsage;
        } else if (options.manifestPath.empty()) {
            options.manifestPath = arg;
        } else {
            std::cerr << "Only one manifest may be given" << std::endl;
            return kExitUsage;
        }
    }

    if (options.manifestPath.empty()) {
        printUsage(argv[0]);
        return kExitUsage;
    }
    return options;
}

/**
 * Load configuration file over the defaults
 */
bool loadConfiguration(Config& config, const std::optional<fs::path>& path) {
    if (!path) {
        return true;
    }
    if (!config.load(path->string())) {
        std::cerr << "Cannot load configuration from " << path->string() << std::endl;
        return false;
    }
    return true;
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    auto parsed = parseArguments(argc, argv);
    if (const int* exitCode = std::get_if<int>(&parsed)) {
        return *exitCode;
    }
    const Options options = std::get<Options>(parsed);

    Config config;
    if (!loadConfiguration(config, options.configPath)) {
        return kExitUsage;
    }

    // Initialize logger
    Logger::instance().initialize(
        options.debug ? LogLevel::Debug
                      : qsde::core::logLevelFromString(config.get<std::string>("log.level", "info")),
        config.get<std::string>("log.directory", "")
    );

    auto& logger = Logger::instance();
    logger.info("qsde v1.0.0 starting...");
    if (options.configPath) {
        logger.info("Configuration loaded from {}", options.configPath->string());
    }

    transfer::Manifest manifest;
    try {
        manifest = transfer::Manifest::load(options.manifestPath);
    } catch (const std::exception& e) {
        logger.critical("Invalid manifest: {}", e.what());
        return kExitUsage;
    }

    const std::optional<size_t> maxConcurrency =
        options.maxConcurrency ? options.maxConcurrency : manifest.maxConcurrency;

    setupSignalHandlers();

    try {
        transfer::Engine engine(transfer::EngineConfig::fromConfig(config));
        qsde::ui::ConsoleReporter reporter(engine, options.quiet ? 0 : 10);

        // Turns a signal into CancelAll outside of signal context
        std::atomic<bool> finished{false};
        std::thread watcher([&engine, &finished, &logger] {
            while (!finished) {
                if (g_stopRequested.exchange(false)) {
                    logger.warn("Interrupt received, cancelling downloads...");
                    engine.cancelAll();
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });

        struct WatcherStop {
            std::atomic<bool>& finished;
            std::thread& watcher;
            ~WatcherStop() {
                finished = true;
                if (watcher.joinable()) watcher.join();
            }
        } watcherStop{finished, watcher};

        transfer::BatchSummary summary = engine.submit(std::move(manifest.tasks), maxConcurrency);

        if (!engine.flushEvents(std::chrono::milliseconds(1000))) {
            logger.debug("Progress events still queued at exit");
        }
        reporter.reportSummary(summary);
        logger.flush();

        // stdout carries only the summary document
        const qsde::utils::json document = summary;
        std::cout << qsde::utils::JsonUtils::prettyPrint(document) << std::endl;

        if (options.outputPath && !qsde::utils::JsonUtils::writeFile(*options.outputPath, document)) {
            logger.error("Cannot write summary to {}", options.outputPath->string());
        }

        logger.info("qsde shutdown complete");
        return summary.allSucceeded() ? kExitSuccess : kExitIncomplete;

    } catch (const std::invalid_argument& e) {
        logger.critical("Invalid batch: {}", e.what());
        return kExitUsage;
    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return kExitIncomplete;
    }
}
