#include <iostream>
#include <memory>
#include <csignal>
#include <boost/program_options.hpp>
#include "api.h"
#include "combine/file_combiner.h"
#include "combine/segment_joiner.h"
#include "events/event_manager.h"
#include "events/status_reporter.h"
#include "export/export_pipeline.h"
#include "export/protect_archiver_exporter.h"
#include "export/retry_policy.h"
#include "global_config.h"
#include "logger.h"
#include "utils/stop_flag.h"
#include "utils/time_utils.h"

namespace po = boost::program_options;
using namespace pem;

// Global objects for signal handling
std::unique_ptr<Api> apiServer;
utils::StopFlag shutdownFlag;

// Signal handler for graceful shutdown
void signalHandler(int signal) {
    static bool shutdownInProgress = false;

    if (shutdownInProgress) {
        std::cout << "Shutdown already in progress. Press Ctrl+C again to force exit." << std::endl;
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        return;
    }
    shutdownInProgress = true;

    std::cout << "\nReceived signal " << signal << " ("
              << (signal == SIGINT ? "SIGINT/Ctrl+C" : signal == SIGTERM ? "SIGTERM" : "Unknown")
              << "), shutting down..." << std::endl;

    // Interrupts retry delays of running exports
    shutdownFlag.requestStop();

    if (apiServer) {
        apiServer->stop();
    }
}

namespace {

std::shared_ptr<SegmentJoiner> makeJoiner(const Settings& settings) {
    if (settings.combineMethod == "binary") {
        return std::make_shared<BinaryConcatJoiner>();
    }
    if (settings.combineMethod == "ffmpeg") {
        return std::make_shared<FfmpegConcatJoiner>(settings.ffmpegCommand,
                                                    std::chrono::seconds(settings.exportTimeoutSeconds));
    }
    return nullptr;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Show help message")
        ("port,p", po::value<int>()->default_value(8888), "Port to listen on")
        ("threads,t", po::value<int>()->default_value(4), "Number of HTTP worker threads")
        ("log-level", po::value<std::string>()->default_value("info"), "Log level (trace, debug, info, warn, error, fatal, off)")
        ("log-file", po::value<std::string>(), "Log file path")
        ("static-dir", po::value<std::string>()->default_value(""), "Directory with web UI assets");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << "Protect Event Manager - recording export scheduler" << std::endl;
            std::cout << desc << std::endl;
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cout << desc << std::endl;
        return 1;
    }

    Logger::getInstance().setLogLevel(parseLogLevel(vm["log-level"].as<std::string>()));

    if (vm.count("log-file")) {
        std::string logFilePath = vm["log-file"].as<std::string>();
        if (!Logger::getInstance().setOutputFile(logFilePath)) {
            std::cerr << "Failed to open log file: " << logFilePath << std::endl;
            return 1;
        }
        LOG_INFO("Main", "Logging to file: " + logFilePath);
    }

    try {
        if (!GlobalConfig::getInstance().initialize(vm["port"].as<int>(), vm["threads"].as<int>(),
                                                    vm["static-dir"].as<std::string>())) {
            LOG_ERROR("Main", "Failed to initialize global configuration");
            return 1;
        }
        Settings settings = GlobalConfig::getInstance().getSettings();

        std::string zone = utils::applyTimezone(settings.timezone);
        LOG_INFO("Main", "Using timezone " + zone);

        ProtectArchiverSettings exporterSettings;
        exporterSettings.command = settings.exporterCommand;
        exporterSettings.address = settings.protectAddress;
        exporterSettings.username = settings.protectUsername;
        exporterSettings.password = settings.protectPassword;
        exporterSettings.timeout = std::chrono::seconds(settings.exportTimeoutSeconds);
        auto exporter = std::make_shared<ProtectArchiverExporter>(exporterSettings);

        RetryPolicy retryPolicy(settings.maxRetries, std::chrono::seconds(settings.retryDelaySeconds),
                                [](std::chrono::milliseconds delay) { return shutdownFlag.waitFor(delay); });

        std::shared_ptr<FileCombiner> combiner;
        if (auto joiner = makeJoiner(settings)) {
            CombinerSettings combinerSettings;
            combinerSettings.tolerance = std::chrono::milliseconds(
                static_cast<long long>(settings.combineToleranceSeconds * 1000.0));
            combinerSettings.keepSplitFiles = settings.keepSplitFiles;
            combiner = std::make_shared<FileCombiner>(joiner, combinerSettings);
            LOG_INFO("Main", "Segment combining enabled using " + joiner->name());
        } else {
            LOG_INFO("Main", "Segment combining disabled");
        }

        auto pipeline = std::make_shared<ExportPipeline>(exporter, retryPolicy, combiner, settings.downloadsDir);

        EventDefaults defaults;
        defaults.pastMinutes = settings.defaultPastMinutes;
        defaults.futureMinutes = settings.defaultFutureMinutes;

        EventManager manager(pipeline, defaults, static_cast<size_t>(settings.exportWorkers));
        manager.start();

        StatusReporter reporter(manager.registry(), std::chrono::seconds(settings.logIntervalSeconds));
        reporter.start();

        apiServer = std::make_unique<Api>(manager, settings.port, settings.httpThreads, settings.staticDir);

        LOG_INFO("Main", "Event manager initialized and ready");
        if (!shutdownFlag.stopRequested()) {
            apiServer->start();
        }

        shutdownFlag.requestStop();
        reporter.stop();
        manager.stop();
        apiServer.reset();
    } catch (const std::exception& e) {
        LOG_FATAL("Main", std::string("Fatal error: ") + e.what());
        return 1;
    }

    LOG_INFO("Main", "Protect Event Manager shut down successfully");
    return 0;
}
