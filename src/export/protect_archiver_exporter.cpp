#include "export/protect_archiver_exporter.h"
#include "logger.h"
#include "utils/process_runner.h"
#include "utils/time_utils.h"
#include <filesystem>
#include <sstream>

namespace pem {

ProtectArchiverExporter::ProtectArchiverExporter(ProtectArchiverSettings settings)
    : settings_(std::move(settings)) {
}

std::string ProtectArchiverExporter::camerasArgument(const std::vector<std::string>& cameras) {
    std::string joined;
    for (const auto& camera : cameras) {
        if (camera.empty()) {
            continue;
        }
        if (!joined.empty()) {
            joined += ",";
        }
        joined += camera;
    }
    return joined.empty() ? "--cameras=all" : "--cameras=" + joined;
}

std::vector<std::string> ProtectArchiverExporter::buildArguments(const ExportRequest& request) const {
    return {
        "download",
        "--address", settings_.address,
        "--username", settings_.username,
        "--password", settings_.password,
        "--start", utils::formatTimestamp(request.startTime),
        "--end", utils::formatTimestamp(request.endTime),
        camerasArgument(request.cameras),
        "--no-use-subfolders",
        request.outputFolder
    };
}

std::string ProtectArchiverExporter::describeCommand(const std::vector<std::string>& args) const {
    std::stringstream ss;
    ss << settings_.command;
    bool maskNext = false;
    for (const auto& arg : args) {
        ss << ' ' << (maskNext ? "***" : arg);
        maskNext = (arg == "--password");
    }
    return ss.str();
}

ExportResult ProtectArchiverExporter::exportRange(const ExportRequest& request) {
    std::error_code ec;
    std::filesystem::create_directories(request.outputFolder, ec);
    if (ec) {
        LOG_ERROR("Exporter", "Cannot create target folder " + request.outputFolder + ": " + ec.message());
        return ExportResult::failed(-1, "cannot create output folder: " + ec.message());
    }

    auto args = buildArguments(request);
    LOG_INFO("Exporter", "Running export for event " + request.identifier + ": " + describeCommand(args));

    auto commandResult = utils::CommandRunner::run(
        settings_.command, args,
        std::chrono::duration_cast<std::chrono::milliseconds>(settings_.timeout));

    for (const auto& line : utils::splitLines(commandResult.stdoutText)) {
        LOG_INFO("Exporter", "[" + request.identifier + "] " + line);
    }
    for (const auto& line : utils::splitLines(commandResult.stderrText)) {
        LOG_ERROR("Exporter", "[" + request.identifier + "] " + line);
    }

    ExportResult result;
    result.success = commandResult.success();
    result.exitCode = commandResult.exitCode;
    result.timedOut = commandResult.timedOut;
    result.duration = commandResult.duration;
    result.diagnostics = commandResult.stderrText.empty() ? commandResult.stdoutText
                                                           : commandResult.stderrText;

    if (result.success) {
        LOG_INFO("Exporter", "Export completed for event " + request.identifier + " in " +
                 std::to_string(result.duration.count()) + "ms");
    } else if (result.timedOut) {
        LOG_ERROR("Exporter", "Export for event " + request.identifier + " timed out after " +
                  std::to_string(settings_.timeout.count()) + "s");
    } else {
        LOG_ERROR("Exporter", "Export failed for event " + request.identifier +
                  " with return code " + std::to_string(result.exitCode));
    }

    return result;
}

} // namespace pem
