#include "export/export_pipeline.h"
#include "logger.h"
#include <filesystem>

namespace pem {

ExportPipeline::ExportPipeline(std::shared_ptr<Exporter> exporter,
                               RetryPolicy retryPolicy,
                               std::shared_ptr<FileCombiner> combiner,
                               std::string downloadsRoot)
    : exporter_(std::move(exporter)),
      retryPolicy_(std::move(retryPolicy)),
      combiner_(std::move(combiner)),
      downloadsRoot_(std::move(downloadsRoot)) {
}

std::string ExportPipeline::outputFolderFor(const std::string& identifier) const {
    return (std::filesystem::path(downloadsRoot_) / identifier).string();
}

PipelineResult ExportPipeline::run(const Event& event, const ProgressCallback& progress) {
    auto report = [&progress](double value, const std::string& message) {
        if (progress) {
            progress(value, message);
        }
    };

    PipelineResult result;

    ExportRequest request;
    request.identifier = event.identifier;
    request.startTime = event.startTime;
    request.endTime = event.endTime;
    request.cameras = event.cameras;
    request.outputFolder = outputFolderFor(event.identifier);

    LOG_INFO("ExportPipeline", "Exporting event " + event.identifier + " to " + request.outputFolder +
             " (cameras: " + describeCameras(event.cameras) + ")");
    report(10.0, "Exporting recordings");

    RetryOutcome outcome = retryPolicy_.execute(*exporter_, request);
    result.attempts = outcome.attempts;
    result.aborted = outcome.aborted;

    if (!outcome.success) {
        result.message = "Export failed after " + std::to_string(outcome.attempts) + " attempt(s)";
        if (outcome.lastResult.timedOut) {
            result.message += " (last attempt timed out)";
        } else if (outcome.lastResult.exitCode != 0) {
            result.message += " (exit code " + std::to_string(outcome.lastResult.exitCode) + ")";
        }
        report(100.0, result.message);
        return result;
    }

    result.exported = true;

    if (!combiner_) {
        result.message = "Export completed";
        report(100.0, result.message);
        return result;
    }

    report(70.0, "Combining segments");
    try {
        result.combine = combiner_->combineFolder(request.outputFolder);
        result.message = "Export completed; " + result.combine->describe();
    } catch (const std::exception& e) {
        // Combination problems never fail the event
        LOG_ERROR("ExportPipeline", "Combining files for event " + event.identifier + " failed: " + e.what());
        result.message = std::string("Export completed; combining failed: ") + e.what();
    }

    report(100.0, result.message);
    return result;
}

} // namespace pem
