#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "combine/file_combiner.h"
#include "events/event.h"
#include "export/exporter.h"
#include "export/retry_policy.h"

namespace pem {

struct PipelineResult {
    bool exported = false;
    int attempts = 0;
    bool aborted = false;
    std::optional<CombineSummary> combine;   ///< Set when the combiner ran
    std::string message;
};

/**
 * @brief Export, retry and combine for one event
 *
 * Output lands in <downloadsRoot>/<identifier>, so repeated exports of an
 * identifier share a folder and different identifiers never collide.
 */
class ExportPipeline {
public:
    using ProgressCallback = std::function<void(double, std::string)>;

    /**
     * @brief Construct a pipeline
     *
     * @param exporter Exporter invoked for each attempt
     * @param retryPolicy Attempt limit and delay
     * @param combiner Runs after a successful export; nullptr disables combining
     * @param downloadsRoot Root folder for per-event output folders
     */
    ExportPipeline(std::shared_ptr<Exporter> exporter,
                   RetryPolicy retryPolicy,
                   std::shared_ptr<FileCombiner> combiner,
                   std::string downloadsRoot);

    /**
     * @brief Run the pipeline for an event that reached its end time
     *
     * Never throws for export or combination failures; they are reported in
     * the result and the log.
     */
    PipelineResult run(const Event& event, const ProgressCallback& progress = nullptr);

    std::string outputFolderFor(const std::string& identifier) const;

private:
    std::shared_ptr<Exporter> exporter_;
    RetryPolicy retryPolicy_;
    std::shared_ptr<FileCombiner> combiner_;
    std::string downloadsRoot_;
};

} // namespace pem
