#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include "combine/segment.h"
#include "combine/segment_joiner.h"

namespace pem {

struct CombinerSettings {
    std::chrono::milliseconds tolerance{kDefaultContiguityTolerance};
    bool keepSplitFiles = true;   ///< Keep the original segments after a merge
};

/**
 * @brief Summary of one combiner pass over a folder
 */
struct CombineSummary {
    size_t segmentsFound = 0;
    size_t groupsMerged = 0;
    size_t groupsFailed = 0;
    size_t filesRemoved = 0;
    size_t filesSkipped = 0;   ///< Regular files whose names are outside the segment grammar
    std::vector<std::string> mergedFiles;
    std::vector<std::string> errors;

    std::string describe() const;
};

/**
 * @brief Merges contiguous per-camera segments in an export folder
 *
 * Each camera is processed independently. A failed group keeps its original
 * files and does not stop the remaining groups.
 */
class FileCombiner {
public:
    FileCombiner(std::shared_ptr<SegmentJoiner> joiner, CombinerSettings settings);

    /**
     * @brief Combine the segments found directly inside a folder
     *
     * @param folder Folder written by the exporter
     * @return CombineSummary What was merged, removed or failed
     */
    CombineSummary combineFolder(const std::string& folder);

    /**
     * @brief List and parse the segment files in a folder
     *
     * Directories, hidden files and names outside the segment grammar are skipped.
     * @param skipped When set, receives the number of regular files skipped for their name
     */
    static std::vector<Segment> scanFolder(const std::string& folder, size_t* skipped = nullptr);

    const CombinerSettings& settings() const { return settings_; }

private:
    void mergeGroup(const std::string& folder, const SegmentGroup& group, CombineSummary& summary);

    std::shared_ptr<SegmentJoiner> joiner_;
    CombinerSettings settings_;
};

} // namespace pem
