#include "combine/file_combiner.h"
#include "logger.h"
#include <filesystem>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace pem {

std::string CombineSummary::describe() const {
    std::stringstream ss;
    ss << segmentsFound << " segment(s), " << groupsMerged << " group(s) merged, "
       << groupsFailed << " failed, " << filesRemoved << " original(s) removed";
    if (filesSkipped > 0) {
        ss << ", " << filesSkipped << " unrecognised file(s) skipped";
    }
    return ss.str();
}

FileCombiner::FileCombiner(std::shared_ptr<SegmentJoiner> joiner, CombinerSettings settings)
    : joiner_(std::move(joiner)), settings_(settings) {
}

std::vector<Segment> FileCombiner::scanFolder(const std::string& folder, size_t* skipped) {
    std::vector<Segment> segments;
    size_t unnamed = 0;

    std::error_code ec;
    fs::directory_iterator it(folder, ec);
    if (ec) {
        LOG_ERROR("FileCombiner", "Cannot list " + folder + ": " + ec.message());
        return segments;
    }

    for (const auto& entry : it) {
        std::error_code typeEc;
        if (!entry.is_regular_file(typeEc)) {
            continue;
        }

        std::string fileName = entry.path().filename().string();
        auto segment = parseSegmentFileName(fileName);
        if (!segment) {
            LOG_DEBUG("FileCombiner", "Skipping " + fileName + ": not a segment file name");
            if (fileName.empty() || fileName[0] != '.') {
                ++unnamed;
            }
            continue;
        }
        segment->path = entry.path().string();
        segments.push_back(std::move(*segment));
    }

    if (skipped) {
        *skipped = unnamed;
    }
    return segments;
}

CombineSummary FileCombiner::combineFolder(const std::string& folder) {
    CombineSummary summary;

    auto segments = scanFolder(folder, &summary.filesSkipped);
    summary.segmentsFound = segments.size();
    if (summary.filesSkipped > 0) {
        LOG_WARN("FileCombiner", std::to_string(summary.filesSkipped) + " file(s) in " + folder +
                 " do not follow <camera>_<start>_<end>.<ext> and will not be combined");
    }
    if (segments.empty()) {
        LOG_INFO("FileCombiner", "No segment files found in " + folder);
        return summary;
    }

    // One bucket per (camera, extension); files of different containers never mix
    std::map<std::pair<std::string, std::string>, std::vector<Segment>> byCamera;
    for (auto& segment : segments) {
        auto key = std::make_pair(segment.cameraId, segment.extension);
        byCamera[key].push_back(std::move(segment));
    }

    for (auto& bucket : byCamera) {
        const std::string& cameraId = bucket.first.first;
        auto groups = groupContiguousSegments(std::move(bucket.second), settings_.tolerance);

        size_t mergeable = 0;
        for (const auto& group : groups) {
            if (group.members.size() >= 2) {
                ++mergeable;
            }
        }
        LOG_INFO("FileCombiner", "Camera " + cameraId + ": " + std::to_string(groups.size()) +
                 " contiguous group(s), " + std::to_string(mergeable) + " to merge");

        for (const auto& group : groups) {
            if (group.members.size() < 2) {
                continue;
            }
            try {
                mergeGroup(folder, group, summary);
            } catch (const std::exception& e) {
                ++summary.groupsFailed;
                summary.errors.push_back(e.what());
                LOG_ERROR("FileCombiner", "Merge failed for camera " + cameraId + ": " + e.what());
            }
        }
    }

    LOG_INFO("FileCombiner", "Combined " + folder + ": " + summary.describe());
    return summary;
}

void FileCombiner::mergeGroup(const std::string& folder, const SegmentGroup& group,
                              CombineSummary& summary) {
    const Segment& first = group.members.front();
    std::string targetName = formatSegmentFileName(first.cameraId, group.start, group.end, first.extension);
    fs::path target = fs::path(folder) / targetName;
    fs::path temp = fs::path(folder) /
                    ("." + targetName + ".partial" + (first.extension.empty() ? "" : "." + first.extension));

    auto fail = [&](const std::string& reason) {
        std::error_code ec;
        fs::remove(temp, ec);
        ++summary.groupsFailed;
        summary.errors.push_back(targetName + ": " + reason);
        LOG_ERROR("FileCombiner", "Could not merge into " + targetName + ": " + reason +
                  " (originals kept)");
    };

    if (fs::exists(target)) {
        fail("target already exists");
        return;
    }

    std::vector<std::string> inputs;
    inputs.reserve(group.members.size());
    for (const auto& member : group.members) {
        inputs.push_back(member.path);
    }

    std::error_code ec;
    fs::remove(temp, ec);

    std::string error;
    if (!joiner_->join(inputs, temp.string(), error)) {
        fail(error);
        return;
    }

    fs::rename(temp, target, ec);
    if (ec) {
        fail("rename failed: " + ec.message());
        return;
    }

    ++summary.groupsMerged;
    summary.mergedFiles.push_back(target.string());
    LOG_INFO("FileCombiner", "Merged " + std::to_string(inputs.size()) + " segment(s) into " +
             targetName + " using " + joiner_->name());

    if (settings_.keepSplitFiles) {
        return;
    }

    for (const auto& input : inputs) {
        std::error_code removeEc;
        if (fs::remove(input, removeEc)) {
            ++summary.filesRemoved;
        } else if (removeEc) {
            LOG_WARN("FileCombiner", "Could not remove " + input + ": " + removeEc.message());
        }
    }
}

} // namespace pem
