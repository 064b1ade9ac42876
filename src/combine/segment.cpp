#include "combine/segment.h"
#include "utils/time_utils.h"
#include <algorithm>

namespace pem {

std::optional<Segment> parseSegmentFileName(const std::string& fileName) {
    if (fileName.empty() || fileName.front() == '.') {
        return std::nullopt;
    }

    std::string stem = fileName;
    std::string extension;
    size_t dot = fileName.rfind('.');
    if (dot != std::string::npos) {
        stem = fileName.substr(0, dot);
        extension = fileName.substr(dot + 1);
    }

    size_t endSep = stem.rfind('_');
    if (endSep == std::string::npos || endSep == 0) {
        return std::nullopt;
    }
    size_t startSep = stem.rfind('_', endSep - 1);
    if (startSep == std::string::npos || startSep == 0) {
        return std::nullopt;
    }

    auto start = utils::parseCompactTimestamp(stem.substr(startSep + 1, endSep - startSep - 1));
    auto end = utils::parseCompactTimestamp(stem.substr(endSep + 1));
    if (!start || !end || *end < *start) {
        return std::nullopt;
    }

    Segment segment;
    segment.cameraId = stem.substr(0, startSep);
    segment.start = *start;
    segment.end = *end;
    segment.extension = extension;
    return segment;
}

std::string formatSegmentFileName(const std::string& cameraId, Timestamp start, Timestamp end,
                                  const std::string& extension) {
    std::string name = cameraId + "_" + utils::formatCompactTimestamp(start) + "_" +
                       utils::formatCompactTimestamp(end);
    if (!extension.empty()) {
        name += "." + extension;
    }
    return name;
}

std::vector<SegmentGroup> groupContiguousSegments(std::vector<Segment> segments,
                                                  std::chrono::milliseconds tolerance) {
    std::sort(segments.begin(), segments.end(), [](const Segment& a, const Segment& b) {
        if (a.start != b.start) {
            return a.start < b.start;
        }
        return a.end > b.end;
    });

    std::vector<SegmentGroup> groups;
    for (auto& segment : segments) {
        if (!groups.empty()) {
            SegmentGroup& current = groups.back();
            if (segment.end <= current.end) {
                continue;  // already covered by the running group
            }
            if (segment.start <= current.end + tolerance) {
                current.end = segment.end;
                current.members.push_back(std::move(segment));
                continue;
            }
        }

        SegmentGroup group;
        group.start = segment.start;
        group.end = segment.end;
        group.members.push_back(std::move(segment));
        groups.push_back(std::move(group));
    }

    return groups;
}

} // namespace pem
