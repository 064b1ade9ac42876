#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace pem {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief One recording file covering [start, end) for a camera
 *
 * Segment file names follow "<camera>_<start>_<end>.<ext>" where the
 * timestamps use the compact form "YYYYMMDDTHHMMSS+zzzz". The camera part
 * may contain underscores; parsing splits from the right.
 */
struct Segment {
    std::string path;          ///< Full path, empty for synthetic segments
    std::string cameraId;
    Timestamp start;
    Timestamp end;
    std::string extension;     ///< Without the leading dot, may be empty
};

/**
 * @brief A run of contiguous segments that will be joined into one file
 */
struct SegmentGroup {
    std::vector<Segment> members;   ///< Ordered by start time
    Timestamp start;                ///< min(start) over members
    Timestamp end;                  ///< max(end) over members
};

/// Default gap allowed between one segment's end and the next one's start
constexpr std::chrono::seconds kDefaultContiguityTolerance{1};

/**
 * @brief Parse a segment file name (no directory part)
 *
 * @return std::nullopt if the name does not follow the segment grammar or
 *         end precedes start
 */
std::optional<Segment> parseSegmentFileName(const std::string& fileName);

/**
 * @brief Build the file name for a segment of a camera
 */
std::string formatSegmentFileName(const std::string& cameraId, Timestamp start, Timestamp end,
                                  const std::string& extension);

/**
 * @brief Group one camera's segments into contiguous runs
 *
 * Segments are sorted by start (longer first on ties). A segment whose start
 * lies within tolerance of the running group's end joins the group; a larger
 * gap opens a new group. Segments entirely covered by the running group (for
 * example a file merged on an earlier pass and its former parts) are left
 * out of the result so they are never joined twice.
 *
 * @param segments Segments of a single camera and extension
 * @param tolerance Maximum gap still considered contiguous
 * @return std::vector<SegmentGroup> Groups in time order, including singletons
 */
std::vector<SegmentGroup> groupContiguousSegments(std::vector<Segment> segments,
                                                  std::chrono::milliseconds tolerance);

} // namespace pem
