#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace pem {

/**
 * @brief One export job handed to an Exporter
 *
 * An empty camera list selects all cameras.
 */
struct ExportRequest {
    std::string identifier;
    std::chrono::system_clock::time_point startTime;
    std::chrono::system_clock::time_point endTime;
    std::vector<std::string> cameras;
    std::string outputFolder;
};

/**
 * @brief Result of a single export attempt
 */
struct ExportResult {
    bool success = false;
    int exitCode = -1;
    bool timedOut = false;
    std::string diagnostics;      ///< Captured output, mostly useful on failure
    std::chrono::milliseconds duration{0};

    static ExportResult ok() {
        ExportResult r;
        r.success = true;
        r.exitCode = 0;
        return r;
    }

    static ExportResult failed(int exitCode, const std::string& diagnostics) {
        ExportResult r;
        r.exitCode = exitCode;
        r.diagnostics = diagnostics;
        return r;
    }
};

/**
 * @brief Runs the external video export for a time range and camera set
 *
 * Implementations write their files into ExportRequest::outputFolder and
 * succeed or fail as a whole. Partial files may remain after a failure.
 *
 * Files are only combined afterwards when named
 * "<camera>_<YYYYMMDDTHHMMSS+zzzz>_<YYYYMMDDTHHMMSS+zzzz>.<ext>" (see
 * parseSegmentFileName). Other names are left as written and counted in
 * CombineSummary::filesSkipped.
 */
class Exporter {
public:
    virtual ~Exporter() = default;

    /**
     * @brief Run one export attempt
     *
     * @param request Time range, cameras and destination folder
     * @return ExportResult Success flag plus exit diagnostics
     */
    virtual ExportResult exportRange(const ExportRequest& request) = 0;
};

} // namespace pem
