#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "export/exporter.h"

namespace pem {

/**
 * @brief Connection settings for the protect-archiver command
 */
struct ProtectArchiverSettings {
    std::string command = "protect-archiver";   ///< Executable name or path
    std::string address;                        ///< UniFi Protect host
    std::string username;
    std::string password;
    std::chrono::seconds timeout{300};          ///< Hard limit per attempt
};

/**
 * @brief Exporter that shells out to `protect-archiver download`
 *
 * The command writes straight into the output folder (--no-use-subfolders).
 * Its file names are kept as produced; combining only applies when the
 * configured command (UPEM_EXPORTER_COMMAND may name a wrapper script) emits
 * segment names in the grammar described on Exporter.
 */
class ProtectArchiverExporter : public Exporter {
public:
    explicit ProtectArchiverExporter(ProtectArchiverSettings settings);

    ExportResult exportRange(const ExportRequest& request) override;

    /**
     * @brief Build the argument vector for a request (program name excluded)
     *
     * @param request The export request
     * @return std::vector<std::string> Arguments passed to the command
     */
    std::vector<std::string> buildArguments(const ExportRequest& request) const;

    /**
     * @brief The "--cameras=..." argument for a camera list
     */
    static std::string camerasArgument(const std::vector<std::string>& cameras);

private:
    // Same as buildArguments with the password masked, for logging
    std::string describeCommand(const std::vector<std::string>& args) const;

    ProtectArchiverSettings settings_;
};

} // namespace pem
