#pragma once

#include <chrono>
#include <functional>
#include "export/exporter.h"

namespace pem {

/**
 * @brief Result of running an export under the retry policy
 */
struct RetryOutcome {
    bool success = false;
    int attempts = 0;
    bool aborted = false;         ///< The delay wait was interrupted (shutdown)
    ExportResult lastResult;
};

/**
 * @brief Bounded retries with a fixed delay between attempts
 *
 * maxAttempts is the total number of attempts, so a value of 2 runs the
 * exporter at most twice. The delay is only applied between attempts.
 */
class RetryPolicy {
public:
    /// Waits for the given delay; returns false if the wait was interrupted
    using WaitFunction = std::function<bool(std::chrono::milliseconds)>;

    RetryPolicy(int maxAttempts, std::chrono::milliseconds delay, WaitFunction wait = nullptr);

    /**
     * @brief Run the exporter until it succeeds or attempts are exhausted
     *
     * @param exporter The exporter to invoke
     * @param request The export request, passed unchanged to every attempt
     * @return RetryOutcome Final status, attempt count and last result
     */
    RetryOutcome execute(Exporter& exporter, const ExportRequest& request) const;

    int maxAttempts() const { return maxAttempts_; }
    std::chrono::milliseconds delay() const { return delay_; }

private:
    int maxAttempts_;
    std::chrono::milliseconds delay_;
    WaitFunction wait_;
};

} // namespace pem
