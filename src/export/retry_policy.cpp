#include "export/retry_policy.h"
#include "logger.h"
#include <thread>

namespace pem {

RetryPolicy::RetryPolicy(int maxAttempts, std::chrono::milliseconds delay, WaitFunction wait)
    : maxAttempts_(maxAttempts < 1 ? 1 : maxAttempts),
      delay_(delay < std::chrono::milliseconds::zero() ? std::chrono::milliseconds::zero() : delay),
      wait_(std::move(wait)) {
    if (!wait_) {
        wait_ = [](std::chrono::milliseconds d) {
            std::this_thread::sleep_for(d);
            return true;
        };
    }
}

RetryOutcome RetryPolicy::execute(Exporter& exporter, const ExportRequest& request) const {
    RetryOutcome outcome;

    while (outcome.attempts < maxAttempts_) {
        ++outcome.attempts;

        try {
            outcome.lastResult = exporter.exportRange(request);
        } catch (const std::exception& e) {
            outcome.lastResult = ExportResult::failed(-1, std::string("exporter threw: ") + e.what());
            LOG_ERROR("RetryPolicy", "Export for event " + request.identifier + " threw: " + e.what());
        }

        if (outcome.lastResult.success) {
            outcome.success = true;
            return outcome;
        }

        if (outcome.attempts >= maxAttempts_) {
            break;
        }

        LOG_INFO("RetryPolicy", "Retrying event " + request.identifier + " in " +
                 std::to_string(delay_.count()) + "ms (attempt " + std::to_string(outcome.attempts) +
                 "/" + std::to_string(maxAttempts_) + ")");

        if (!wait_(delay_)) {
            LOG_WARN("RetryPolicy", "Retry wait interrupted for event " + request.identifier);
            outcome.aborted = true;
            return outcome;
        }
    }

    LOG_ERROR("RetryPolicy", "Max retries reached. Failed to export event " + request.identifier +
              " after " + std::to_string(outcome.attempts) + " attempt(s)");
    return outcome;
}

} // namespace pem
