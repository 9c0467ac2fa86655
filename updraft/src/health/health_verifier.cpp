#include "updraft/health/health_verifier.h"

#include <algorithm>
#include <thread>

namespace updraft {

HealthVerifier::HealthVerifier(const SupervisorContext& context,
                               HealthSettings settings,
                               ProcessSupervisor& process,
                               std::unique_ptr<HealthSignal> signal)
    : logger_(context.logger_for("health"))
    , settings_(std::move(settings))
    , process_(process)
    , signal_(std::move(signal)) {}

bool HealthVerifier::verify(const std::string& expected_version) {
    return verify(settings_.timeout, expected_version);
}

bool HealthVerifier::verify(std::chrono::milliseconds timeout, const std::string& expected_version) {
    logger_.info("Verifying version " + expected_version + " (" + signal_->name() + " signal, timeout " +
                 format_duration(timeout) + ")");

    std::this_thread::sleep_for(settings_.settle_delay);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string last_detail;

    while (true) {
        if (!process_.is_running()) {
            auto status = process_.last_exit_status();
            logger_.error("Application process has terminated" +
                          (status ? " (" + status->describe() + ")" : std::string{}));
            return false;
        }

        auto observation = signal_->observe(expected_version);
        if (observation.healthy) {
            logger_.info("Version " + expected_version + " is healthy: " + observation.detail);
            return true;
        }

        if (observation.detail != last_detail) {
            logger_.debug(observation.detail);
            last_detail = observation.detail;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(settings_.poll_interval, remaining));
    }

    logger_.error("Health verification timed out for " + expected_version +
                  (last_detail.empty() ? std::string{} : ": " + last_detail));
    return false;
}

} // namespace updraft
