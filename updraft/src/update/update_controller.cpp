#include "updraft/update/update_controller.h"

#include <exception>

namespace updraft {

std::string to_string(UpdateState state) {
    switch (state) {
        case UpdateState::IDLE:         return "idle";
        case UpdateState::CHECKING:     return "checking";
        case UpdateState::DOWNLOADING:  return "downloading";
        case UpdateState::APPLYING:     return "applying";
        case UpdateState::VERIFYING:    return "verifying";
        case UpdateState::COMMITTED:    return "committed";
        case UpdateState::ROLLING_BACK: return "rolling_back";
        default: return "unknown";
    }
}

std::string to_string(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::NO_UPDATE:       return "no_update";
        case CycleOutcome::CHECK_FAILED:    return "check_failed";
        case CycleOutcome::DOWNLOAD_FAILED: return "download_failed";
        case CycleOutcome::REJECTED:        return "rejected";
        case CycleOutcome::COMMITTED:       return "committed";
        case CycleOutcome::ROLLED_BACK:     return "rolled_back";
        case CycleOutcome::ROLLBACK_FAILED: return "rollback_failed";
        default: return "unknown";
    }
}

UpdateController::UpdateController(const SupervisorContext& context,
                                   const SupervisorConfig& config,
                                   VersionStore& store,
                                   ProcessSupervisor& process,
                                   HealthVerifier& verifier,
                                   RemoteSource& remote)
    : logger_(context.logger_for("update"))
    , cancellation_(context.cancellation_handle())
    , app_dir_(config.application.directory)
    , default_version_(config.supervisor.default_version)
    , poll_interval_(config.supervisor.poll_interval)
    , store_(store)
    , process_(process)
    , verifier_(verifier)
    , remote_(remote) {}

void UpdateController::transition(UpdateState next) {
    if (next == state_) {
        return;
    }
    logger_.debug("State: " + to_string(state_) + " -> " + to_string(next));
    state_ = next;
}

CycleOutcome UpdateController::finish(CycleOutcome outcome) {
    transition(UpdateState::IDLE);
    logger_.debug("Cycle finished: " + to_string(outcome));
    return outcome;
}

// ============================================================================
// Checking
// ============================================================================

std::expected<std::optional<ReleaseDescriptor>, RemoteError> UpdateController::check() {
    transition(UpdateState::CHECKING);

    auto latest = remote_.check_latest();
    if (!latest) {
        return latest;
    }
    if (!latest->has_value()) {
        return std::optional<ReleaseDescriptor>{};
    }

    auto current = store_.get_current();
    if (current && (*latest)->identifier == *current) {
        return std::optional<ReleaseDescriptor>{};
    }
    return latest;
}

std::optional<ReleaseDescriptor> UpdateController::check_for_update() {
    auto checked = check();
    transition(UpdateState::IDLE);

    if (!checked) {
        logger_.warn("Update check failed: " + checked.error().message);
        return std::nullopt;
    }
    return *checked;
}

bool UpdateController::is_retained(const std::string& version) const {
    if (store_.contains(version)) {
        return true;
    }
    // 디렉토리 이름이 겹치는 식별자도 보존된 스냅샷을 덮어쓰게 된다
    const auto dir = store_.version_dir(version);
    for (const auto& retained : store_.history()) {
        if (store_.version_dir(retained) == dir) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Cycle
// ============================================================================

CycleOutcome UpdateController::run_cycle() {
    auto checked = check();
    if (!checked) {
        logger_.warn("Update check failed, retrying at next poll: " + checked.error().message);
        return finish(CycleOutcome::CHECK_FAILED);
    }

    if (!checked->has_value()) {
        logger_.debug("No update available");
        return finish(CycleOutcome::NO_UPDATE);
    }

    const ReleaseDescriptor release = **checked;
    const auto current = store_.get_current();
    logger_.info("Update available: " + current.value_or("<none>") + " -> " + release.identifier);

    if (is_retained(release.identifier)) {
        logger_.warn("Version " + release.identifier + " is already retained in history and is not current; "
                     "not re-applying it");
        return finish(CycleOutcome::REJECTED);
    }

    transition(UpdateState::DOWNLOADING);
    auto manifest = remote_.fetch(release, store_.version_dir(release.identifier));
    if (!manifest) {
        logger_.warn("Download of " + release.identifier + " failed, retrying at next poll: " +
                     manifest.error().message);
        store_.discard_staging(release.identifier);
        return finish(CycleOutcome::DOWNLOAD_FAILED);
    }

    return finish(apply_and_verify(release, *manifest));
}

CycleOutcome UpdateController::apply_and_verify(const ReleaseDescriptor& release, const FileManifest& manifest) {
    const std::string& version = release.identifier;

    transition(UpdateState::APPLYING);
    process_.stop();

    if (store_.get_current()) {
        if (auto backup = store_.backup_current(app_dir_); !backup) {
            return roll_back(version, "backup failed: " + backup.error().message);
        }
    } else {
        logger_.info("No current version, skipping backup");
    }

    if (auto installed = install_manifest(manifest, store_.version_dir(version), app_dir_); !installed) {
        return roll_back(version, "install failed: " + installed.error().message);
    }

    if (auto committed = store_.set_current(version); !committed) {
        return roll_back(version, "cannot record version: " + committed.error().message);
    }

    transition(UpdateState::VERIFYING);

    verifier_.begin();
    if (auto started = process_.start(); !started) {
        return roll_back(version, "application did not start: " + started.error().message);
    }

    if (!verifier_.verify(version)) {
        return roll_back(version, "health verification failed");
    }

    transition(UpdateState::COMMITTED);
    logger_.info("Update to " + version + " committed");
    return CycleOutcome::COMMITTED;
}

// ============================================================================
// Rollback
// ============================================================================

CycleOutcome UpdateController::roll_back(const std::string& failed_version, const std::string& reason) {
    transition(UpdateState::ROLLING_BACK);
    logger_.error("Update to " + failed_version + " failed: " + reason);

    process_.stop();

    // set_current 전에 실패했다면 이력의 current가 곧 복원 대상
    const bool committed = store_.get_current() == failed_version;
    const auto target = committed ? store_.get_previous() : store_.get_current();

    if (!target) {
        logger_.error("No previous version available for rollback; leaving " + failed_version +
                      " in place until the next release");
        ensure_running();
        return CycleOutcome::ROLLBACK_FAILED;
    }

    logger_.info("Rolling back to " + *target);

    auto manifest = store_.manifest_for(*target);
    if (!manifest) {
        logger_.error("Rollback failed, snapshot of " + *target + " unusable: " + manifest.error().message);
        ensure_running();
        return CycleOutcome::ROLLBACK_FAILED;
    }

    if (auto restored = install_manifest(*manifest, store_.version_dir(*target), app_dir_); !restored) {
        logger_.error("Rollback failed while restoring files: " + restored.error().message);
        ensure_running();
        return CycleOutcome::ROLLBACK_FAILED;
    }

    if (committed) {
        if (auto retired = store_.retire_current(); !retired) {
            logger_.error("Rollback failed while updating history: " + retired.error().message);
            ensure_running();
            return CycleOutcome::ROLLBACK_FAILED;
        }
        if (auto readopted = store_.set_current(*target); !readopted) {
            logger_.error("Rollback failed while updating history: " + readopted.error().message);
            ensure_running();
            return CycleOutcome::ROLLBACK_FAILED;
        }
    } else {
        store_.discard_staging(failed_version);
    }

    if (auto started = process_.start(); !started) {
        logger_.error("Restored " + *target + " but it did not start: " + started.error().message);
        return CycleOutcome::ROLLBACK_FAILED;
    }

    logger_.info("Rolled back to version " + *target);
    return CycleOutcome::ROLLED_BACK;
}

void UpdateController::ensure_running() {
    if (process_.is_running()) {
        return;
    }
    if (auto started = process_.start(); !started) {
        logger_.error("Application is not running: " + started.error().message);
    }
}

// ============================================================================
// Startup / main loop
// ============================================================================

void UpdateController::bootstrap() {
    if (store_.size() == 0) {
        logger_.info("No version history, registering " + app_dir_.string() + " as " + default_version_);
        if (auto initialized = store_.initialize_from_existing(app_dir_, default_version_); !initialized) {
            logger_.error("Cannot register existing application: " + initialized.error().message);
        }
    }

    // 이전 실행이 남긴 인스턴스 정리
    process_.stop();

    auto started = process_.start();
    if (started) {
        logger_.info("Running version " + store_.get_current().value_or("<unknown>"));
        return;
    }

    logger_.error("Failed to start application: " + started.error().message);
    if (store_.size() != 0) {
        return;
    }

    logger_.warn("No version installed, initializing with default version " + default_version_);
    if (auto initialized = store_.initialize_from_existing(app_dir_, default_version_); !initialized) {
        logger_.error("Initialization failed: " + initialized.error().message);
    }

    if (auto retried = process_.start(); !retried) {
        logger_.error("Application still not starting: " + retried.error().message);
    }
}

void UpdateController::run() {
    logger_.info("Update service running (" + remote_.describe() + ", checking every " +
                 format_duration(poll_interval_) + ")");

    bootstrap();

    while (!cancellation_->is_cancelled()) {
        try {
            run_cycle();
        } catch (const std::exception& e) {
            logger_.error(std::string("Unexpected error in update cycle: ") + e.what());
            transition(UpdateState::IDLE);
        }

        if (cancellation_->wait_for(poll_interval_)) {
            break;
        }
    }

    logger_.info("Shutdown requested, stopping application");
    process_.stop();
    logger_.info("Update service stopped");
}

} // namespace updraft
