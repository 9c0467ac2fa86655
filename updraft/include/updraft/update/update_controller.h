#pragma once

#include "updraft/config/supervisor_config.h"
#include "updraft/core/context.h"
#include "updraft/health/health_verifier.h"
#include "updraft/process/process_supervisor.h"
#include "updraft/remote/remote_source.h"
#include "updraft/version/version_store.h"

#include <expected>
#include <memory>
#include <optional>
#include <string>

namespace updraft {

/**
 * @brief 업데이트 상태 머신의 상태
 *
 * IDLE -> CHECKING -> DOWNLOADING -> APPLYING -> VERIFYING -> {COMMITTED | ROLLING_BACK} -> IDLE
 */
enum class UpdateState : int {
    IDLE = 0,
    CHECKING = 1,
    DOWNLOADING = 2,
    APPLYING = 3,
    VERIFYING = 4,
    COMMITTED = 5,
    ROLLING_BACK = 6
};

/**
 * @brief 한 사이클의 결과
 */
enum class CycleOutcome : int {
    NO_UPDATE = 0,        ///< Remote identifier equals current, or nothing published
    CHECK_FAILED = 1,     ///< Transient remote error while checking
    DOWNLOAD_FAILED = 2,  ///< Transient remote error while fetching; history untouched
    REJECTED = 3,         ///< Announced identifier is already retained in history
    COMMITTED = 4,        ///< New version verified and live
    ROLLED_BACK = 5,      ///< New version failed; previous version restored
    ROLLBACK_FAILED = 6   ///< New version failed and could not be rolled back
};

[[nodiscard]] std::string to_string(UpdateState state);
[[nodiscard]] std::string to_string(CycleOutcome outcome);

/**
 * @brief 업데이트 오케스트레이션
 *
 * 단일 스레드에서 한 번에 한 사이클만 실행한다. 취소 토큰은 사이클 사이의 대기만
 * 끊으며, APPLYING / VERIFYING 중인 사이클은 COMMITTED 또는 ROLLING_BACK까지 진행한다.
 *
 * @example
 * ```cpp
 * UpdateController controller(ctx, config, store, process, verifier, *remote);
 * controller.run();  // bootstrap 후 취소될 때까지 폴링
 * ```
 */
class UpdateController {
public:
    UpdateController(const SupervisorContext& context,
                     const SupervisorConfig& config,
                     VersionStore& store,
                     ProcessSupervisor& process,
                     HealthVerifier& verifier,
                     RemoteSource& remote);

    UpdateController(const UpdateController&) = delete;
    UpdateController& operator=(const UpdateController&) = delete;

    /**
     * @brief 원격 식별자가 current와 다르면 릴리스 반환
     *
     * 같거나 게시된 릴리스가 없거나 일시적 오류이면 std::nullopt (오류는 로그로 남김).
     */
    [[nodiscard]] std::optional<ReleaseDescriptor> check_for_update();

    /**
     * @brief 한 번의 check -> download -> apply -> verify 사이클
     */
    CycleOutcome run_cycle();

    /**
     * @brief 시작 절차
     *
     * 이력이 없으면 라이브 디렉토리를 default_version으로 등록하고, 이전 실행이 남긴
     * 프로세스를 정리한 뒤 애플리케이션을 시작한다.
     */
    void bootstrap();

    /**
     * @brief bootstrap 후 취소될 때까지 poll_interval 간격으로 사이클 실행
     *
     * 종료 시 애플리케이션을 정지한다.
     */
    void run();

    [[nodiscard]] UpdateState state() const noexcept { return state_; }

private:
    Logger logger_;
    std::shared_ptr<CancellationToken> cancellation_;
    std::filesystem::path app_dir_;
    std::string default_version_;
    std::chrono::milliseconds poll_interval_;

    VersionStore& store_;
    ProcessSupervisor& process_;
    HealthVerifier& verifier_;
    RemoteSource& remote_;

    UpdateState state_ = UpdateState::IDLE;

    void transition(UpdateState next);
    CycleOutcome finish(CycleOutcome outcome);

    [[nodiscard]] std::expected<std::optional<ReleaseDescriptor>, RemoteError> check();
    [[nodiscard]] bool is_retained(const std::string& version) const;

    CycleOutcome apply_and_verify(const ReleaseDescriptor& release, const FileManifest& manifest);
    CycleOutcome roll_back(const std::string& failed_version, const std::string& reason);
    void ensure_running();
};

} // namespace updraft
