#pragma once

#include "updraft/config/supervisor_config.h"
#include "updraft/core/context.h"

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace updraft {

// ============================================================================
// Process Errors
// ============================================================================

enum class ProcessErrorCode : int {
    ALREADY_RUNNING = 0,     ///< A live handle already exists
    INVALID_COMMAND = 1,     ///< Empty argv
    SPAWN_FAILED = 2,        ///< fork / pipe / output log failure
    EXEC_FAILED = 3,         ///< chdir or exec failed in the child
    EXITED_IMMEDIATELY = 4   ///< Child exited inside the startup window
};

struct ProcessError {
    ProcessErrorCode code;
    std::string message;
};

[[nodiscard]] std::string to_string(ProcessErrorCode code);

/**
 * @brief 실행 중인 관리 대상 프로세스 (ProcessSupervisor가 단독 소유)
 */
struct ProcessHandle {
    pid_t pid = -1;
    std::chrono::system_clock::time_point started_at;
};

/**
 * @brief waitpid로 회수한 종료 상태
 */
struct ExitStatus {
    std::optional<int> exit_code;  ///< Normal exit
    std::optional<int> signal;     ///< Terminated by signal

    static ExitStatus from_wait_status(int status);

    [[nodiscard]] std::string describe() const;
};

/**
 * @brief 관리 대상 애플리케이션 프로세스의 시작 / 종료
 *
 * - start(): argv를 애플리케이션 디렉토리에서 실행, stdout/stderr는 출력 로그에 append
 * - stop(): SIGTERM -> grace_period 동안 폴링 -> SIGKILL
 * - 핸들이 없으면 /proc의 command line으로 프로세스를 찾아 같은 순서로 종료
 *
 * 자식은 빈 시그널 마스크와 자신의 프로세스 그룹으로 시작하며, 종료 시그널은 그룹 전체에 보낸다.
 */
class ProcessSupervisor {
public:
    ProcessSupervisor(const SupervisorContext& context, ApplicationSettings settings);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /**
     * @brief 애플리케이션 시작
     *
     * exec 실패는 close-on-exec 상태 파이프로 전달된다. 시작 직후 startup_window 동안
     * 자식이 종료하면 EXITED_IMMEDIATELY. 취소 토큰이 시작 관찰 구간을 단축한다.
     */
    [[nodiscard]] std::expected<ProcessHandle, ProcessError> start();

    /**
     * @brief 애플리케이션 종료 (graceful -> forced)
     *
     * 반환 후 추적 중이던 pid의 프로세스는 실행 중이 아니다.
     */
    void stop();

    /**
     * @brief 추적 중인 자식이 살아 있는지 확인 (종료했으면 회수하고 상태를 기록)
     */
    [[nodiscard]] bool is_running();

    [[nodiscard]] std::optional<ProcessHandle> handle() const { return handle_; }
    [[nodiscard]] std::optional<ExitStatus> last_exit_status() const { return last_exit_; }
    [[nodiscard]] const ApplicationSettings& settings() const noexcept { return settings_; }

private:
    Logger logger_;
    std::shared_ptr<CancellationToken> cancellation_;
    ApplicationSettings settings_;
    std::optional<ProcessHandle> handle_;
    std::optional<ExitStatus> last_exit_;

    [[nodiscard]] bool try_reap();
    void terminate_child(pid_t pid);
    void terminate_untracked(pid_t pid);
    [[nodiscard]] std::filesystem::path output_log_path() const;
};

/**
 * @brief argv 중 하나가 name과 같거나 basename이 name인 프로세스의 pid 목록 (자기 자신 제외)
 *
 * working_directory가 주어지면 /proc/<pid>/cwd가 그 디렉토리인 프로세스만 포함한다.
 * cwd를 읽을 수 없는 프로세스는 제외된다.
 */
[[nodiscard]] std::vector<pid_t> find_processes_by_name(const std::string& name,
                                                       const std::filesystem::path& working_directory = {});

/**
 * @brief kill(pid, 0)으로 pid가 존재하는지 확인 (좀비는 존재하지 않는 것으로 본다)
 */
[[nodiscard]] bool process_exists(pid_t pid);

} // namespace updraft
