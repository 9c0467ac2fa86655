#pragma once

#include "updraft/core/context.h"

#include <atomic>
#include <csignal>
#include <memory>
#include <optional>
#include <thread>

namespace updraft {

/**
 * @brief SIGINT/SIGTERM을 전용 스레드의 sigwait로 받아 취소 토큰에 전달
 *
 * 생성한 스레드에서 두 시그널을 막으므로 다른 스레드를 만들기 전에 생성해야 한다.
 * 소멸 시 대기 스레드를 깨워 join하고 이전 시그널 마스크를 복원한다. 예외로
 * 스코프를 빠져나가도 마찬가지다.
 *
 * @example
 * ```cpp
 * ShutdownSignalWaiter signals(ctx);
 * controller.run();  // SIGTERM -> ctx.cancellation().cancel()
 * ```
 */
class ShutdownSignalWaiter {
public:
    explicit ShutdownSignalWaiter(const SupervisorContext& context);
    ~ShutdownSignalWaiter();

    ShutdownSignalWaiter(const ShutdownSignalWaiter&) = delete;
    ShutdownSignalWaiter& operator=(const ShutdownSignalWaiter&) = delete;

    /**
     * @brief 받은 종료 시그널 번호 (아직 없으면 std::nullopt)
     */
    [[nodiscard]] std::optional<int> received() const;

private:
    Logger logger_;
    std::shared_ptr<CancellationToken> cancellation_;
    sigset_t signals_;
    sigset_t previous_mask_;
    std::atomic<int> received_{0};
    std::atomic<bool> stopping_{false};
    std::thread thread_;

    void wait_loop();
};

} // namespace updraft
