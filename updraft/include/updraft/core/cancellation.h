#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace updraft {

/**
 * @brief 협조적 취소 토큰
 *
 * 시그널 핸들러가 전역 플래그를 바꾸는 대신, 종료 요청은 cancel()로 전달되고
 * 폴링 루프와 대기 구간은 wait_for()로 깨어난다.
 *
 * @example
 * ```cpp
 * CancellationToken token;
 * while (!token.is_cancelled()) {
 *     run_cycle();
 *     if (token.wait_for(poll_interval)) break;  // 취소되면 즉시 반환
 * }
 * ```
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief 취소 요청 (여러 번 호출해도 안전)
     */
    void cancel();

    [[nodiscard]] bool is_cancelled() const;

    /**
     * @brief 주어진 시간 동안 대기하되 취소되면 즉시 깨어남
     * @return 취소되었으면 true, 시간이 다 지났으면 false
     */
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

} // namespace updraft
