#pragma once

#include "updraft/config/supervisor_config.h"
#include "updraft/core/context.h"
#include "updraft/health/health_signal.h"
#include "updraft/process/process_supervisor.h"

#include <chrono>
#include <memory>
#include <string>

namespace updraft {

/**
 * @brief 재시작된 애플리케이션의 헬스 검증
 *
 * settle_delay 대기 후 poll_interval마다:
 * 1. 프로세스가 종료했으면 즉시 실패
 * 2. HealthSignal이 healthy를 보고하면 성공
 * timeout 안에 성공하지 못하면 실패. 취소 요청으로 중단되지 않는다.
 */
class HealthVerifier {
public:
    HealthVerifier(const SupervisorContext& context,
                   HealthSettings settings,
                   ProcessSupervisor& process,
                   std::unique_ptr<HealthSignal> signal);

    /**
     * @brief 검증할 프로세스를 시작하기 직전에 호출 (HealthSignal::begin)
     */
    void begin() { signal_->begin(); }

    /**
     * @brief 설정된 timeout으로 검증
     */
    [[nodiscard]] bool verify(const std::string& expected_version);

    [[nodiscard]] bool verify(std::chrono::milliseconds timeout, const std::string& expected_version);

    [[nodiscard]] const HealthSignal& signal() const noexcept { return *signal_; }

private:
    Logger logger_;
    HealthSettings settings_;
    ProcessSupervisor& process_;
    std::unique_ptr<HealthSignal> signal_;
};

} // namespace updraft
