#pragma once

#include "updraft/core/cancellation.h"
#include "updraft/utils/logger.h"

#include <memory>
#include <string>

namespace updraft {

struct LoggingSettings;

/**
 * @brief 컴포넌트에 명시적으로 전달되는 실행 컨텍스트
 *
 * 프로세스 전역 로거나 종료 플래그 대신, 각 컴포넌트는 생성자에서 이 컨텍스트를 받아
 * 자기 이름의 하위 로거와 공유 취소 토큰을 꺼내 쓴다.
 *
 * @example
 * ```cpp
 * SupervisorContext ctx(make_logger(config.logging));
 * VersionStore store(ctx, config.supervisor.versions_dir, config.supervisor.max_versions);
 * ctx.cancellation().cancel();  // 모든 컴포넌트의 대기가 깨어남
 * ```
 */
class SupervisorContext {
public:
    explicit SupervisorContext(Logger logger,
                               std::shared_ptr<CancellationToken> cancellation = std::make_shared<CancellationToken>());

    /**
     * @brief 컴포넌트 이름이 붙은 하위 로거 (싱크와 레벨은 공유)
     */
    [[nodiscard]] Logger logger_for(const std::string& component) const;

    [[nodiscard]] Logger& logger() noexcept { return logger_; }

    [[nodiscard]] CancellationToken& cancellation() const noexcept { return *cancellation_; }

    /**
     * @brief 컴포넌트가 컨텍스트보다 오래 살아도 안전하도록 공유 소유권으로 전달
     */
    [[nodiscard]] std::shared_ptr<CancellationToken> cancellation_handle() const noexcept { return cancellation_; }

private:
    Logger logger_;
    std::shared_ptr<CancellationToken> cancellation_;
};

/**
 * @brief [logging] 설정으로 루트 로거 구성
 * @throws std::runtime_error 로그 파일을 열 수 없는 경우
 */
[[nodiscard]] Logger make_logger(const LoggingSettings& settings, const std::string& component = "updraft");

} // namespace updraft
