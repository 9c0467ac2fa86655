#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace updraft {

struct SupervisorConfig;

/**
 * @brief 한 번의 헬스 관찰 결과
 */
struct HealthObservation {
    bool healthy = false;
    std::string detail;
};

/**
 * @brief 애플리케이션이 내보내는 생존 신호
 *
 * HealthVerifier가 폴링마다 observe()를 호출한다. 프로세스 생존 여부는
 * verifier가 따로 확인하므로 구현체는 애플리케이션의 출력만 본다.
 */
class HealthSignal {
public:
    virtual ~HealthSignal() = default;

    /**
     * @brief 새 프로세스를 시작하기 직전에 호출
     *
     * 이전 실행의 출력과 구분할 기준점을 잡는다. 기본 구현은 아무것도 하지 않는다.
     */
    virtual void begin() {}

    [[nodiscard]] virtual HealthObservation observe(const std::string& expected_version) = 0;
    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief 애플리케이션이 기록하는 헬스 레코드 파일
 *
 * ```json
 * {"version": "v1.2.0", "timestamp": 1760000000, "ok": true, "detail": "db connected"}
 * ```
 * ok가 true이고, version이 기대값과 같고, timestamp가 max_age 이내일 때 healthy.
 */
class HealthRecordSignal : public HealthSignal {
public:
    HealthRecordSignal(std::filesystem::path record_path, std::chrono::milliseconds max_age);

    [[nodiscard]] HealthObservation observe(const std::string& expected_version) override;
    [[nodiscard]] std::string name() const override { return "record"; }

private:
    std::filesystem::path record_path_;
    std::chrono::milliseconds max_age_;
};

/**
 * @brief 애플리케이션 로그의 마커 검사
 *
 * begin() 이후에 추가된 로그 구간에 ready_marker가 있고, 그 구간의 마지막
 * tail_bytes 안에 activity_markers 중 하나가 있을 때 healthy. 파일이 기준점보다
 * 짧아졌으면 (교체, truncate) 처음부터 본다. 버전은 확인하지 않는다.
 */
class LogMarkerSignal : public HealthSignal {
public:
    LogMarkerSignal(std::filesystem::path log_path,
                    size_t tail_bytes,
                    std::string ready_marker,
                    std::vector<std::string> activity_markers);

    void begin() override;
    [[nodiscard]] HealthObservation observe(const std::string& expected_version) override;
    [[nodiscard]] std::string name() const override { return "log"; }

private:
    std::filesystem::path log_path_;
    size_t tail_bytes_;
    std::uintmax_t start_offset_ = 0;
    std::string ready_marker_;
    std::vector<std::string> activity_markers_;
};

/**
 * @brief [health] 설정의 mode에 맞는 신호 생성
 */
[[nodiscard]] std::unique_ptr<HealthSignal> make_health_signal(const SupervisorConfig& config);

} // namespace updraft
