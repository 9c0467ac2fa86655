#pragma once

#include <optional>
#include <string>

namespace updraft {

// ============================================================================
// Health Verification Modes
// ============================================================================

/**
 * @brief 새 버전의 정상 동작을 판단하는 신호 종류
 *
 * - RECORD: 애플리케이션이 기록하는 구조화된 상태 파일 (version + timestamp + ok)
 * - LOG: 애플리케이션 로그 꼬리 부분의 텍스트 마커 검사
 */
enum class HealthMode : int {
    RECORD = 0,       ///< JSON health record written by the application
    LOG = 1           ///< Marker scan over the application log tail
};

// ============================================================================
// Remote Source Types
// ============================================================================

enum class RemoteKind : int {
    DIRECTORY = 0     ///< Release feed directory (local disk, NFS, rsync target)
};

// ============================================================================
// Logging Output Formats
// ============================================================================

enum class LogFormat : int {
    TEXT = 0,         ///< Human-readable single line
    JSON = 1          ///< One JSON object per line
};

// ============================================================================
// Conversion Helpers
// ============================================================================

[[nodiscard]] std::string to_string(HealthMode mode);
[[nodiscard]] std::optional<HealthMode> health_mode_from_string(const std::string& mode_str);

[[nodiscard]] std::string to_string(RemoteKind kind);
[[nodiscard]] std::optional<RemoteKind> remote_kind_from_string(const std::string& kind_str);

[[nodiscard]] std::string to_string(LogFormat format);
[[nodiscard]] std::optional<LogFormat> log_format_from_string(const std::string& format_str);

} // namespace updraft
