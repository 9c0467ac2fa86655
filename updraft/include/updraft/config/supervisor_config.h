#pragma once

#include "updraft/config/config_enums.h"

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace updraft {

// ============================================================================
// Configuration Errors
// ============================================================================

enum class ConfigErrorCode : int {
    FILE_NOT_FOUND = 0,   ///< Configuration file does not exist
    PARSE_ERROR = 1,      ///< TOML syntax or type error
    INVALID_VALUE = 2     ///< Value present but not acceptable (bad duration, unknown enum)
};

struct ConfigError {
    ConfigErrorCode code;
    std::string message;
};

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * @brief 업데이트 루프와 버전 이력 설정
 */
struct SupervisorSettings {
    std::chrono::milliseconds poll_interval{std::chrono::minutes(5)}; ///< Delay between update checks
    std::filesystem::path versions_dir = "versions";  ///< Version history and snapshots
    size_t max_versions = 5;                          ///< Retention cap for the history
    std::string default_version = "1.0.0";            ///< Identifier for a first-run install
    std::filesystem::path lock_file = "updraft.lock"; ///< Relative paths resolve under versions_dir
};

/**
 * @brief 관리 대상 애플리케이션 프로세스 설정
 */
struct ApplicationSettings {
    std::filesystem::path directory = "application";   ///< Live application directory (also the cwd)
    std::vector<std::string> command{"python3", "app.py"}; ///< argv; interpreter + entry point
    std::filesystem::path output_log = "logs/application.out"; ///< Captured stdout/stderr
    std::string process_name;                          ///< Fallback lookup name (empty = last argv)
    std::chrono::milliseconds grace_period{std::chrono::seconds(20)};  ///< SIGTERM -> SIGKILL delay
    std::chrono::milliseconds stop_poll_interval{std::chrono::seconds(1)}; ///< Exit polling cadence
    std::chrono::milliseconds startup_window{500};      ///< Window in which an exit counts as start failure
    std::vector<std::string> scan_exclude{"data", "logs", "__pycache__", "*.log", "health.json"}; ///< Not part of a scanned manifest

    /**
     * @brief 핸들 없이 프로세스를 찾을 때 사용할 이름
     */
    [[nodiscard]] std::string effective_process_name() const;
};

/**
 * @brief 헬스 검증 설정
 */
struct HealthSettings {
    HealthMode mode = HealthMode::RECORD;
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    std::chrono::milliseconds settle_delay{std::chrono::seconds(5)};
    std::chrono::milliseconds poll_interval{std::chrono::seconds(2)};

    // RECORD 모드
    std::filesystem::path record_path = "health.json";  ///< Relative paths resolve under the app dir
    std::chrono::milliseconds max_record_age{std::chrono::seconds(60)};

    // LOG 모드
    std::filesystem::path log_path = "app.log";         ///< Relative paths resolve under the app dir
    size_t log_tail_bytes = 5000;
    std::string ready_marker = "Successfully connected";
    std::vector<std::string> activity_markers{"Data stored:", "Weather data stored:"};
};

struct RemoteSettings {
    RemoteKind kind = RemoteKind::DIRECTORY;
    std::filesystem::path feed_path = "releases";
};

struct LoggingSettings {
    std::string level = "info";
    LogFormat format = LogFormat::TEXT;
    std::filesystem::path file;         ///< Empty = console only
    size_t max_file_size_mb = 10;
    size_t max_files = 5;
};

/**
 * @brief 설정 검증 결과
 */
struct ValidationResult {
    bool is_valid = true;                       ///< Overall validation status
    std::vector<std::string> errors;            ///< Critical errors (prevent startup)
    std::vector<std::string> warnings;          ///< Non-critical warnings

    [[nodiscard]] bool has_issues() const noexcept {
        return !errors.empty() || !warnings.empty();
    }

    [[nodiscard]] std::string report() const;
};

/**
 * @brief updraftd 전체 설정
 *
 * 기본값 -> TOML 파일 -> 환경 변수 순으로 적용한 뒤 validate()로 검증한다.
 *
 * @example
 * ```cpp
 * auto config = SupervisorConfig::from_toml_file("updraft.toml")
 *                   .and_then([](SupervisorConfig c) { return c.with_environment_overrides(); });
 * if (!config) {
 *     std::cerr << config.error().message << "\n";
 * }
 * ```
 */
struct SupervisorConfig {
    SupervisorSettings supervisor;
    ApplicationSettings application;
    HealthSettings health;
    RemoteSettings remote;
    LoggingSettings logging;

    // ========================================================================
    // Loading
    // ========================================================================

    /**
     * @brief TOML 파일에서 설정 로드 (없는 키는 기본값 유지)
     */
    static std::expected<SupervisorConfig, ConfigError> from_toml_file(const std::filesystem::path& config_path);

    static std::expected<SupervisorConfig, ConfigError> from_toml_string(const std::string& toml_content);

    /**
     * @brief 환경 변수 덮어쓰기 적용
     *
     * Environment variables:
     * - UPDRAFT_POLL_INTERVAL
     * - UPDRAFT_MAX_VERSIONS
     * - UPDRAFT_APP_DIR
     * - UPDRAFT_VERSIONS_DIR
     * - UPDRAFT_FEED_PATH
     * - UPDRAFT_HEALTH_TIMEOUT
     * - UPDRAFT_LOG_LEVEL
     */
    [[nodiscard]] std::expected<SupervisorConfig, ConfigError> with_environment_overrides() const;

    // ========================================================================
    // Validation and Serialization
    // ========================================================================

    [[nodiscard]] ValidationResult validate() const;

    [[nodiscard]] std::string to_toml() const;

    // ========================================================================
    // Resolved Paths
    // ========================================================================

    [[nodiscard]] std::filesystem::path lock_file_path() const;
    [[nodiscard]] std::filesystem::path health_record_file() const;
    [[nodiscard]] std::filesystem::path health_log_file() const;
};

/// parse_duration이 받아들이는 최대 기간
inline constexpr std::chrono::milliseconds MAX_DURATION = std::chrono::hours(24 * 365);

/**
 * @brief 기간 문자열 파싱 ("500ms", "20s", "5m", "5min", "1h")
 *
 * MAX_DURATION보다 긴 값은 std::nullopt.
 */
[[nodiscard]] std::optional<std::chrono::milliseconds> parse_duration(const std::string& duration_str);

/**
 * @brief 기간을 parse_duration이 읽을 수 있는 가장 큰 단위로 표기
 */
[[nodiscard]] std::string format_duration(std::chrono::milliseconds duration);

} // namespace updraft
