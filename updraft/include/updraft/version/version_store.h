#pragma once

#include "updraft/core/context.h"
#include "updraft/version/file_manifest.h"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace updraft {

// ============================================================================
// Version Store Errors
// ============================================================================

enum class VersionErrorCode : int {
    NO_CURRENT_VERSION = 0,   ///< Operation needs a current version but history is empty
    IO_FAILURE = 1,           ///< File copy / directory creation failed
    PERSISTENCE_FAILURE = 2,  ///< versions.json could not be written
    CORRUPT_HISTORY = 3       ///< versions.json exists but is unreadable
};

struct VersionError {
    VersionErrorCode code;
    std::string message;
};

[[nodiscard]] std::string to_string(VersionErrorCode code);

/**
 * @brief 버전 이력과 버전별 스냅샷 디렉토리 관리
 *
 * 이력은 채택 순서대로 저장되며 마지막 항목이 current, 그 앞이 previous이다.
 * `<versions_dir>/versions.json`에 `{"versions": [...]}` 형태로 영속화된다.
 *
 * 불변식:
 * - 같은 식별자는 두 번 나타나지 않는다 (재채택은 쓰기 없는 no-op)
 * - 길이는 max_versions를 넘지 않으며, 넘치면 가장 오래된 항목과 그 디렉토리를 지운다
 * - 메모리 상태는 영속화가 성공한 뒤에만 바뀐다
 */
class VersionStore {
public:
    static constexpr const char* HISTORY_FILE_NAME = "versions.json";

    /**
     * @param versions_dir 이력 파일과 버전 디렉토리들의 위치 (없으면 생성)
     * @param max_versions 보존할 최대 이력 길이 (최소 1)
     * @param scan_exclude 라이브 디렉토리를 스캔할 때 제외할 패턴
     */
    VersionStore(const SupervisorContext& context,
                 std::filesystem::path versions_dir,
                 size_t max_versions,
                 std::vector<std::string> scan_exclude = {});

    /**
     * @brief 영속화된 이력 읽기
     *
     * 파일이 없으면 빈 이력으로 시작한다. 손상된 파일은 CORRUPT_HISTORY로 보고하고
     * 메모리 이력은 비워 둔다.
     */
    [[nodiscard]] std::expected<void, VersionError> load();

    // ========================================================================
    // History Queries
    // ========================================================================

    [[nodiscard]] std::optional<std::string> get_current() const;
    [[nodiscard]] std::optional<std::string> get_previous() const;
    [[nodiscard]] const std::vector<std::string>& history() const noexcept { return versions_; }
    [[nodiscard]] size_t size() const noexcept { return versions_.size(); }
    [[nodiscard]] bool contains(const std::string& version) const;
    [[nodiscard]] size_t max_versions() const noexcept { return max_versions_; }

    // ========================================================================
    // History Mutation
    // ========================================================================

    /**
     * @brief 새 버전을 current로 채택
     *
     * 이미 이력에 있으면 순서를 바꾸지 않고 그대로 성공을 반환한다.
     * 없으면 append -> 영속화 -> 메모리 반영 -> 초과분 디렉토리 삭제 순으로 진행한다.
     * 영속화 실패 시 메모리 이력은 변경되지 않는다.
     */
    [[nodiscard]] std::expected<void, VersionError> set_current(const std::string& version);

    /**
     * @brief 실패한 current를 이력에서 빼고 디렉토리를 삭제 (롤백 전용)
     *
     * 호출 후 previous가 current가 된다. 이력이 비어 있으면 NO_CURRENT_VERSION.
     */
    [[nodiscard]] std::expected<std::string, VersionError> retire_current();

    // ========================================================================
    // Version Directories
    // ========================================================================

    /**
     * @brief 식별자 -> 스냅샷 디렉토리 경로 (부수 효과 없음)
     *
     * `[A-Za-z0-9._-]` 밖의 문자는 `_`로 바꾸고, "", ".", ".."은 앞에 `_`를 붙인다.
     */
    [[nodiscard]] std::filesystem::path version_dir(const std::string& version) const;

    /**
     * @brief 라이브 디렉토리의 파일들을 version_dir(current)로 백업 (반복 호출 시 덮어씀)
     */
    [[nodiscard]] std::expected<FileManifest, VersionError> backup_current(const std::filesystem::path& app_dir);

    /**
     * @brief 이력이 없을 때 현재 라이브 디렉토리를 default_version으로 등록
     *
     * 첫 실행 복구 경로에서 한 번만 사용된다. 라이브 매니페스트도 함께 기록한다.
     */
    [[nodiscard]] std::expected<void, VersionError> initialize_from_existing(const std::filesystem::path& app_dir,
                                                                            const std::string& default_version);

    /**
     * @brief 버전 디렉토리에 기록된 매니페스트 로드
     */
    [[nodiscard]] std::expected<FileManifest, VersionError> manifest_for(const std::string& version) const;

    /**
     * @brief 이력에 없는 버전의 스테이징 디렉토리 정리 (이력에 있으면 아무것도 하지 않음)
     */
    void discard_staging(const std::string& version);

    [[nodiscard]] const std::filesystem::path& versions_dir() const noexcept { return versions_dir_; }
    [[nodiscard]] std::filesystem::path history_file() const;

private:
    Logger logger_;
    std::filesystem::path versions_dir_;
    size_t max_versions_;
    std::vector<std::string> scan_exclude_;
    std::vector<std::string> versions_;

    [[nodiscard]] std::expected<void, VersionError> persist(const std::vector<std::string>& versions) const;
    void remove_version_dir(const std::string& version);
};

} // namespace updraft
