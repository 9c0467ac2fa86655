#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace updraft {

struct ManifestError {
    std::string message;
};

/**
 * @brief 한 버전에 속한 파일 목록
 *
 * fetch 단계가 만들고 backup / apply / rollback이 동일하게 사용한다.
 * 경로는 애플리케이션 디렉토리 기준 상대 경로(POSIX 구분자)이며 정렬되어 있다.
 *
 * 직렬화 형식:
 * ```json
 * {"version": "v1.2.0", "files": ["app.py", "lib/util.py"]}
 * ```
 */
struct FileManifest {
    /// 버전 디렉토리와 라이브 디렉토리에 기록되는 매니페스트 파일 이름
    static constexpr const char* FILE_NAME = ".updraft-manifest.json";

    std::string version;
    std::vector<std::string> files;

    [[nodiscard]] bool empty() const noexcept { return files.empty(); }
    [[nodiscard]] bool contains(const std::string& relative_path) const;

    /**
     * @brief 중복 제거 후 정렬
     */
    void normalize();

    [[nodiscard]] std::string to_json() const;
    static std::expected<FileManifest, ManifestError> from_json(const std::string& text);

    static std::expected<FileManifest, ManifestError> load(const std::filesystem::path& manifest_path);

    /**
     * @brief 임시 파일에 쓴 뒤 rename으로 교체
     */
    [[nodiscard]] std::expected<void, ManifestError> save(const std::filesystem::path& manifest_path) const;

    /**
     * @brief 디렉토리를 재귀적으로 스캔하여 매니페스트 생성
     *
     * 점(.)으로 시작하는 항목과 exclude 패턴(fnmatch)에 맞는 경로 구성요소는 제외한다.
     */
    static std::expected<FileManifest, ManifestError> scan(const std::filesystem::path& directory,
                                                           const std::vector<std::string>& exclude = {});
};

/**
 * @brief 상대 경로가 디렉토리 밖으로 벗어나지 않는지 확인 (절대 경로, ".." 거부)
 */
[[nodiscard]] bool is_safe_relative_path(const std::string& relative_path);

/**
 * @brief 매니페스트의 파일들을 from에서 to로 복사 (덮어쓰기, 하위 디렉토리 생성)
 */
[[nodiscard]] std::expected<void, ManifestError> copy_manifest_files(const FileManifest& manifest,
                                                                     const std::filesystem::path& from,
                                                                     const std::filesystem::path& to);

/**
 * @brief 라이브 디렉토리에 기록된 매니페스트 (없으면 std::nullopt)
 */
[[nodiscard]] std::expected<std::optional<FileManifest>, ManifestError>
load_live_manifest(const std::filesystem::path& app_dir);

/**
 * @brief 라이브 디렉토리의 현재 파일 목록 (기록된 매니페스트, 없으면 스캔)
 */
[[nodiscard]] std::expected<FileManifest, ManifestError>
resolve_live_manifest(const std::filesystem::path& app_dir, const std::vector<std::string>& exclude);

/**
 * @brief source_dir의 매니페스트 파일들을 라이브 디렉토리에 설치
 *
 * 1. 새 매니페스트의 파일을 복사
 * 2. 기록된 이전 매니페스트에만 있던 파일 삭제 (스캔으로 얻은 목록은 삭제 대상이 아님)
 * 3. 새 매니페스트를 라이브 매니페스트로 기록
 */
[[nodiscard]] std::expected<void, ManifestError> install_manifest(const FileManifest& incoming,
                                                                  const std::filesystem::path& source_dir,
                                                                  const std::filesystem::path& app_dir);

} // namespace updraft
