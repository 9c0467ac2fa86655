#pragma once

#include "updraft/config/supervisor_config.h"
#include "updraft/core/context.h"
#include "updraft/remote/remote_source.h"

#include <filesystem>
#include <memory>

namespace updraft {

/**
 * @brief 릴리스 피드 디렉토리 (로컬 디스크, NFS, rsync 대상)
 *
 * 레이아웃:
 * ```
 * <feed>/latest.json          {"version": "v1.2.0", "path": "v1.2.0", "notes": "..."}
 * <feed>/v1.2.0/manifest.json {"files": ["app.py", "lib/util.py"]}   (선택)
 * <feed>/v1.2.0/app.py
 * ```
 * latest.json이 없으면 게시된 릴리스가 없는 것으로 본다. manifest.json이 없으면
 * 릴리스 디렉토리를 스캔한다 (manifest.json과 점 파일 제외).
 */
class DirectoryRemoteSource : public RemoteSource {
public:
    static constexpr const char* LATEST_FILE_NAME = "latest.json";
    static constexpr const char* RELEASE_MANIFEST_NAME = "manifest.json";

    DirectoryRemoteSource(const SupervisorContext& context, std::filesystem::path feed_path);

    [[nodiscard]] std::expected<std::optional<ReleaseDescriptor>, RemoteError> check_latest() override;

    [[nodiscard]] std::expected<FileManifest, RemoteError> fetch(const ReleaseDescriptor& release,
                                                                 const std::filesystem::path& destination) override;

    [[nodiscard]] std::string describe() const override;

    [[nodiscard]] const std::filesystem::path& feed_path() const noexcept { return feed_path_; }

private:
    Logger logger_;
    std::filesystem::path feed_path_;

    [[nodiscard]] std::expected<FileManifest, RemoteError> release_manifest(const ReleaseDescriptor& release,
                                                                            const std::filesystem::path& release_dir) const;
};

/**
 * @brief [remote] 설정에 맞는 원격 소스 생성
 */
[[nodiscard]] std::unique_ptr<RemoteSource> make_remote_source(const SupervisorContext& context,
                                                               const RemoteSettings& settings);

} // namespace updraft
