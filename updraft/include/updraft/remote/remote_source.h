#pragma once

#include "updraft/version/file_manifest.h"

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace updraft {

// ============================================================================
// Remote Errors
// ============================================================================

enum class RemoteErrorCode : int {
    UNAVAILABLE = 0,        ///< Source unreachable or release missing (transient)
    MALFORMED_RELEASE = 1,  ///< Descriptor or manifest unreadable
    TRANSFER_FAILED = 2     ///< Files could not be copied into staging
};

struct RemoteError {
    RemoteErrorCode code;
    std::string message;
};

[[nodiscard]] std::string to_string(RemoteErrorCode code);

/**
 * @brief 원격 소스가 알려 주는 최신 릴리스
 */
struct ReleaseDescriptor {
    std::string identifier;                         ///< Opaque version identifier
    std::string locator;                            ///< Source-specific location of the files
    std::map<std::string, std::string> attributes;  ///< Extra metadata (notes, publish date)
};

/**
 * @brief 업데이트를 제공하는 원격 소스
 *
 * 구현체는 check_latest()로 최신 릴리스를 알려 주고, fetch()로 그 파일들을
 * 스테이징 디렉토리에 내려받아 매니페스트를 돌려준다.
 */
class RemoteSource {
public:
    virtual ~RemoteSource() = default;

    /**
     * @brief 최신 릴리스 조회 (게시된 릴리스가 없으면 std::nullopt)
     */
    [[nodiscard]] virtual std::expected<std::optional<ReleaseDescriptor>, RemoteError> check_latest() = 0;

    /**
     * @brief 릴리스 파일을 destination에 내려받기
     *
     * destination의 기존 내용은 지워지고, 받은 파일 목록은
     * `destination/.updraft-manifest.json`에도 기록된다.
     */
    [[nodiscard]] virtual std::expected<FileManifest, RemoteError> fetch(const ReleaseDescriptor& release,
                                                                         const std::filesystem::path& destination) = 0;

    [[nodiscard]] virtual std::string describe() const = 0;
};

} // namespace updraft
