#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>

namespace updraft {

struct InstanceGuardError {
    std::string message;
    std::optional<pid_t> holder_pid;  ///< Pid recorded by the instance holding the lock
};

/**
 * @brief 같은 상태 디렉토리에 두 번째 supervisor가 뜨는 것을 막는 pid 파일 잠금
 *
 * flock(LOCK_EX | LOCK_NB) 기반의 권고 잠금이다. 잠금을 얻으면 자신의 pid를 기록하고,
 * 소멸 시 잠금만 해제한다. 파일은 남으며 다음 acquire가 pid를 덮어쓴다.
 */
class InstanceGuard {
public:
    [[nodiscard]] static std::expected<InstanceGuard, InstanceGuardError> acquire(const std::filesystem::path& lock_path);

    InstanceGuard(InstanceGuard&& other) noexcept;
    InstanceGuard& operator=(InstanceGuard&& other) noexcept;
    InstanceGuard(const InstanceGuard&) = delete;
    InstanceGuard& operator=(const InstanceGuard&) = delete;
    ~InstanceGuard();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    InstanceGuard(int fd, std::filesystem::path path);

    void release() noexcept;

    int fd_ = -1;
    std::filesystem::path path_;
};

} // namespace updraft
