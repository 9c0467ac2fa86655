#include "updraft/runtime/instance_guard.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace updraft {

namespace fs = std::filesystem;

namespace {

std::optional<pid_t> read_holder_pid(int fd) {
    char buf[32] = {0};
    if (::lseek(fd, 0, SEEK_SET) < 0) {
        return std::nullopt;
    }
    ssize_t n = ::read(fd, buf, sizeof(buf) - 1);
    if (n <= 0) {
        return std::nullopt;
    }
    long pid = std::strtol(buf, nullptr, 10);
    if (pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

} // namespace

std::expected<InstanceGuard, InstanceGuardError> InstanceGuard::acquire(const fs::path& lock_path) {
    std::error_code ec;
    if (lock_path.has_parent_path()) {
        fs::create_directories(lock_path.parent_path(), ec);
        if (ec) {
            return std::unexpected(InstanceGuardError{"Cannot create " + lock_path.parent_path().string() + ": " +
                                                          ec.message(),
                                                      std::nullopt});
        }
    }

    int fd = ::open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected(InstanceGuardError{"Cannot open lock file " + lock_path.string() + ": " +
                                                      std::strerror(errno),
                                                  std::nullopt});
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) < 0) {
        const int saved = errno;
        auto holder = read_holder_pid(fd);
        ::close(fd);

        if (saved == EWOULDBLOCK) {
            std::string message = "Another instance holds " + lock_path.string();
            if (holder) {
                message += " (pid " + std::to_string(*holder) + ")";
            }
            return std::unexpected(InstanceGuardError{message, holder});
        }
        return std::unexpected(InstanceGuardError{"flock failed on " + lock_path.string() + ": " +
                                                      std::strerror(saved),
                                                  std::nullopt});
    }

    const std::string pid_line = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd, 0) != 0 || ::lseek(fd, 0, SEEK_SET) < 0 ||
        ::write(fd, pid_line.data(), pid_line.size()) != static_cast<ssize_t>(pid_line.size())) {
        const int saved = errno;
        ::flock(fd, LOCK_UN);
        ::close(fd);
        return std::unexpected(InstanceGuardError{"Cannot record pid in " + lock_path.string() + ": " +
                                                      std::strerror(saved),
                                                  std::nullopt});
    }

    return InstanceGuard(fd, lock_path);
}

InstanceGuard::InstanceGuard(int fd, fs::path path)
    : fd_(fd)
    , path_(std::move(path)) {}

InstanceGuard::InstanceGuard(InstanceGuard&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
}

InstanceGuard& InstanceGuard::operator=(InstanceGuard&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

InstanceGuard::~InstanceGuard() {
    release();
}

void InstanceGuard::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    // 파일은 지우지 않는다. 모든 경쟁자가 같은 inode를 잠가야 한다
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
}

} // namespace updraft
