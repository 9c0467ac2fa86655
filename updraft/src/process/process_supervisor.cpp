#include "updraft/process/process_supervisor.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <string_view>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace updraft {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

std::string to_string(ProcessErrorCode code) {
    switch (code) {
        case ProcessErrorCode::ALREADY_RUNNING:    return "already_running";
        case ProcessErrorCode::INVALID_COMMAND:    return "invalid_command";
        case ProcessErrorCode::SPAWN_FAILED:       return "spawn_failed";
        case ProcessErrorCode::EXEC_FAILED:        return "exec_failed";
        case ProcessErrorCode::EXITED_IMMEDIATELY: return "exited_immediately";
        default: return "unknown";
    }
}

// ============================================================================
// ExitStatus
// ============================================================================

ExitStatus ExitStatus::from_wait_status(int status) {
    ExitStatus result;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

std::string ExitStatus::describe() const {
    if (exit_code) {
        return "exit code " + std::to_string(*exit_code);
    }
    if (signal) {
        const char* name = ::strsignal(*signal);
        return "signal " + std::to_string(*signal) + (name ? " (" + std::string(name) + ")" : "");
    }
    return "unknown status";
}

namespace {

/// 자식이 exec 전에 실패했을 때 상태 파이프로 보내는 정보
struct ChildFailure {
    int stage;  // 0 = chdir, 1 = exec
    int error;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/// 프로세스 그룹에 시그널 전송, 그룹이 없으면 pid에 직접
bool signal_process_group(pid_t pid, int sig) {
    if (::kill(-pid, sig) == 0) {
        return true;
    }
    if (errno != ESRCH) {
        return false;
    }
    return ::kill(pid, sig) == 0 || errno == ESRCH;
}

[[noreturn]] void child_fail(int status_fd, int stage) {
    ChildFailure failure{stage, errno};
    ssize_t written = ::write(status_fd, &failure, sizeof(failure));
    (void)written;
    ::_exit(127);
}

} // namespace

// ============================================================================
// ProcessSupervisor
// ============================================================================

ProcessSupervisor::ProcessSupervisor(const SupervisorContext& context, ApplicationSettings settings)
    : logger_(context.logger_for("process"))
    , cancellation_(context.cancellation_handle())
    , settings_(std::move(settings)) {}

ProcessSupervisor::~ProcessSupervisor() {
    if (handle_) {
        stop();
    }
}

fs::path ProcessSupervisor::output_log_path() const {
    if (settings_.output_log.is_absolute()) {
        return settings_.output_log;
    }
    return settings_.directory / settings_.output_log;
}

std::expected<ProcessHandle, ProcessError> ProcessSupervisor::start() {
    if (handle_ && is_running()) {
        return std::unexpected(ProcessError{ProcessErrorCode::ALREADY_RUNNING,
                                            "Application already running (pid " +
                                                std::to_string(handle_->pid) + ")"});
    }

    if (settings_.command.empty()) {
        return std::unexpected(ProcessError{ProcessErrorCode::INVALID_COMMAND, "Empty application command"});
    }

    // 출력 로그
    const fs::path log_path = output_log_path();
    std::error_code ec;
    if (log_path.has_parent_path()) {
        fs::create_directories(log_path.parent_path(), ec);
        if (ec) {
            return std::unexpected(ProcessError{ProcessErrorCode::SPAWN_FAILED,
                                                "Cannot create " + log_path.parent_path().string() + ": " +
                                                    ec.message()});
        }
    }

    int log_fd = ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (log_fd < 0) {
        return std::unexpected(ProcessError{ProcessErrorCode::SPAWN_FAILED,
                                            "Cannot open output log " + log_path.string() + ": " +
                                                std::strerror(errno)});
    }

    int status_fds[2] = {-1, -1};
    if (::pipe2(status_fds, O_CLOEXEC) != 0) {
        const int saved = errno;
        close_fd(log_fd);
        return std::unexpected(ProcessError{ProcessErrorCode::SPAWN_FAILED,
                                            std::string("pipe2 failed: ") + std::strerror(saved)});
    }

    // fork 이후에는 할당하지 않는다
    std::vector<char*> argv;
    argv.reserve(settings_.command.size() + 1);
    for (auto& arg : settings_.command) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string working_dir = settings_.directory.string();

    pid_t pid = ::fork();
    if (pid < 0) {
        const int saved = errno;
        close_fd(log_fd);
        close_fd(status_fds[0]);
        close_fd(status_fds[1]);
        return std::unexpected(ProcessError{ProcessErrorCode::SPAWN_FAILED,
                                            std::string("fork failed: ") + std::strerror(saved)});
    }

    if (pid == 0) {
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
        std::signal(SIGPIPE, SIG_DFL);
        ::setpgid(0, 0);

        if (::chdir(working_dir.c_str()) != 0) {
            child_fail(status_fds[1], 0);
        }

        int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
        }
        ::dup2(log_fd, STDOUT_FILENO);
        ::dup2(log_fd, STDERR_FILENO);

        ::execvp(argv[0], argv.data());
        child_fail(status_fds[1], 1);
    }

    close_fd(log_fd);
    close_fd(status_fds[1]);

    ChildFailure failure{};
    ssize_t received;
    do {
        received = ::read(status_fds[0], &failure, sizeof(failure));
    } while (received < 0 && errno == EINTR);
    close_fd(status_fds[0]);

    if (received == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        last_exit_ = ExitStatus::from_wait_status(status);

        const std::string what = failure.stage == 0 ? "chdir to " + working_dir : "exec " + settings_.command.front();
        logger_.error("Failed to start application: " + what + ": " + std::strerror(failure.error));
        return std::unexpected(ProcessError{ProcessErrorCode::EXEC_FAILED,
                                            what + ": " + std::strerror(failure.error)});
    }

    handle_ = ProcessHandle{pid, std::chrono::system_clock::now()};
    last_exit_.reset();

    // 시작 직후 종료 감지
    const auto deadline = std::chrono::steady_clock::now() + settings_.startup_window;
    while (true) {
        if (try_reap()) {
            const std::string status = last_exit_ ? last_exit_->describe() : "unknown status";
            logger_.error("Application exited immediately (" + status + "), see " + log_path.string());
            return std::unexpected(ProcessError{ProcessErrorCode::EXITED_IMMEDIATELY,
                                                "Application exited immediately with " + status});
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (cancellation_->wait_for(std::min<std::chrono::milliseconds>(remaining, 50ms))) {
            break;
        }
    }

    logger_.with_field("pid", static_cast<int64_t>(pid))
        .info("Started application: " + settings_.command.back());
    logger_.clear_fields();
    return *handle_;
}

bool ProcessSupervisor::try_reap() {
    if (!handle_) {
        return true;
    }

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(handle_->pid, &status, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        return false;
    }

    if (result == handle_->pid) {
        last_exit_ = ExitStatus::from_wait_status(status);
        logger_.info("Application (pid " + std::to_string(handle_->pid) + ") exited with " +
                     last_exit_->describe());
    } else {
        logger_.warn("Lost track of application pid " + std::to_string(handle_->pid) + ": " +
                     std::strerror(errno));
    }
    handle_.reset();
    return true;
}

bool ProcessSupervisor::is_running() {
    return handle_ && !try_reap();
}

// ============================================================================
// 종료
// ============================================================================

void ProcessSupervisor::stop() {
    if (handle_) {
        terminate_child(handle_->pid);
        return;
    }

    const std::string name = settings_.effective_process_name();
    if (name.empty()) {
        logger_.debug("No tracked process and no process name to look up");
        return;
    }

    auto pids = find_processes_by_name(name, settings_.directory);
    if (pids.empty()) {
        logger_.debug("No running process matches '" + name + "' in " + settings_.directory.string());
        return;
    }

    for (pid_t pid : pids) {
        terminate_untracked(pid);
    }
}

void ProcessSupervisor::terminate_child(pid_t pid) {
    if (try_reap()) {
        return;
    }

    logger_.info("Stopping application (pid " + std::to_string(pid) + ")");
    if (!signal_process_group(pid, SIGTERM)) {
        logger_.warn("SIGTERM to pid " + std::to_string(pid) + " failed: " + std::strerror(errno));
    }

    const auto deadline = std::chrono::steady_clock::now() + settings_.grace_period;
    while (std::chrono::steady_clock::now() < deadline) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(settings_.stop_poll_interval, std::max(remaining, 1ms)));
        if (try_reap()) {
            return;
        }
    }

    logger_.warn("Application did not exit within " + format_duration(settings_.grace_period) +
                 ", sending SIGKILL");
    if (!signal_process_group(pid, SIGKILL)) {
        logger_.error("SIGKILL to pid " + std::to_string(pid) + " failed: " + std::strerror(errno));
    }

    int status = 0;
    pid_t result;
    do {
        result = ::waitpid(pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == pid) {
        last_exit_ = ExitStatus::from_wait_status(status);
        logger_.info("Application killed (" + last_exit_->describe() + ")");
    }
    handle_.reset();
}

void ProcessSupervisor::terminate_untracked(pid_t pid) {
    logger_.info("Stopping untracked application process " + std::to_string(pid));

    if (::kill(pid, SIGTERM) != 0) {
        if (errno != ESRCH) {
            logger_.warn("SIGTERM to pid " + std::to_string(pid) + " failed: " + std::strerror(errno));
        }
        return;
    }

    const auto deadline = std::chrono::steady_clock::now() + settings_.grace_period;
    while (std::chrono::steady_clock::now() < deadline) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(settings_.stop_poll_interval, std::max(remaining, 1ms)));
        if (!process_exists(pid)) {
            return;
        }
    }

    logger_.warn("Process " + std::to_string(pid) + " ignored SIGTERM, sending SIGKILL");
    if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        logger_.error("SIGKILL to pid " + std::to_string(pid) + " failed: " + std::strerror(errno));
    }
}

// ============================================================================
// /proc 조회
// ============================================================================

namespace {

bool argv_matches(const std::string& cmdline, const std::string& name) {
    size_t begin = 0;
    while (begin < cmdline.size()) {
        size_t end = cmdline.find('\0', begin);
        if (end == std::string::npos) {
            end = cmdline.size();
        }

        const std::string_view arg(cmdline.data() + begin, end - begin);
        if (arg == name) {
            return true;
        }
        const auto slash = arg.rfind('/');
        if (slash != std::string_view::npos && arg.substr(slash + 1) == name) {
            return true;
        }
        begin = end + 1;
    }
    return false;
}

} // namespace

std::vector<pid_t> find_processes_by_name(const std::string& name, const fs::path& working_directory) {
    std::vector<pid_t> pids;
    if (name.empty()) {
        return pids;
    }

    std::error_code ec;
    fs::path expected_cwd;
    if (!working_directory.empty()) {
        expected_cwd = fs::weakly_canonical(working_directory, ec);
        if (ec) {
            return pids;
        }
    }

    const pid_t self = ::getpid();
    fs::directory_iterator it("/proc", ec);
    if (ec) {
        return pids;
    }

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }

        const std::string entry = it->path().filename().string();
        if (entry.empty() || !std::all_of(entry.begin(), entry.end(), [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }

        pid_t pid = static_cast<pid_t>(std::stol(entry));
        if (pid == self) {
            continue;
        }

        std::ifstream in(it->path() / "cmdline", std::ios::binary);
        if (!in) {
            continue;
        }
        const std::string cmdline((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (!argv_matches(cmdline, name)) {
            continue;
        }

        if (!expected_cwd.empty()) {
            std::error_code cwd_ec;
            const auto cwd = fs::read_symlink(it->path() / "cwd", cwd_ec);
            if (cwd_ec || cwd != expected_cwd) {
                continue;
            }
        }
        pids.push_back(pid);
    }

    return pids;
}

bool process_exists(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) != 0 && errno != EPERM) {
        return false;
    }

    // 좀비는 종료된 것으로 본다
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string content;
    if (!std::getline(stat, content)) {
        return true;
    }
    const auto comm_end = content.rfind(')');
    if (comm_end == std::string::npos || comm_end + 2 >= content.size()) {
        return true;
    }
    return content[comm_end + 2] != 'Z';
}

} // namespace updraft
