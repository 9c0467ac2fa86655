#include <catch2/catch.hpp>

#include "test_support.h"
#include "updraft/process/process_supervisor.h"

#include <algorithm>
#include <csignal>
#include <thread>
#include <unistd.h>

using namespace updraft;
using namespace std::chrono_literals;
using updraft::testing::TempDir;

namespace fs = std::filesystem;

namespace {

ApplicationSettings make_settings(const TempDir& dir, std::vector<std::string> command) {
    ApplicationSettings settings;
    settings.directory = dir / "app";
    settings.command = std::move(command);
    settings.output_log = "logs/application.out";
    settings.grace_period = 1s;
    settings.stop_poll_interval = 100ms;
    settings.startup_window = 200ms;
    fs::create_directories(settings.directory);
    return settings;
}

template<typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = 3s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(20ms);
    }
    return predicate();
}

} // namespace

// -------------------------------------------------------------------------
TEST_CASE("ProcessSupervisor: exit status descriptions", "[process]")
{
    REQUIRE(ExitStatus{3, std::nullopt}.describe() == "exit code 3");
    REQUIRE(ExitStatus{std::nullopt, SIGKILL}.describe().rfind("signal 9", 0) == 0);
    REQUIRE(ExitStatus{}.describe() == "unknown status");
}
// -------------------------------------------------------------------------
TEST_CASE("ProcessSupervisor: start and graceful stop", "[process]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    ProcessSupervisor supervisor(context, make_settings(dir, {"/bin/sh", "-c", "exec sleep 30"}));

    auto handle = supervisor.start();
    REQUIRE(handle.has_value());
    REQUIRE(handle->pid > 0);
    REQUIRE(supervisor.is_running());
    REQUIRE(supervisor.handle().has_value());

    auto again = supervisor.start();
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code == ProcessErrorCode::ALREADY_RUNNING);

    const auto pid = handle->pid;
    supervisor.stop();

    REQUIRE_FALSE(supervisor.is_running());
    REQUIRE_FALSE(supervisor.handle().has_value());
    REQUIRE_FALSE(process_exists(pid));
    REQUIRE(supervisor.last_exit_status().has_value());
    REQUIRE(supervisor.last_exit_status()->signal == std::optional<int>(SIGTERM));
}
// -------------------------------------------------------------------------
TEST_CASE("ProcessSupervisor: a process ignoring SIGTERM is killed after the grace period", "[process]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    ProcessSupervisor supervisor(context, make_settings(dir, {"/bin/sh", "-c", "trap '' TERM; sleep 30; true"}));

    REQUIRE(supervisor.start().has_value());

    const auto begin = std::chrono::steady_clock::now();
    supervisor.stop();
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    REQUIRE_FALSE(supervisor.is_running());
    REQUIRE(elapsed >= 1s);
    REQUIRE(elapsed < 4s);
    REQUIRE(supervisor.last_exit_status()->signal == std::optional<int>(SIGKILL));
}
// -------------------------------------------------------------------------
TEST_CASE("ProcessSupervisor: start failures", "[process]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();

    SECTION("missing executable") {
        ProcessSupervisor supervisor(context, make_settings(dir, {"/nonexistent/updraft-test-binary"}));
        auto result = supervisor.start();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ProcessErrorCode::EXEC_FAILED);
        REQUIRE_FALSE(supervisor.is_running());
    }

    SECTION("missing working directory") {
        auto settings = make_settings(dir, {"/bin/sh", "-c", "exec sleep 30"});
        settings.directory = dir / "absent";
        settings.output_log = dir / "out.log";
        ProcessSupervisor supervisor(context, settings);

        auto result = supervisor.start();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ProcessErrorCode::EXEC_FAILED);
        REQUIRE(result.error().message.find("chdir") != std::string::npos);
    }

    SECTION("empty command") {
        ProcessSupervisor supervisor(context, make_settings(dir, {}));
        auto result = supervisor.start();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ProcessErrorCode::INVALID_COMMAND);
    }

    SECTION("immediate exit") {
        auto settings = make_settings(dir, {"/bin/sh", "-c", "exit 3"});
        settings.startup_window = 1s;
        ProcessSupervisor supervisor(context, settings);

        auto result = supervisor.start();
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == ProcessErrorCode::EXITED_IMMEDIATELY);
        REQUIRE(supervisor.last_exit_status()->exit_code == std::optional<int>(3));
        REQUIRE_FALSE(supervisor.handle().has_value());
    }
}
// -------------------------------------------------------------------------
TEST_CASE("ProcessSupervisor: output is appended to the output log", "[process]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    auto settings = make_settings(dir, {"/bin/sh", "-c", "echo hello-from-app; echo oops >&2; exec sleep 30"});
    ProcessSupervisor supervisor(context, settings);

    REQUIRE(supervisor.start().has_value());

    const auto log_path = settings.directory / settings.output_log;
    REQUIRE(eventually([&] {
        auto content = updraft::testing::read_file(log_path);
        return content.find("hello-from-app") != std::string::npos && content.find("oops") != std::string::npos;
    }));

    supervisor.stop();
}
// -------------------------------------------------------------------------
TEST_CASE("ProcessSupervisor: an exited process is reaped", "[process]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    ProcessSupervisor supervisor(context, make_settings(dir, {"/bin/sh", "-c", "sleep 0.5; exit 4"}));

    REQUIRE(supervisor.start().has_value());
    REQUIRE(eventually([&] { return !supervisor.is_running(); }));
    REQUIRE(supervisor.last_exit_status()->exit_code == std::optional<int>(4));

    // 종료 후 재시작 가능
    REQUIRE(supervisor.start().has_value());
    supervisor.stop();
}
// -------------------------------------------------------------------------
TEST_CASE("ProcessSupervisor: stop without a handle finds the process by name", "[process]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    const std::string marker = "updraft-fallback-" + std::to_string(::getpid());

    // $0 자리에 marker를 넣어 command line으로 찾을 수 있게 한다
    auto settings = make_settings(dir, {"/bin/sh", "-c", "while :; do sleep 1; done", marker});
    ProcessSupervisor owner(context, settings);
    auto handle = owner.start();
    REQUIRE(handle.has_value());

    auto found = find_processes_by_name(marker);
    REQUIRE(std::find(found.begin(), found.end(), handle->pid) != found.end());

    settings.process_name = marker;
    ProcessSupervisor restarted(context, settings);
    REQUIRE_FALSE(restarted.handle().has_value());
    restarted.stop();

    REQUIRE(eventually([&] { return !owner.is_running(); }));
    REQUIRE(find_processes_by_name(marker).empty());
}
// -------------------------------------------------------------------------
TEST_CASE("ProcessSupervisor: name lookup matches whole arguments only", "[process]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    const std::string marker = "updraft-argv-" + std::to_string(::getpid()) + ".py";

    ProcessSupervisor editor(context, make_settings(dir, {"/bin/sh", "-c", "while :; do sleep 1; done",
                                                          "my" + marker + ".swp"}));
    auto editor_handle = editor.start();
    REQUIRE(editor_handle.has_value());

    auto found = find_processes_by_name(marker);
    REQUIRE(std::find(found.begin(), found.end(), editor_handle->pid) == found.end());

    found = find_processes_by_name("my" + marker + ".swp");
    REQUIRE(std::find(found.begin(), found.end(), editor_handle->pid) != found.end());

    // 절대 경로로 실행된 경우 basename으로 찾는다
    ProcessSupervisor app(context, make_settings(dir, {"/bin/sh", "-c", "while :; do sleep 1; done",
                                                       (dir / "app" / marker).string()}));
    auto app_handle = app.start();
    REQUIRE(app_handle.has_value());

    found = find_processes_by_name(marker);
    REQUIRE(std::find(found.begin(), found.end(), app_handle->pid) != found.end());
    REQUIRE(std::find(found.begin(), found.end(), editor_handle->pid) == found.end());

    editor.stop();
    app.stop();
}
// -------------------------------------------------------------------------
TEST_CASE("ProcessSupervisor: stop without a handle ignores processes in other directories", "[process]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    const std::string marker = "updraft-elsewhere-" + std::to_string(::getpid());

    auto other_settings = make_settings(dir, {"/bin/sh", "-c", "while :; do sleep 1; done", marker});
    other_settings.directory = dir / "other";
    fs::create_directories(other_settings.directory);
    ProcessSupervisor other(context, other_settings);
    auto other_handle = other.start();
    REQUIRE(other_handle.has_value());

    auto found = find_processes_by_name(marker, dir / "app");
    REQUIRE(std::find(found.begin(), found.end(), other_handle->pid) == found.end());
    found = find_processes_by_name(marker, dir / "other");
    REQUIRE(std::find(found.begin(), found.end(), other_handle->pid) != found.end());

    auto settings = make_settings(dir, {"/bin/sh", "-c", "while :; do sleep 1; done", marker});
    settings.process_name = marker;
    ProcessSupervisor restarted(context, settings);
    restarted.stop();

    REQUIRE(other.is_running());
    other.stop();
}
// -------------------------------------------------------------------------
TEST_CASE("ProcessSupervisor: name lookup excludes unrelated processes", "[process]")
{
    REQUIRE(find_processes_by_name("").empty());
    REQUIRE(find_processes_by_name("updraft-no-such-process-" + std::to_string(::getpid()) + "-x").empty());
    REQUIRE(process_exists(::getpid()));
    REQUIRE_FALSE(process_exists(-1));
}
