#include <catch2/catch.hpp>

#include "test_support.h"
#include "updraft/health/health_verifier.h"

#include <nlohmann/json.hpp>

using namespace updraft;
using namespace std::chrono_literals;
using updraft::testing::TempDir;
using updraft::testing::append_file;
using updraft::testing::write_file;

namespace {

double seconds_since_epoch(std::chrono::system_clock::time_point when) {
    return std::chrono::duration<double>(when.time_since_epoch()).count();
}

std::string health_record(bool ok, const std::string& version, double timestamp,
                          const std::string& detail = "") {
    nlohmann::json record;
    record["ok"] = ok;
    record["version"] = version;
    record["timestamp"] = timestamp;
    if (!detail.empty()) {
        record["detail"] = detail;
    }
    return record.dump();
}

/// healthy_after번째 관찰부터 healthy를 보고하는 신호
class CountingSignal : public HealthSignal {
public:
    explicit CountingSignal(int healthy_after) : healthy_after_(healthy_after) {}

    HealthObservation observe(const std::string& /*expected_version*/) override {
        int seen = ++observations;
        if (healthy_after_ > 0 && seen >= healthy_after_) {
            return {true, "counting signal healthy"};
        }
        return {false, "not yet (" + std::to_string(seen) + ")"};
    }

    std::string name() const override { return "counting"; }

    int observations = 0;

private:
    int healthy_after_;
};

ApplicationSettings app_settings(const TempDir& dir, const std::string& script) {
    ApplicationSettings settings;
    settings.directory = dir / "app";
    settings.command = {"/bin/sh", "-c", script};
    settings.grace_period = 1s;
    settings.stop_poll_interval = 100ms;
    settings.startup_window = 100ms;
    std::filesystem::create_directories(settings.directory);
    return settings;
}

HealthSettings fast_health() {
    HealthSettings settings;
    settings.settle_delay = 0ms;
    settings.poll_interval = 100ms;
    settings.timeout = 1s;
    return settings;
}

} // namespace

// -------------------------------------------------------------------------
TEST_CASE("HealthRecordSignal: judges the record written by the application", "[health]")
{
    TempDir dir;
    const auto path = dir / "health.json";
    HealthRecordSignal signal(path, 60s);
    const auto now = std::chrono::system_clock::now();

    REQUIRE(signal.name() == "record");

    SECTION("no record yet") {
        REQUIRE_FALSE(signal.observe("v2").healthy);
    }

    SECTION("fresh record for the expected version") {
        write_file(path, health_record(true, "v2", seconds_since_epoch(now), "db connected"));
        auto observation = signal.observe("v2");
        REQUIRE(observation.healthy);
        REQUIRE(observation.detail == "db connected");
    }

    SECTION("record from the previous version") {
        write_file(path, health_record(true, "v1", seconds_since_epoch(now)));
        auto observation = signal.observe("v2");
        REQUIRE_FALSE(observation.healthy);
        REQUIRE(observation.detail.find("v1") != std::string::npos);
    }

    SECTION("stale record") {
        write_file(path, health_record(true, "v2", seconds_since_epoch(now - 120s)));
        auto observation = signal.observe("v2");
        REQUIRE_FALSE(observation.healthy);
        REQUIRE(observation.detail.find("stale") != std::string::npos);
    }

    SECTION("application reports a failure") {
        write_file(path, health_record(false, "v2", seconds_since_epoch(now), "database unreachable"));
        auto observation = signal.observe("v2");
        REQUIRE_FALSE(observation.healthy);
        REQUIRE(observation.detail.find("database unreachable") != std::string::npos);
    }

    SECTION("incomplete record") {
        write_file(path, R"({"ok": true, "version": "v2"})");
        REQUIRE_FALSE(signal.observe("v2").healthy);
        write_file(path, "garbage");
        REQUIRE_FALSE(signal.observe("v2").healthy);
    }
}
// -------------------------------------------------------------------------
TEST_CASE("LogMarkerSignal: ready marker anywhere, activity in the tail", "[health]")
{
    TempDir dir;
    const auto path = dir / "app.log";
    LogMarkerSignal signal(path, 64, "Successfully connected", {"Data stored:", "Weather data stored:"});

    REQUIRE_FALSE(signal.observe("v2").healthy);

    write_file(path, "starting\nSuccessfully connected\n");
    REQUIRE_FALSE(signal.observe("v2").healthy);

    write_file(path, "starting\nSuccessfully connected\nWeather data stored: 21.5C\n");
    REQUIRE(signal.observe("v2").healthy);

    // 활동 마커가 tail 밖으로 밀려남
    write_file(path, "Successfully connected\nData stored: 1\n" + std::string(200, '.') + "\n");
    REQUIRE_FALSE(signal.observe("v2").healthy);

    write_file(path, "Data stored: 1\n");
    REQUIRE_FALSE(signal.observe("v2").healthy);
}
// -------------------------------------------------------------------------
TEST_CASE("LogMarkerSignal: ready marker alone without activity markers", "[health]")
{
    TempDir dir;
    const auto path = dir / "app.log";
    LogMarkerSignal signal(path, 5000, "listening", {});

    write_file(path, "booting\n");
    REQUIRE_FALSE(signal.observe("v1").healthy);

    write_file(path, "booting\nlistening on :8080\n");
    REQUIRE(signal.observe("v1").healthy);
}
// -------------------------------------------------------------------------
TEST_CASE("LogMarkerSignal: output logged before begin() does not count", "[health]")
{
    TempDir dir;
    const auto path = dir / "app.log";
    LogMarkerSignal signal(path, 5000, "ready", {"tick"});

    write_file(path, "v1 booting\nready\ntick 1\ntick 2\n");
    REQUIRE(signal.observe("v1").healthy);

    signal.begin();
    REQUIRE_FALSE(signal.observe("v2").healthy);

    append_file(path, "v2 booting\ntick 1\n");
    REQUIRE_FALSE(signal.observe("v2").healthy);

    append_file(path, "ready\ntick 2\n");
    REQUIRE(signal.observe("v2").healthy);

    SECTION("log replaced by a shorter file") {
        write_file(path, "ready\ntick 9\n");
        REQUIRE(signal.observe("v2").healthy);
    }

    SECTION("begin() on a missing log") {
        TempDir other;
        LogMarkerSignal fresh(other / "missing.log", 5000, "ready", {"tick"});
        fresh.begin();
        write_file(other / "missing.log", "ready\ntick 1\n");
        REQUIRE(fresh.observe("v2").healthy);
    }
}
// -------------------------------------------------------------------------
TEST_CASE("HealthVerifier: log markers from the previous run do not verify a silent process", "[health]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    const auto log_path = dir / "app/app.log";
    write_file(log_path, "Successfully connected\nWeather data stored: 20.1C\n");

    SECTION("new process never logs") {
        ProcessSupervisor process(context, app_settings(dir, "exec sleep 30"));
        HealthVerifier verifier(context, fast_health(), process,
                                std::make_unique<LogMarkerSignal>(log_path, 5000, "Successfully connected",
                                                                  std::vector<std::string>{"Weather data stored:"}));
        verifier.begin();
        REQUIRE(process.start().has_value());

        REQUIRE_FALSE(verifier.verify(500ms, "v2"));
        process.stop();
    }

    SECTION("new process logs its own markers") {
        ProcessSupervisor process(context,
                                  app_settings(dir, "echo 'Successfully connected' >> app.log; "
                                                    "echo 'Weather data stored: 21.5C' >> app.log; "
                                                    "exec sleep 30"));
        HealthVerifier verifier(context, fast_health(), process,
                                std::make_unique<LogMarkerSignal>(log_path, 5000, "Successfully connected",
                                                                  std::vector<std::string>{"Weather data stored:"}));
        verifier.begin();
        REQUIRE(process.start().has_value());

        REQUIRE(verifier.verify("v2"));
        process.stop();
    }
}
// -------------------------------------------------------------------------
TEST_CASE("HealthSignal: factory follows the configured mode", "[health]")
{
    SupervisorConfig config;
    REQUIRE(make_health_signal(config)->name() == "record");

    config.health.mode = HealthMode::LOG;
    REQUIRE(make_health_signal(config)->name() == "log");
}
// -------------------------------------------------------------------------
TEST_CASE("HealthVerifier: healthy running process passes", "[health]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    ProcessSupervisor process(context, app_settings(dir, "exec sleep 30"));
    REQUIRE(process.start().has_value());

    auto signal = std::make_unique<CountingSignal>(3);
    auto* counter = signal.get();
    HealthVerifier verifier(context, fast_health(), process, std::move(signal));

    REQUIRE(verifier.verify("v2"));
    REQUIRE(counter->observations == 3);
    REQUIRE(verifier.signal().name() == "counting");

    process.stop();
}
// -------------------------------------------------------------------------
TEST_CASE("HealthVerifier: times out when the signal never turns healthy", "[health]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    ProcessSupervisor process(context, app_settings(dir, "exec sleep 30"));
    REQUIRE(process.start().has_value());

    HealthVerifier verifier(context, fast_health(), process, std::make_unique<CountingSignal>(0));

    const auto begin = std::chrono::steady_clock::now();
    REQUIRE_FALSE(verifier.verify(500ms, "v2"));
    const auto elapsed = std::chrono::steady_clock::now() - begin;
    REQUIRE(elapsed >= 500ms);
    REQUIRE(elapsed < 3s);
    REQUIRE(process.is_running());

    process.stop();
}
// -------------------------------------------------------------------------
TEST_CASE("HealthVerifier: a dead process fails even with a healthy signal", "[health]")
{
    TempDir dir;
    auto context = updraft::testing::quiet_context();
    ProcessSupervisor process(context, app_settings(dir, "sleep 0.3; exit 1"));
    REQUIRE(process.start().has_value());

    auto health = fast_health();
    health.settle_delay = 1s;

    auto signal = std::make_unique<CountingSignal>(1);
    auto* counter = signal.get();
    HealthVerifier verifier(context, health, process, std::move(signal));

    REQUIRE_FALSE(verifier.verify("v2"));
    REQUIRE(counter->observations == 0);
    REQUIRE(process.last_exit_status()->exit_code == std::optional<int>(1));
}
