#include "updraft/health/health_signal.h"
#include "updraft/config/supervisor_config.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <fstream>
#include <sstream>

namespace updraft {

namespace fs = std::filesystem;

// ============================================================================
// HealthRecordSignal
// ============================================================================

HealthRecordSignal::HealthRecordSignal(fs::path record_path, std::chrono::milliseconds max_age)
    : record_path_(std::move(record_path))
    , max_age_(max_age) {}

HealthObservation HealthRecordSignal::observe(const std::string& expected_version) {
    std::ifstream in(record_path_);
    if (!in) {
        return {false, "No health record at " + record_path_.string()};
    }

    auto record = nlohmann::json::parse(in, nullptr, false);
    if (record.is_discarded() || !record.is_object()) {
        return {false, "Health record is not a JSON object"};
    }

    if (!record.contains("ok") || !record["ok"].is_boolean() ||
        !record.contains("version") || !record["version"].is_string() ||
        !record.contains("timestamp") || !record["timestamp"].is_number()) {
        return {false, "Health record is missing ok/version/timestamp"};
    }

    std::string detail;
    if (record.contains("detail") && record["detail"].is_string()) {
        detail = record["detail"].get<std::string>();
    }
    if (!record["ok"].get<bool>()) {
        return {false, "Application reports unhealthy: " + detail};
    }

    const auto version = record["version"].get<std::string>();
    if (version != expected_version) {
        return {false, "Health record is for version " + version + ", expected " + expected_version};
    }

    const auto recorded_ms = static_cast<int64_t>(record["timestamp"].get<double>() * 1000.0);
    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const int64_t age_ms = now_ms - recorded_ms;

    if (age_ms > max_age_.count()) {
        return {false, "Health record is stale (" + std::to_string(age_ms / 1000) + "s old)"};
    }

    return {true, detail.empty() ? "Health record ok" : detail};
}

// ============================================================================
// LogMarkerSignal
// ============================================================================

LogMarkerSignal::LogMarkerSignal(fs::path log_path,
                                 size_t tail_bytes,
                                 std::string ready_marker,
                                 std::vector<std::string> activity_markers)
    : log_path_(std::move(log_path))
    , tail_bytes_(tail_bytes)
    , ready_marker_(std::move(ready_marker))
    , activity_markers_(std::move(activity_markers)) {}

void LogMarkerSignal::begin() {
    std::error_code ec;
    const auto size = fs::file_size(log_path_, ec);
    start_offset_ = ec ? 0 : size;
}

HealthObservation LogMarkerSignal::observe(const std::string& /*expected_version*/) {
    std::ifstream in(log_path_, std::ios::binary);
    if (!in) {
        return {false, "Application log not found: " + log_path_.string()};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    std::string content = buffer.str();
    if (content.size() >= start_offset_) {
        content.erase(0, static_cast<size_t>(start_offset_));
    }

    if (!ready_marker_.empty() && content.find(ready_marker_) == std::string::npos) {
        return {false, "Ready marker not logged yet"};
    }

    const std::string tail = content.size() > tail_bytes_ ? content.substr(content.size() - tail_bytes_) : content;
    for (const auto& marker : activity_markers_) {
        if (tail.find(marker) != std::string::npos) {
            return {true, "Recent activity: " + marker};
        }
    }

    if (activity_markers_.empty()) {
        return {true, "Ready marker found"};
    }
    return {false, "No recent activity in the last " + std::to_string(tail_bytes_) + " bytes"};
}

// ============================================================================
// 팩토리
// ============================================================================

std::unique_ptr<HealthSignal> make_health_signal(const SupervisorConfig& config) {
    switch (config.health.mode) {
        case HealthMode::LOG:
            return std::make_unique<LogMarkerSignal>(config.health_log_file(),
                                                     config.health.log_tail_bytes,
                                                     config.health.ready_marker,
                                                     config.health.activity_markers);
        case HealthMode::RECORD:
        default:
            return std::make_unique<HealthRecordSignal>(config.health_record_file(),
                                                        config.health.max_record_age);
    }
}

} // namespace updraft
