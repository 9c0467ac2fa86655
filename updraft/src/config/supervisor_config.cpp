#include "updraft/config/supervisor_config.h"
#include "updraft/utils/logger.h"

#include <toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace updraft {

// ============================================================================
// Enum Conversions
// ============================================================================

namespace {

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

} // namespace

std::string to_string(HealthMode mode) {
    switch (mode) {
        case HealthMode::RECORD: return "record";
        case HealthMode::LOG:    return "log";
        default: return "unknown";
    }
}

std::optional<HealthMode> health_mode_from_string(const std::string& mode_str) {
    std::string lower = to_lower(trim(mode_str));
    if (lower == "record") return HealthMode::RECORD;
    if (lower == "log")    return HealthMode::LOG;
    return std::nullopt;
}

std::string to_string(RemoteKind kind) {
    switch (kind) {
        case RemoteKind::DIRECTORY: return "directory";
        default: return "unknown";
    }
}

std::optional<RemoteKind> remote_kind_from_string(const std::string& kind_str) {
    if (to_lower(trim(kind_str)) == "directory") return RemoteKind::DIRECTORY;
    return std::nullopt;
}

std::string to_string(LogFormat format) {
    switch (format) {
        case LogFormat::TEXT: return "text";
        case LogFormat::JSON: return "json";
        default: return "unknown";
    }
}

std::optional<LogFormat> log_format_from_string(const std::string& format_str) {
    std::string lower = to_lower(trim(format_str));
    if (lower == "text") return LogFormat::TEXT;
    if (lower == "json") return LogFormat::JSON;
    return std::nullopt;
}

// ============================================================================
// Duration Parsing
// ============================================================================

std::optional<std::chrono::milliseconds> parse_duration(const std::string& duration_str) {
    static const std::regex duration_regex(R"(^(\d+)\s*(ms|s|sec|m|min|h)$)");
    std::smatch match;

    std::string input = to_lower(trim(duration_str));
    if (!std::regex_match(input, match, duration_regex)) {
        return std::nullopt;
    }

    long long value = 0;
    try {
        value = std::stoll(match[1].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    const std::string unit = match[2].str();
    long long unit_ms = 0;
    if (unit == "ms") {
        unit_ms = 1;
    } else if (unit == "s" || unit == "sec") {
        unit_ms = 1000;
    } else if (unit == "m" || unit == "min") {
        unit_ms = 60 * 1000;
    } else if (unit == "h") {
        unit_ms = 60 * 60 * 1000;
    } else {
        return std::nullopt;
    }

    if (value > MAX_DURATION.count() / unit_ms) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(value * unit_ms);
}

std::string format_duration(std::chrono::milliseconds duration) {
    const auto ms = duration.count();
    if (ms != 0 && ms % 3600000 == 0) return std::to_string(ms / 3600000) + "h";
    if (ms != 0 && ms % 60000 == 0)   return std::to_string(ms / 60000) + "min";
    if (ms % 1000 == 0)               return std::to_string(ms / 1000) + "s";
    return std::to_string(ms) + "ms";
}

// ============================================================================
// TOML Reading Helpers
// ============================================================================

namespace {

/**
 * @brief 섹션 단위 TOML 읽기 도우미
 *
 * 값 오류는 std::invalid_argument로 던지고 from_toml_data()에서
 * ConfigErrorCode::INVALID_VALUE로 변환한다.
 */
class SectionReader {
public:
    SectionReader(const toml::value& section, std::string name)
        : section_(section), name_(std::move(name)) {}

    void require_known_keys(std::initializer_list<const char*> known) const {
        std::unordered_set<std::string> allowed(known.begin(), known.end());
        for (const auto& [key, value] : section_.as_table()) {
            if (allowed.find(key) == allowed.end()) {
                throw std::invalid_argument("Unknown configuration key '" + key + "' in [" + name_ + "]");
            }
        }
    }

    void read(const char* key, std::string& target) const {
        if (section_.contains(key)) {
            target = toml::find<std::string>(section_, key);
        }
    }

    void read(const char* key, std::filesystem::path& target) const {
        if (section_.contains(key)) {
            target = toml::find<std::string>(section_, key);
        }
    }

    void read(const char* key, size_t& target) const {
        if (section_.contains(key)) {
            auto value = toml::find<std::int64_t>(section_, key);
            if (value < 0) {
                throw std::invalid_argument(qualified(key) + " must not be negative");
            }
            target = static_cast<size_t>(value);
        }
    }

    void read(const char* key, std::vector<std::string>& target) const {
        if (section_.contains(key)) {
            target = toml::find<std::vector<std::string>>(section_, key);
        }
    }

    /**
     * @brief 문자열("20s") 또는 정수(초) 형태의 기간
     */
    void read(const char* key, std::chrono::milliseconds& target) const {
        if (!section_.contains(key)) {
            return;
        }

        const auto& value = toml::find(section_, key);
        if (value.is_integer()) {
            const auto seconds = toml::get<std::int64_t>(value);
            if (seconds < 0 || seconds > std::chrono::duration_cast<std::chrono::seconds>(MAX_DURATION).count()) {
                throw std::invalid_argument("Duration out of range for " + qualified(key));
            }
            target = std::chrono::seconds(seconds);
            return;
        }

        auto duration_str = toml::get<std::string>(value);
        auto duration = parse_duration(duration_str);
        if (!duration) {
            throw std::invalid_argument("Invalid duration '" + duration_str + "' for " + qualified(key));
        }
        target = *duration;
    }

    template<typename Enum, typename Parser>
    void read_enum(const char* key, Enum& target, Parser parser) const {
        if (section_.contains(key)) {
            auto text = toml::find<std::string>(section_, key);
            auto parsed = parser(text);
            if (!parsed) {
                throw std::invalid_argument("Unknown value '" + text + "' for " + qualified(key));
            }
            target = *parsed;
        }
    }

private:
    const toml::value& section_;
    std::string name_;

    std::string qualified(const char* key) const {
        return name_ + "." + key;
    }
};

SupervisorConfig from_toml_data(const toml::value& toml_data) {
    SupervisorConfig config;

    SectionReader root(toml_data, "root");
    root.require_known_keys({"supervisor", "application", "health", "remote", "logging"});

    // Supervisor section
    if (toml_data.contains("supervisor")) {
        SectionReader section(toml::find(toml_data, "supervisor"), "supervisor");
        section.require_known_keys({"poll_interval", "versions_dir", "max_versions",
                                    "default_version", "lock_file"});

        section.read("poll_interval", config.supervisor.poll_interval);
        section.read("versions_dir", config.supervisor.versions_dir);
        section.read("max_versions", config.supervisor.max_versions);
        section.read("default_version", config.supervisor.default_version);
        section.read("lock_file", config.supervisor.lock_file);
    }

    // Application section
    if (toml_data.contains("application")) {
        SectionReader section(toml::find(toml_data, "application"), "application");
        section.require_known_keys({"directory", "command", "output_log", "process_name",
                                    "grace_period", "stop_poll_interval", "startup_window",
                                    "scan_exclude"});

        section.read("directory", config.application.directory);
        section.read("command", config.application.command);
        section.read("output_log", config.application.output_log);
        section.read("process_name", config.application.process_name);
        section.read("grace_period", config.application.grace_period);
        section.read("stop_poll_interval", config.application.stop_poll_interval);
        section.read("startup_window", config.application.startup_window);
        section.read("scan_exclude", config.application.scan_exclude);
    }

    // Health section
    if (toml_data.contains("health")) {
        SectionReader section(toml::find(toml_data, "health"), "health");
        section.require_known_keys({"mode", "timeout", "settle_delay", "poll_interval",
                                    "record_path", "max_record_age", "log_path",
                                    "log_tail_bytes", "ready_marker", "activity_markers"});

        section.read_enum("mode", config.health.mode, health_mode_from_string);
        section.read("timeout", config.health.timeout);
        section.read("settle_delay", config.health.settle_delay);
        section.read("poll_interval", config.health.poll_interval);
        section.read("record_path", config.health.record_path);
        section.read("max_record_age", config.health.max_record_age);
        section.read("log_path", config.health.log_path);
        section.read("log_tail_bytes", config.health.log_tail_bytes);
        section.read("ready_marker", config.health.ready_marker);
        section.read("activity_markers", config.health.activity_markers);
    }

    // Remote section
    if (toml_data.contains("remote")) {
        SectionReader section(toml::find(toml_data, "remote"), "remote");
        section.require_known_keys({"kind", "feed_path"});

        section.read_enum("kind", config.remote.kind, remote_kind_from_string);
        section.read("feed_path", config.remote.feed_path);
    }

    // Logging section
    if (toml_data.contains("logging")) {
        SectionReader section(toml::find(toml_data, "logging"), "logging");
        section.require_known_keys({"level", "format", "file", "max_file_size_mb", "max_files"});

        section.read("level", config.logging.level);
        section.read_enum("format", config.logging.format, log_format_from_string);
        section.read("file", config.logging.file);
        section.read("max_file_size_mb", config.logging.max_file_size_mb);
        section.read("max_files", config.logging.max_files);
    }

    return config;
}

template<typename Parse>
std::expected<SupervisorConfig, ConfigError> parse_guarded(Parse parse) {
    try {
        return from_toml_data(parse());
    } catch (const std::invalid_argument& e) {
        return std::unexpected(ConfigError{ConfigErrorCode::INVALID_VALUE, e.what()});
    } catch (const std::exception& e) {
        // toml::syntax_error, toml::type_error, 범위 초과 등
        return std::unexpected(ConfigError{ConfigErrorCode::PARSE_ERROR, e.what()});
    }
}

std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::optional<std::string>(value) : std::nullopt;
}

std::string quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        const auto byte = static_cast<unsigned char>(c);
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\f': out += "\\f"; break;
            case '\r': out += "\\r"; break;
            default:
                if (byte < 0x20 || byte == 0x7f) {
                    char escaped[8];
                    std::snprintf(escaped, sizeof(escaped), "\\u%04X", static_cast<unsigned>(byte));
                    out += escaped;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

std::string quote_list(const std::vector<std::string>& values) {
    std::string out = "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += quote(values[i]);
    }
    out += "]";
    return out;
}

} // namespace

// ============================================================================
// TOML Configuration Support
// ============================================================================

std::expected<SupervisorConfig, ConfigError> SupervisorConfig::from_toml_file(const std::filesystem::path& config_path) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        return std::unexpected(ConfigError{ConfigErrorCode::FILE_NOT_FOUND,
                                           "Configuration file not found: " + config_path.string()});
    }

    return parse_guarded([&] { return toml::parse(config_path); });
}

std::expected<SupervisorConfig, ConfigError> SupervisorConfig::from_toml_string(const std::string& toml_content) {
    return parse_guarded([&] {
        std::istringstream stream(toml_content);
        return toml::parse(stream, "updraft.toml");
    });
}

// ============================================================================
// Environment Overrides
// ============================================================================

std::expected<SupervisorConfig, ConfigError> SupervisorConfig::with_environment_overrides() const {
    SupervisorConfig result = *this;

    auto duration_override = [](const char* name, std::chrono::milliseconds& target)
        -> std::optional<ConfigError> {
        if (auto value = get_env(name)) {
            auto duration = parse_duration(*value);
            if (!duration) {
                return ConfigError{ConfigErrorCode::INVALID_VALUE,
                                   std::string("Invalid duration in ") + name + ": " + *value};
            }
            target = *duration;
        }
        return std::nullopt;
    };

    if (auto err = duration_override("UPDRAFT_POLL_INTERVAL", result.supervisor.poll_interval)) {
        return std::unexpected(*err);
    }

    if (auto err = duration_override("UPDRAFT_HEALTH_TIMEOUT", result.health.timeout)) {
        return std::unexpected(*err);
    }

    if (auto value = get_env("UPDRAFT_MAX_VERSIONS")) {
        try {
            size_t parsed = 0;
            long long count = std::stoll(*value, &parsed);
            if (parsed != value->size() || count < 0) {
                throw std::invalid_argument(*value);
            }
            result.supervisor.max_versions = static_cast<size_t>(count);
        } catch (const std::exception&) {
            return std::unexpected(ConfigError{ConfigErrorCode::INVALID_VALUE,
                                               "Invalid integer in UPDRAFT_MAX_VERSIONS: " + *value});
        }
    }

    if (auto value = get_env("UPDRAFT_APP_DIR")) {
        result.application.directory = *value;
    }

    if (auto value = get_env("UPDRAFT_VERSIONS_DIR")) {
        result.supervisor.versions_dir = *value;
    }

    if (auto value = get_env("UPDRAFT_FEED_PATH")) {
        result.remote.feed_path = *value;
    }

    if (auto value = get_env("UPDRAFT_LOG_LEVEL")) {
        result.logging.level = *value;
    }

    return result;
}

// ============================================================================
// Configuration Validation
// ============================================================================

ValidationResult SupervisorConfig::validate() const {
    ValidationResult result;

    auto error = [&result](std::string message) {
        result.is_valid = false;
        result.errors.push_back(std::move(message));
    };

    // Supervisor
    if (supervisor.poll_interval.count() <= 0) {
        error("supervisor.poll_interval must be positive");
    }

    if (supervisor.versions_dir.empty()) {
        error("supervisor.versions_dir must not be empty");
    }

    if (supervisor.max_versions < 1) {
        error("supervisor.max_versions must be at least 1");
    } else if (supervisor.max_versions == 1) {
        result.warnings.push_back("supervisor.max_versions is 1; rollback will never be possible");
    }

    if (supervisor.default_version.empty()) {
        error("supervisor.default_version must not be empty");
    }

    // Application
    if (application.directory.empty()) {
        error("application.directory must not be empty");
    }

    if (application.command.empty() || application.command.front().empty()) {
        error("application.command must name an executable");
    }

    if (application.grace_period.count() < 0) {
        error("application.grace_period must not be negative");
    } else if (application.grace_period > std::chrono::minutes(5)) {
        result.warnings.push_back("application.grace_period is above 5 minutes; updates will stall on hung processes");
    }

    if (application.stop_poll_interval.count() <= 0) {
        error("application.stop_poll_interval must be positive");
    }

    if (application.startup_window.count() < 0) {
        error("application.startup_window must not be negative");
    }

    // Health
    if (health.timeout.count() <= 0) {
        error("health.timeout must be positive");
    }

    if (health.poll_interval.count() <= 0) {
        error("health.poll_interval must be positive");
    } else if (health.poll_interval >= health.timeout) {
        error("health.poll_interval must be shorter than health.timeout");
    }

    if (health.settle_delay.count() < 0) {
        error("health.settle_delay must not be negative");
    }

    if (health.mode == HealthMode::RECORD) {
        if (health.record_path.empty()) {
            error("health.record_path must be set in record mode");
        }
        if (health.max_record_age.count() <= 0) {
            error("health.max_record_age must be positive");
        }
    } else if (health.mode == HealthMode::LOG) {
        if (health.log_path.empty()) {
            error("health.log_path must be set in log mode");
        }
        if (health.ready_marker.empty() && health.activity_markers.empty()) {
            error("health log mode needs a ready_marker or activity_markers");
        }
        if (health.log_tail_bytes == 0) {
            error("health.log_tail_bytes must be positive");
        }
    }

    // Remote
    if (remote.kind == RemoteKind::DIRECTORY && remote.feed_path.empty()) {
        error("remote.feed_path must not be empty");
    }

    // Logging
    if (!is_log_level_name(logging.level)) {
        error("Unknown logging.level '" + logging.level + "'");
    }

    return result;
}

std::string ValidationResult::report() const {
    std::ostringstream oss;
    oss << (is_valid ? "Configuration is valid" : "Configuration is invalid");

    for (const auto& e : errors) {
        oss << "\n  error: " << e;
    }
    for (const auto& w : warnings) {
        oss << "\n  warning: " << w;
    }

    return oss.str();
}

// ============================================================================
// Configuration Serialization
// ============================================================================

std::string SupervisorConfig::to_toml() const {
    std::ostringstream oss;

    oss << "[supervisor]\n";
    oss << "poll_interval = " << quote(format_duration(supervisor.poll_interval)) << "\n";
    oss << "versions_dir = " << quote(supervisor.versions_dir.string()) << "\n";
    oss << "max_versions = " << supervisor.max_versions << "\n";
    oss << "default_version = " << quote(supervisor.default_version) << "\n";
    oss << "lock_file = " << quote(supervisor.lock_file.string()) << "\n\n";

    oss << "[application]\n";
    oss << "directory = " << quote(application.directory.string()) << "\n";
    oss << "command = " << quote_list(application.command) << "\n";
    oss << "output_log = " << quote(application.output_log.string()) << "\n";
    oss << "process_name = " << quote(application.process_name) << "\n";
    oss << "grace_period = " << quote(format_duration(application.grace_period)) << "\n";
    oss << "stop_poll_interval = " << quote(format_duration(application.stop_poll_interval)) << "\n";
    oss << "startup_window = " << quote(format_duration(application.startup_window)) << "\n";
    oss << "scan_exclude = " << quote_list(application.scan_exclude) << "\n\n";

    oss << "[health]\n";
    oss << "mode = " << quote(to_string(health.mode)) << "\n";
    oss << "timeout = " << quote(format_duration(health.timeout)) << "\n";
    oss << "settle_delay = " << quote(format_duration(health.settle_delay)) << "\n";
    oss << "poll_interval = " << quote(format_duration(health.poll_interval)) << "\n";
    oss << "record_path = " << quote(health.record_path.string()) << "\n";
    oss << "max_record_age = " << quote(format_duration(health.max_record_age)) << "\n";
    oss << "log_path = " << quote(health.log_path.string()) << "\n";
    oss << "log_tail_bytes = " << health.log_tail_bytes << "\n";
    oss << "ready_marker = " << quote(health.ready_marker) << "\n";
    oss << "activity_markers = " << quote_list(health.activity_markers) << "\n\n";

    oss << "[remote]\n";
    oss << "kind = " << quote(to_string(remote.kind)) << "\n";
    oss << "feed_path = " << quote(remote.feed_path.string()) << "\n\n";

    oss << "[logging]\n";
    oss << "level = " << quote(logging.level) << "\n";
    oss << "format = " << quote(to_string(logging.format)) << "\n";
    oss << "file = " << quote(logging.file.string()) << "\n";
    oss << "max_file_size_mb = " << logging.max_file_size_mb << "\n";
    oss << "max_files = " << logging.max_files << "\n";

    return oss.str();
}

// ============================================================================
// Resolved Paths
// ============================================================================

std::string ApplicationSettings::effective_process_name() const {
    if (!process_name.empty()) {
        return process_name;
    }
    return command.empty() ? std::string{} : command.back();
}

std::filesystem::path SupervisorConfig::lock_file_path() const {
    return supervisor.lock_file.is_absolute()
        ? supervisor.lock_file
        : supervisor.versions_dir / supervisor.lock_file;
}

std::filesystem::path SupervisorConfig::health_record_file() const {
    return health.record_path.is_absolute()
        ? health.record_path
        : application.directory / health.record_path;
}

std::filesystem::path SupervisorConfig::health_log_file() const {
    return health.log_path.is_absolute()
        ? health.log_path
        : application.directory / health.log_path;
}

} // namespace updraft
