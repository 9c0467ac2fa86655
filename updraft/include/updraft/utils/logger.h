#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <map>
#include <vector>
#include <atomic>
#include <mutex>
#include <thread>
#include <fstream>
#include <filesystem>
#include <type_traits>

namespace updraft {

// ============================================================================
// 로그 레벨 정의
// ============================================================================

enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

[[nodiscard]] std::string to_string(LogLevel level);

/**
 * @brief 문자열을 로그 레벨로 변환 (대소문자 무시)
 * @return 알 수 없는 문자열이면 INFO
 */
[[nodiscard]] LogLevel log_level_from_string(const std::string& level_str);

/**
 * @brief 알려진 로그 레벨 이름인지 확인 (설정 검증용)
 */
[[nodiscard]] bool is_log_level_name(const std::string& level_str);

// ============================================================================
// 로그 메시지 구조체
// ============================================================================

struct LogMessage {
    LogLevel level = LogLevel::INFO;
    std::string component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread_id;

    // 구조화된 필드 (key-value 쌍, 출력 순서 고정)
    std::map<std::string, std::string> fields;

    LogMessage() = default;
    LogMessage(LogLevel lvl, std::string comp, std::string msg,
               std::chrono::system_clock::time_point ts = std::chrono::system_clock::now());
};

// ============================================================================
// 로그 포매터 인터페이스
// ============================================================================

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogMessage& message) = 0;
};

class TextFormatter : public ILogFormatter {
public:
    explicit TextFormatter(bool include_thread_id = false);
    std::string format(const LogMessage& message) override;

private:
    bool include_thread_id_;
};

class JsonFormatter : public ILogFormatter {
public:
    explicit JsonFormatter(bool pretty_print = false);
    std::string format(const LogMessage& message) override;

private:
    bool pretty_print_;
};

// ============================================================================
// 로그 싱크 인터페이스
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const std::string& formatted_message) = 0;
    virtual void flush() = 0;
};

/**
 * @brief 표준 에러 출력 싱크
 *
 * 관리 대상 애플리케이션의 stdout과 섞이지 않도록 std::clog를 사용한다.
 */
class ConsoleSink : public ILogSink {
public:
    ConsoleSink() = default;
    void write(const std::string& formatted_message) override;
    void flush() override;

private:
    std::mutex mutex_;
};

class FileSink : public ILogSink {
public:
    /**
     * @throws std::runtime_error 파일을 열 수 없는 경우
     */
    explicit FileSink(const std::filesystem::path& filename, bool append = true);
    ~FileSink() override;

    void write(const std::string& formatted_message) override;
    void flush() override;
    void enable_rotation(size_t max_size_mb = 100, size_t max_files = 10);

private:
    std::filesystem::path filename_;
    std::ofstream file_;
    std::mutex mutex_;

    // 로테이션 설정
    bool rotation_enabled_ = false;
    size_t max_size_bytes_ = 0;
    size_t max_files_ = 0;
    size_t current_size_ = 0;

    void rotate_if_needed();
    void perform_rotation();
};

// ============================================================================
// Logger
// ============================================================================

/**
 * @brief 컴포넌트 단위 로거
 *
 * 전역 레지스트리 없이 명시적으로 전달된다. child()로 만든 하위 로거는
 * 싱크, 포매터, 레벨을 부모와 공유하고 컴포넌트 이름과 필드만 따로 가진다.
 *
 * @example
 * ```cpp
 * Logger root("updraft");
 * root.add_sink(std::make_shared<ConsoleSink>());
 * auto store_log = root.child("version_store");
 * store_log.with_field("version", "v1.2.0").info("Backed up current version");
 * ```
 */
class Logger {
public:
    explicit Logger(std::string component);

    Logger(const Logger& other) = default;
    Logger& operator=(const Logger& other) = default;
    Logger(Logger&& other) noexcept = default;
    Logger& operator=(Logger&& other) noexcept = default;
    ~Logger() = default;

    // ========================================================================
    // 로그 레벨별 메서드
    // ========================================================================

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);
    void log(LogLevel level, const std::string& message);

    // ========================================================================
    // 구조화된 로깅 (Fluent Interface)
    // ========================================================================

    Logger& with_field(const std::string& key, const std::string& value);

    template<typename T>
    Logger& with_field(const std::string& key, T value);

    Logger& clear_fields();

    // ========================================================================
    // 설정 - 파이프라인(싱크/포매터/레벨)은 하위 로거와 공유
    // ========================================================================

    [[nodiscard]] Logger child(const std::string& component) const;

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel get_level() const;
    [[nodiscard]] bool is_enabled(LogLevel level) const;

    void add_sink(std::shared_ptr<ILogSink> sink);
    void clear_sinks();
    void set_formatter(std::shared_ptr<ILogFormatter> formatter);
    void flush();

    [[nodiscard]] const std::string& component() const;

private:
    /**
     * @brief 부모와 하위 로거가 공유하는 출력 파이프라인
     */
    struct Pipeline {
        std::atomic<LogLevel> min_level{LogLevel::INFO};
        std::vector<std::shared_ptr<ILogSink>> sinks;
        std::shared_ptr<ILogFormatter> formatter;
        std::mutex mutex;
    };

    std::string component_;
    std::map<std::string, std::string> fields_;
    std::shared_ptr<Pipeline> pipeline_;

    Logger(std::string component, std::shared_ptr<Pipeline> pipeline);

    void do_log(LogLevel level, const std::string& message);
};

// ============================================================================
// 템플릿 구현
// ============================================================================

template<typename T>
Logger& Logger::with_field(const std::string& key, T value) {
    if constexpr (std::is_same_v<T, bool>) {
        fields_[key] = value ? "true" : "false";
    } else if constexpr (std::is_arithmetic_v<T>) {
        fields_[key] = std::to_string(value);
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        fields_[key] = std::string(value);
    } else {
        static_assert(std::is_convertible_v<T, std::string>, "Type not supported for logging field");
    }

    return *this;
}

} // namespace updraft
