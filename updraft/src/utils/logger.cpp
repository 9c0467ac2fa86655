#include "updraft/utils/logger.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <stdexcept>

namespace updraft {

// ============================================================================
// LogLevel 유틸리티 함수
// ============================================================================

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
        default: return "UNKNOWN";
    }
}

namespace {

std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

/**
 * @brief ISO 8601 UTC 타임스탬프 (밀리초 포함)
 */
std::string format_timestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

} // namespace

LogLevel log_level_from_string(const std::string& level_str) {
    std::string upper_str = to_upper(level_str);

    if (upper_str == "TRACE") return LogLevel::TRACE;
    if (upper_str == "DEBUG") return LogLevel::DEBUG;
    if (upper_str == "INFO")  return LogLevel::INFO;
    if (upper_str == "WARN" || upper_str == "WARNING") return LogLevel::WARN;
    if (upper_str == "ERROR") return LogLevel::ERROR;
    if (upper_str == "FATAL") return LogLevel::FATAL;
    if (upper_str == "OFF")   return LogLevel::OFF;

    return LogLevel::INFO; // 기본값
}

bool is_log_level_name(const std::string& level_str) {
    static const char* names[] = {"TRACE", "DEBUG", "INFO", "WARN", "WARNING", "ERROR", "FATAL", "OFF"};
    std::string upper_str = to_upper(level_str);
    return std::any_of(std::begin(names), std::end(names),
                       [&](const char* name) { return upper_str == name; });
}

// ============================================================================
// LogMessage 구현
// ============================================================================

LogMessage::LogMessage(LogLevel lvl, std::string comp, std::string msg,
                       std::chrono::system_clock::time_point ts)
    : level(lvl)
    , component(std::move(comp))
    , message(std::move(msg))
    , timestamp(ts)
    , thread_id(std::this_thread::get_id()) {
}

// ============================================================================
// TextFormatter 구현
// ============================================================================

TextFormatter::TextFormatter(bool include_thread_id)
    : include_thread_id_(include_thread_id) {
}

std::string TextFormatter::format(const LogMessage& message) {
    std::ostringstream oss;

    oss << "[" << format_timestamp(message.timestamp) << "] ";

    // 로그 레벨
    oss << "[" << std::setw(5) << std::left << to_string(message.level) << "] ";

    // 컴포넌트
    if (!message.component.empty()) {
        oss << "[" << message.component << "] ";
    }

    // 스레드 ID (선택적)
    if (include_thread_id_) {
        oss << "[thread=" << message.thread_id << "] ";
    }

    oss << message.message;

    // 구조화된 필드
    if (!message.fields.empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : message.fields) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << "}";
    }

    return oss.str();
}

// ============================================================================
// JsonFormatter 구현
// ============================================================================

JsonFormatter::JsonFormatter(bool pretty_print)
    : pretty_print_(pretty_print) {
}

std::string JsonFormatter::format(const LogMessage& message) {
    nlohmann::json record;
    record["timestamp"] = format_timestamp(message.timestamp);
    record["level"] = to_string(message.level);

    if (!message.component.empty()) {
        record["component"] = message.component;
    }

    std::ostringstream thread_id;
    thread_id << message.thread_id;
    record["thread_id"] = thread_id.str();
    record["message"] = message.message;

    if (!message.fields.empty()) {
        record["fields"] = message.fields;
    }

    // 잘못된 UTF-8이 섞여도 로그 한 줄 때문에 예외가 나지 않도록 치환
    return record.dump(pretty_print_ ? 2 : -1, ' ', false,
                       nlohmann::json::error_handler_t::replace);
}

// ============================================================================
// ConsoleSink 구현
// ============================================================================

void ConsoleSink::write(const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::clog << formatted_message << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::clog.flush();
}

// ============================================================================
// FileSink 구현
// ============================================================================

FileSink::FileSink(const std::filesystem::path& filename, bool append)
    : filename_(filename) {

    // 디렉토리 생성
    auto parent_path = filename_.parent_path();
    if (!parent_path.empty()) {
        std::filesystem::create_directories(parent_path);
    }

    auto mode = append ? std::ios::out | std::ios::app : std::ios::out;
    file_.open(filename_, mode);

    if (!file_.is_open()) {
        throw std::runtime_error("Failed to open log file: " + filename_.string());
    }

    // 현재 파일 크기 확인
    std::error_code ec;
    auto size = std::filesystem::file_size(filename_, ec);
    current_size_ = ec ? 0 : static_cast<size_t>(size);
}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.close();
    }
}

void FileSink::write(const std::string& formatted_message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!file_.is_open()) return;

    file_ << formatted_message << "\n";
    current_size_ += formatted_message.length() + 1;

    if (rotation_enabled_) {
        rotate_if_needed();
    }
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::enable_rotation(size_t max_size_mb, size_t max_files) {
    std::lock_guard<std::mutex> lock(mutex_);
    rotation_enabled_ = max_size_mb > 0 && max_files > 0;
    max_size_bytes_ = max_size_mb * 1024 * 1024;
    max_files_ = max_files;
}

void FileSink::rotate_if_needed() {
    if (current_size_ >= max_size_bytes_) {
        perform_rotation();
    }
}

void FileSink::perform_rotation() {
    file_.close();

    // filename.N (가장 오래됨) 삭제 후 나머지를 한 칸씩 밀어냄
    std::error_code ec;
    auto numbered = [this](size_t i) {
        return std::filesystem::path(filename_.string() + "." + std::to_string(i));
    };

    std::filesystem::remove(numbered(max_files_), ec);
    for (size_t i = max_files_; i > 1; --i) {
        if (std::filesystem::exists(numbered(i - 1), ec)) {
            std::filesystem::rename(numbered(i - 1), numbered(i), ec);
        }
    }

    std::filesystem::rename(filename_, numbered(1), ec);

    file_.open(filename_, std::ios::out | std::ios::trunc);
    current_size_ = 0;
}

// ============================================================================
// Logger 구현
// ============================================================================

Logger::Logger(std::string component)
    : component_(std::move(component))
    , pipeline_(std::make_shared<Pipeline>()) {
    pipeline_->formatter = std::make_shared<TextFormatter>();
}

Logger::Logger(std::string component, std::shared_ptr<Pipeline> pipeline)
    : component_(std::move(component))
    , pipeline_(std::move(pipeline)) {
}

void Logger::trace(const std::string& message) {
    log(LogLevel::TRACE, message);
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!is_enabled(level)) {
        return;
    }

    do_log(level, message);
}

Logger& Logger::with_field(const std::string& key, const std::string& value) {
    fields_[key] = value;
    return *this;
}

Logger& Logger::clear_fields() {
    fields_.clear();
    return *this;
}

Logger Logger::child(const std::string& component) const {
    Logger sub(component, pipeline_);
    sub.fields_ = fields_;
    return sub;
}

void Logger::set_level(LogLevel level) {
    pipeline_->min_level = level;
}

LogLevel Logger::get_level() const {
    return pipeline_->min_level.load();
}

bool Logger::is_enabled(LogLevel level) const {
    if (!pipeline_ || level == LogLevel::OFF) {
        return false;
    }
    return level >= pipeline_->min_level.load();
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;

    std::lock_guard<std::mutex> lock(pipeline_->mutex);
    pipeline_->sinks.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(pipeline_->mutex);
    pipeline_->sinks.clear();
}

void Logger::set_formatter(std::shared_ptr<ILogFormatter> formatter) {
    if (!formatter) return;

    std::lock_guard<std::mutex> lock(pipeline_->mutex);
    pipeline_->formatter = std::move(formatter);
}

void Logger::flush() {
    if (!pipeline_) return;

    std::lock_guard<std::mutex> lock(pipeline_->mutex);
    for (auto& sink : pipeline_->sinks) {
        sink->flush();
    }
}

const std::string& Logger::component() const {
    return component_;
}

void Logger::do_log(LogLevel level, const std::string& message) {
    LogMessage log_msg(level, component_, message);
    log_msg.fields = fields_;

    std::lock_guard<std::mutex> lock(pipeline_->mutex);

    std::string formatted_message = pipeline_->formatter
        ? pipeline_->formatter->format(log_msg)
        : message;

    for (auto& sink : pipeline_->sinks) {
        sink->write(formatted_message);
    }
}

} // namespace updraft
