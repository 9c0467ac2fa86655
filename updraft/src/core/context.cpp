#include "updraft/core/context.h"
#include "updraft/config/supervisor_config.h"

namespace updraft {

// ============================================================================
// SupervisorContext 구현
// ============================================================================

SupervisorContext::SupervisorContext(Logger logger, std::shared_ptr<CancellationToken> cancellation)
    : logger_(std::move(logger))
    , cancellation_(std::move(cancellation)) {
    if (!cancellation_) {
        cancellation_ = std::make_shared<CancellationToken>();
    }
}

Logger SupervisorContext::logger_for(const std::string& component) const {
    return logger_.child(logger_.component() + "." + component);
}

// ============================================================================
// 로거 구성
// ============================================================================

Logger make_logger(const LoggingSettings& settings, const std::string& component) {
    Logger logger(component);
    logger.set_level(log_level_from_string(settings.level));

    if (settings.format == LogFormat::JSON) {
        logger.set_formatter(std::make_shared<JsonFormatter>());
    } else {
        logger.set_formatter(std::make_shared<TextFormatter>());
    }

    logger.add_sink(std::make_shared<ConsoleSink>());

    if (!settings.file.empty()) {
        auto file_sink = std::make_shared<FileSink>(settings.file);
        file_sink->enable_rotation(settings.max_file_size_mb, settings.max_files);
        logger.add_sink(std::move(file_sink));
    }

    return logger;
}

} // namespace updraft
