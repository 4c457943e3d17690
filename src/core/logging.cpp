#include "streamgate/core/logging.hpp"
#include "streamgate/core/json.hpp"

#include <cstdio>
#include <ctime>

namespace streamgate {

// ============================================================================
// Log Level Utilities
// ============================================================================

std::string_view log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
        default: return "UNKNOWN";
    }
}

LogLevel parse_log_level(std::string_view name) noexcept {
    if (iequals(name, "trace")) return LogLevel::Trace;
    if (iequals(name, "debug")) return LogLevel::Debug;
    if (iequals(name, "info")) return LogLevel::Info;
    if (iequals(name, "warn") || iequals(name, "warning")) return LogLevel::Warn;
    if (iequals(name, "error")) return LogLevel::Error;
    if (iequals(name, "fatal")) return LogLevel::Fatal;
    if (iequals(name, "off")) return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Sinks
// ============================================================================

namespace {

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35m";
        default: return "\033[0m";
    }
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_val{};
    localtime_r(&time_t_val, &tm_val);

    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_val);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms.count()));
    return buf;
}

} // anonymous namespace

void ConsoleSink::write(const LogEntry& entry) {
    std::string line = format_timestamp(entry.timestamp);
    line += ' ';
    if (colored_) line += level_color(entry.level);
    line += '[';
    line += log_level_name(entry.level);
    line += ']';
    if (colored_) line += "\033[0m";

    if (!entry.logger_name.empty()) {
        line += " [" + entry.logger_name + "]";
    }

    line += ' ';
    line += entry.message;

    for (const auto& [key, value] : entry.fields) {
        line += ' ' + key + '=' + value;
    }
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << line;
}

void JsonSink::write(const LogEntry& entry) {
    JsonValue obj = JsonValue::object();
    obj["timestamp"] = format_timestamp(entry.timestamp);
    obj["level"] = log_level_name(entry.level);
    if (!entry.logger_name.empty()) {
        obj["logger"] = entry.logger_name;
    }
    obj["message"] = entry.message;
    for (const auto& [key, value] : entry.fields) {
        obj[key] = value;
    }

    std::string line = obj.dump();
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << std::flush;
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
    return *this;
}

Logger& Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
    return *this;
}

void Logger::log(LogLevel level, std::string message) const {
    if (level < level_) return;
    log(entry(level, std::move(message)));
}

LogEntry Logger::entry(LogLevel level, std::string message) const {
    LogEntry e;
    e.level = level;
    e.timestamp = std::chrono::system_clock::now();
    e.message = std::move(message);
    e.logger_name = name_;
    return e;
}

void Logger::log(const LogEntry& entry) const {
    if (entry.level < level_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->write(entry);
    }
}

// ============================================================================
// Global Logger
// ============================================================================

Logger& default_logger() {
    static Logger logger("streamgate");
    static const bool initialized = [] {
        logger.add_sink(std::make_shared<ConsoleSink>());
        return true;
    }();
    (void)initialized;
    return logger;
}

void configure_default_logger(LogLevel level, std::string_view format) {
    auto& logger = default_logger();
    logger.set_level(level);
    logger.clear_sinks();
    if (iequals(format, "json")) {
        logger.add_sink(std::make_shared<JsonSink>());
    } else {
        logger.add_sink(std::make_shared<ConsoleSink>());
    }
}

// ============================================================================
// Request Logging Middleware
// ============================================================================

Middleware request_logger(RequestLogOptions options) {
    return request_logger(default_logger(), options);
}

Middleware request_logger(Logger& logger, RequestLogOptions options) {
    return [&logger, options](Request& req, Next next) -> Task<Response> {
        auto start = std::chrono::steady_clock::now();

        Response resp = co_await next(req);

        if (!logger.is_enabled(options.level)) {
            co_return resp;
        }

        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

        std::string message(method_to_string(req.method()));
        message += ' ';
        message += req.path();
        if (!req.query_string().empty()) {
            message += '?';
            message += req.query_string();
        }

        auto entry = logger.entry(options.level, std::move(message));
        entry.field("status", resp.status());
        entry.field("duration_ms", duration_ms);

        if (options.log_headers) {
            for (const auto& [key, value] : req.headers()) {
                entry.field("req_" + key, value);
            }
        }

        logger.log(entry);
        co_return resp;
    };
}

} // namespace streamgate
