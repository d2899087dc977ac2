// StreamProv - Dedicated stream provisioning service
// Structured Logging Component Implementation

#include "streamprov/core/structured_logger.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace streamprov {
namespace core {

// =============================================================================
// Helper Functions
// =============================================================================

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warning:
            return "warning";
        case LogLevel::Error:
            return "error";
        default:
            return "info";
    }
}

LogLevel stringToLogLevel(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return LogLevel::Debug;
    } else if (lower == "info") {
        return LogLevel::Info;
    } else if (lower == "warning" || lower == "warn") {
        return LogLevel::Warning;
    } else if (lower == "error") {
        return LogLevel::Error;
    }
    return LogLevel::Info;
}

std::string lifecycleEventTypeToString(LifecycleEventType eventType) {
    switch (eventType) {
        case LifecycleEventType::Provisioned:
            return "provisioned";
        case LifecycleEventType::Activated:
            return "activated";
        case LifecycleEventType::ConfigurationFailed:
            return "configuration_failed";
        case LifecycleEventType::Suspended:
            return "suspended";
        case LifecycleEventType::Resumed:
            return "resumed";
        case LifecycleEventType::Terminated:
            return "terminated";
        case LifecycleEventType::Updated:
            return "updated";
        case LifecycleEventType::PortReleased:
            return "port_released";
        default:
            return "unknown";
    }
}

// =============================================================================
// StructuredLogger Implementation
// =============================================================================

StructuredLogger::StructuredLogger() = default;

StructuredLogger::~StructuredLogger() {
    flush();
}

void StructuredLogger::setLevel(LogLevel level) {
    level_.store(level);
}

LogLevel StructuredLogger::getLevel() const {
    return level_.load();
}

void StructuredLogger::setJsonFormat(bool enabled) {
    jsonFormat_.store(enabled);
}

bool StructuredLogger::isJsonFormat() const {
    return jsonFormat_.load();
}

void StructuredLogger::debug(const std::string& message, const std::string& category) {
    log(LogLevel::Debug, message, category);
}

void StructuredLogger::info(const std::string& message, const std::string& category) {
    log(LogLevel::Info, message, category);
}

void StructuredLogger::warning(const std::string& message, const std::string& category) {
    log(LogLevel::Warning, message, category);
}

void StructuredLogger::error(const std::string& message, const std::string& category) {
    log(LogLevel::Error, message, category);
}

void StructuredLogger::logLifecycleEvent(
    LifecycleEventType eventType,
    StreamId streamId,
    const std::string& userId,
    PortNumber port,
    const std::string& detail)
{
    if (!accepts(LogLevel::Info)) {
        return;
    }

    const std::string category = "Lifecycle";
    std::ostringstream oss;

    if (jsonFormat_.load()) {
        oss << "{";
        oss << "\"timestamp\":\"" << formatIso8601(SystemClock::now()) << "\"";
        oss << ",\"level\":\"info\"";
        oss << ",\"category\":\"" << category << "\"";
        oss << ",\"event\":\"" << lifecycleEventTypeToString(eventType) << "\"";
        oss << ",\"stream_id\":" << streamId;
        oss << ",\"user_id\":\"" << escapeJson(userId) << "\"";
        if (port != INVALID_PORT) {
            oss << ",\"port\":" << port;
        }
        if (!detail.empty()) {
            oss << ",\"detail\":\"" << escapeJson(detail) << "\"";
        }
        oss << "}";
    } else {
        oss << "[" << formatIso8601(SystemClock::now()) << "] ";
        oss << "[info] ";
        oss << "[" << category << "] ";
        oss << "Event: " << lifecycleEventTypeToString(eventType);
        oss << ", Stream: " << streamId;
        oss << ", User: " << userId;
        if (port != INVALID_PORT) {
            oss << ", Port: " << port;
        }
        if (!detail.empty()) {
            oss << ", Detail: " << detail;
        }
    }

    dispatch(LogLevel::Info, oss.str(), category);
}

void StructuredLogger::errorWithContext(
    const std::string& message,
    const LogContext& context,
    const std::string& category)
{
    if (!accepts(LogLevel::Error)) {
        return;
    }

    std::string formatted = jsonFormat_.load()
        ? formatJson(LogLevel::Error, message, category, &context)
        : formatPlainText(LogLevel::Error, message, category, &context);
    dispatch(LogLevel::Error, formatted, category);
}

void StructuredLogger::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void StructuredLogger::removeSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void StructuredLogger::flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

bool StructuredLogger::accepts(LogLevel level) const {
    return static_cast<uint32_t>(level) >= static_cast<uint32_t>(level_.load());
}

void StructuredLogger::log(LogLevel level, const std::string& message, const std::string& category) {
    if (!accepts(level)) {
        return;
    }

    std::string formatted = jsonFormat_.load()
        ? formatJson(level, message, category, nullptr)
        : formatPlainText(level, message, category, nullptr);
    dispatch(level, formatted, category);
}

void StructuredLogger::dispatch(LogLevel level, const std::string& formatted, const std::string& category) {
    SourceLocation location;
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->write(level, formatted, category, location);
    }
}

std::string StructuredLogger::formatJson(
    LogLevel level,
    const std::string& message,
    const std::string& category,
    const LogContext* context) const
{
    std::ostringstream oss;
    oss << "{";
    oss << "\"timestamp\":\"" << formatIso8601(SystemClock::now()) << "\"";
    oss << ",\"level\":\"" << logLevelToString(level) << "\"";
    oss << ",\"category\":\"" << escapeJson(category) << "\"";
    oss << ",\"message\":\"" << escapeJson(message) << "\"";

    if (context) {
        if (context->streamId != INVALID_STREAM_ID) {
            oss << ",\"stream_id\":" << context->streamId;
        }
        if (!context->userId.empty()) {
            oss << ",\"user_id\":\"" << escapeJson(context->userId) << "\"";
        }
        if (context->port != INVALID_PORT) {
            oss << ",\"port\":" << context->port;
        }
        if (context->errorCode != 0) {
            oss << ",\"error_code\":" << context->errorCode;
        }
    }

    oss << "}";
    return oss.str();
}

std::string StructuredLogger::formatPlainText(
    LogLevel level,
    const std::string& message,
    const std::string& category,
    const LogContext* context) const
{
    std::ostringstream oss;
    oss << "[" << formatIso8601(SystemClock::now()) << "] ";
    oss << "[" << logLevelToString(level) << "] ";
    oss << "[" << category << "] ";
    oss << message;

    if (context) {
        if (context->streamId != INVALID_STREAM_ID) {
            oss << " stream=" << context->streamId;
        }
        if (!context->userId.empty()) {
            oss << " user=" << context->userId;
        }
        if (context->port != INVALID_PORT) {
            oss << " port=" << context->port;
        }
        if (context->errorCode != 0) {
            oss << " error_code=" << context->errorCode;
        }
    }
    return oss.str();
}

std::string StructuredLogger::escapeJson(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':
                oss << "\\\"";
                break;
            case '\\':
                oss << "\\\\";
                break;
            case '\n':
                oss << "\\n";
                break;
            case '\r':
                oss << "\\r";
                break;
            case '\t':
                oss << "\\t";
                break;
            case '\b':
                oss << "\\b";
                break;
            case '\f':
                oss << "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    return oss.str();
}

} // namespace core
} // namespace streamprov
