// StreamProv - Dedicated stream provisioning service
// Structured Logging Component
//
// Provides leveled logging in plain-text or JSON line format, with
// stream/user/port context on errors and a dedicated entry point for
// stream lifecycle events.

#ifndef STREAMPROV_CORE_STRUCTURED_LOGGER_HPP
#define STREAMPROV_CORE_STRUCTURED_LOGGER_HPP

#include "streamprov/core/log_sink.hpp"
#include "streamprov/core/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace streamprov {
namespace core {

/**
 * @brief Convert log level to its lowercase name.
 */
std::string logLevelToString(LogLevel level);

/**
 * @brief Parse a log level name (case-insensitive, "warn" accepted).
 * @return Parsed level, Info for unknown names
 */
LogLevel stringToLogLevel(const std::string& str);

/**
 * @brief Stream lifecycle events recorded by the coordinator.
 */
enum class LifecycleEventType {
    Provisioned,          ///< Stream row created with an allocated port
    Activated,            ///< External server accepted the stream
    ConfigurationFailed,  ///< External server rejected or did not answer
    Suspended,            ///< active -> suspended
    Resumed,              ///< suspended -> active
    Terminated,           ///< any -> terminated
    Updated,              ///< Mutable fields changed
    PortReleased          ///< Port returned to the pool
};

/**
 * @brief Convert lifecycle event type to its snake_case name.
 */
std::string lifecycleEventTypeToString(LifecycleEventType eventType);

/**
 * @brief Context attached to error logs.
 */
struct LogContext {
    StreamId streamId = INVALID_STREAM_ID;
    std::string userId;
    PortNumber port = INVALID_PORT;
    int32_t errorCode = 0;

    LogContext() = default;
};

/**
 * @brief Structured logger with JSON format support.
 *
 * Thread-safe. Messages below the configured level are dropped before
 * formatting. Every accepted message is delivered to all registered sinks.
 *
 * @code
 * auto logger = std::make_shared<StructuredLogger>();
 * logger->addSink(std::make_shared<ConsoleSink>());
 * logger->setJsonFormat(true);
 *
 * logger->info("Port pool initialized", "PortPool");
 *
 * LogContext ctx;
 * ctx.streamId = 42;
 * ctx.port = 8100;
 * ctx.errorCode = static_cast<int32_t>(ErrorCode::Unreachable);
 * logger->errorWithContext("Mount point creation failed", ctx, "Coordinator");
 * @endcode
 */
class StructuredLogger {
public:
    StructuredLogger();

    /**
     * @brief Flushes all sinks.
     */
    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&) = delete;
    StructuredLogger& operator=(StructuredLogger&&) = delete;

    void setLevel(LogLevel level);
    LogLevel getLevel() const;

    /**
     * @brief Enable or disable JSON line format.
     */
    void setJsonFormat(bool enabled);
    bool isJsonFormat() const;

    void debug(const std::string& message, const std::string& category = "StreamProv");
    void info(const std::string& message, const std::string& category = "StreamProv");
    void warning(const std::string& message, const std::string& category = "StreamProv");
    void error(const std::string& message, const std::string& category = "StreamProv");

    /**
     * @brief Log a stream lifecycle event at Info level.
     *
     * @param eventType What happened
     * @param streamId Stream affected
     * @param userId Owning user
     * @param port Allocated port (INVALID_PORT if none)
     * @param detail Optional free-form detail (reason, status)
     */
    void logLifecycleEvent(
        LifecycleEventType eventType,
        StreamId streamId,
        const std::string& userId,
        PortNumber port,
        const std::string& detail = ""
    );

    /**
     * @brief Log an error with stream, user, port and error code context.
     */
    void errorWithContext(
        const std::string& message,
        const LogContext& context,
        const std::string& category = "StreamProv"
    );

    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(const std::shared_ptr<ILogSink>& sink);
    void flush();

private:
    bool accepts(LogLevel level) const;

    void log(LogLevel level, const std::string& message, const std::string& category);

    void dispatch(LogLevel level, const std::string& formatted, const std::string& category);

    std::string formatJson(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext* context
    ) const;

    std::string formatPlainText(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext* context
    ) const;

    static std::string escapeJson(const std::string& str);

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::atomic<bool> jsonFormat_{false};
    mutable std::mutex sinksMutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
};

} // namespace core
} // namespace streamprov

// =============================================================================
// Convenience Macros
// =============================================================================
//
// Components hold a possibly-null std::shared_ptr<StructuredLogger>; these
// macros make the null check implicit.
//
//   STREAMPROV_LOG_INFO(logger_, "PortPool", "Allocated port " + std::to_string(port));

#define STREAMPROV_LOG(logger, method, category, message) \
    do { \
        if ((logger) != nullptr) { \
            (logger)->method((message), (category)); \
        } \
    } while (0)

#define STREAMPROV_LOG_DEBUG(logger, category, message) \
    STREAMPROV_LOG(logger, debug, category, message)

#define STREAMPROV_LOG_INFO(logger, category, message) \
    STREAMPROV_LOG(logger, info, category, message)

#define STREAMPROV_LOG_WARNING(logger, category, message) \
    STREAMPROV_LOG(logger, warning, category, message)

#define STREAMPROV_LOG_ERROR(logger, category, message) \
    STREAMPROV_LOG(logger, error, category, message)

#endif // STREAMPROV_CORE_STRUCTURED_LOGGER_HPP
