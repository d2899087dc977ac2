// StreamProv - Dedicated stream provisioning service
// Log sink interface
//
// Sinks receive fully formatted log lines from the StructuredLogger and
// deliver them to a destination (console, rotating file, test capture).

#ifndef STREAMPROV_CORE_LOG_SINK_HPP
#define STREAMPROV_CORE_LOG_SINK_HPP

#include <cstdint>
#include <memory>
#include <string>

namespace streamprov {
namespace core {

/**
 * @brief Severity of a delivered log line.
 */
enum class LogLevel : uint32_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

/**
 * @brief Source location attached to a log line.
 */
struct SourceLocation {
    const char* file = nullptr;
    int line = 0;
    const char* function = nullptr;
};

/**
 * @brief Interface for log output sinks.
 *
 * Implementations must tolerate concurrent write() calls.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /**
     * @brief Write one formatted log line.
     *
     * @param level Severity of the line
     * @param message Formatted line (no trailing newline)
     * @param category Component category (e.g. "PortPool")
     * @param location Source location, may be empty
     */
    virtual void write(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const SourceLocation& location
    ) = 0;

    /**
     * @brief Flush buffered output.
     */
    virtual void flush() = 0;

    /**
     * @brief Sink name for diagnostics.
     */
    virtual std::string getName() const = 0;
};

} // namespace core
} // namespace streamprov

#endif // STREAMPROV_CORE_LOG_SINK_HPP
