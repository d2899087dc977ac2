// StreamProv - Dedicated stream provisioning service
// Common type definitions

#ifndef STREAMPROV_CORE_TYPES_HPP
#define STREAMPROV_CORE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace streamprov {
namespace core {

// Identifiers
using StreamId = int64_t;     ///< Row id of a dedicated stream
using SessionId = int64_t;    ///< Row id of a source session
using SampleId = int64_t;     ///< Row id of a monitoring sample
using ServerId = int64_t;     ///< Row id of a streaming server
using PortNumber = uint16_t;  ///< Network port handed out by the pool
using UserId = std::string;   ///< Opaque user reference from the auth layer
using StationId = std::string;///< Opaque station reference

constexpr StreamId INVALID_STREAM_ID = 0;
constexpr SessionId INVALID_SESSION_ID = 0;
constexpr ServerId INVALID_SERVER_ID = 0;
constexpr PortNumber INVALID_PORT = 0;

// Clocks
using SteadyClock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;
using TimePoint = SystemClock::time_point;
using Duration = std::chrono::milliseconds;

using WorkItem = std::function<void()>;

/**
 * @brief Milliseconds since the Unix epoch, the persisted timestamp form.
 */
inline int64_t toUnixMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

inline TimePoint fromUnixMillis(int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

/**
 * @brief Format a wall-clock time as ISO 8601 UTC with millisecond precision.
 *
 * Example: "2025-01-28T08:00:00.000Z"
 */
std::string formatIso8601(TimePoint tp);

/**
 * @brief Format an optional timestamp; empty string when unset.
 */
inline std::string formatIso8601(const std::optional<TimePoint>& tp) {
    return tp ? formatIso8601(*tp) : std::string();
}

} // namespace core

// Re-export commonly used types to the streamprov namespace
using core::StreamId;
using core::SessionId;
using core::ServerId;
using core::PortNumber;
using core::UserId;
using core::StationId;
using core::TimePoint;

} // namespace streamprov

#endif // STREAMPROV_CORE_TYPES_HPP
