// StreamProv - Dedicated stream provisioning service
// Persisted entity types
//
// Plain data mirroring the database tables. Timestamps are wall-clock
// TimePoints in memory and Unix milliseconds on disk.

#ifndef STREAMPROV_STORAGE_RECORDS_HPP
#define STREAMPROV_STORAGE_RECORDS_HPP

#include <cstdint>
#include <optional>
#include <string>

#include "streamprov/core/types.hpp"

namespace streamprov {
namespace storage {

// =============================================================================
// Port pool
// =============================================================================

struct PortRecord {
    PortNumber port = core::INVALID_PORT;
    bool allocated = false;
    std::optional<TimePoint> allocatedAt;
    std::optional<UserId> allocatedTo;
    std::optional<StreamId> streamId;
};

struct PoolStatus {
    uint32_t total = 0;
    uint32_t allocated = 0;
    uint32_t available = 0;
    PortNumber rangeStart = core::INVALID_PORT;
    PortNumber rangeEnd = core::INVALID_PORT;
    double allocationRate = 0.0;   ///< Percent of the pool in use
};

// =============================================================================
// Streams
// =============================================================================

/**
 * @brief Lifecycle status of a dedicated stream.
 *
 * provisioning -> active | error; active <-> suspended;
 * any non-terminated -> terminated.
 */
enum class StreamStatus {
    Provisioning,   ///< Row created, external server not yet configured
    Active,         ///< External server configured
    Suspended,      ///< Administratively paused, port and credentials kept
    Error,          ///< External configuration attempted and failed
    Terminated      ///< Terminal, port released
};

const char* streamStatusToString(StreamStatus status);
std::optional<StreamStatus> parseStreamStatus(const std::string& text);

struct StreamRecord {
    StreamId id = core::INVALID_STREAM_ID;
    UserId userId;
    std::optional<StationId> stationId;
    PortNumber port = core::INVALID_PORT;
    core::ServerId serverId = core::INVALID_SERVER_ID;

    std::string sourcePassword;
    std::string adminPassword;

    std::string title;
    std::string description;
    std::string genre;

    uint32_t bitrate = 128;
    uint32_t maxListeners = 100;
    uint32_t sampleRate = 44100;
    bool publicServer = true;

    StreamStatus status = StreamStatus::Provisioning;
    bool isLive = false;
    uint32_t currentListeners = 0;
    uint32_t peakListeners = 0;

    TimePoint createdAt;
    std::optional<TimePoint> activatedAt;
    std::optional<TimePoint> lastConnectionAt;
    std::optional<TimePoint> suspendedAt;
    std::optional<TimePoint> terminatedAt;
    std::string suspensionReason;

    uint32_t configVersion = 1;
    bool pendingExternalSync = false;   ///< Local change not yet applied externally
    std::string lastError;

    bool isTerminated() const { return status == StreamStatus::Terminated; }
};

// =============================================================================
// Telemetry
// =============================================================================

struct SessionRecord {
    SessionId id = core::INVALID_SESSION_ID;
    StreamId streamId = core::INVALID_STREAM_ID;
    TimePoint startedAt;
    std::optional<TimePoint> endedAt;
    uint64_t durationSeconds = 0;
    uint32_t peakListeners = 0;
    uint64_t bytesTransferred = 0;
    std::string encoder;
    std::string disconnectReason;

    bool isOpen() const { return !endedAt.has_value(); }
};

struct MonitoringSample {
    core::SampleId id = 0;
    StreamId streamId = core::INVALID_STREAM_ID;
    TimePoint timestamp;
    uint32_t listeners = 0;
    bool isLive = false;
    uint32_t bitrate = 0;
    double bandwidthKbps = 0.0;
    double cpuUsage = 0.0;
    double memoryUsageMb = 0.0;
    uint32_t connectionErrors = 0;
    std::string currentSong;
    uint64_t uptimeSeconds = 0;
};

/**
 * @brief Aggregate over the sessions started inside a time window.
 */
struct SessionSummary {
    uint32_t totalSessions = 0;
    uint64_t totalDurationSeconds = 0;
    uint64_t totalBytes = 0;
    uint32_t peakListeners = 0;

    double totalHours() const { return static_cast<double>(totalDurationSeconds) / 3600.0; }
    double averageMinutes() const {
        return totalSessions == 0 ? 0.0
            : static_cast<double>(totalDurationSeconds) / 60.0 / totalSessions;
    }
    double totalGigabytes() const {
        return static_cast<double>(totalBytes) / (1024.0 * 1024.0 * 1024.0);
    }
};

// =============================================================================
// Streaming servers
// =============================================================================

struct ServerRecord {
    core::ServerId id = core::INVALID_SERVER_ID;
    std::string name;
    std::string hostname;
    uint16_t adminPort = 8000;
    std::string adminPassword;
    std::string publicHost;
    uint32_t maxStreams = 100;
    uint32_t currentStreams = 0;
    bool isActive = true;
    bool isPrimary = false;
    std::optional<TimePoint> lastHealthCheck;
    std::string healthStatus = "unknown";
};

} // namespace storage
} // namespace streamprov

#endif // STREAMPROV_STORAGE_RECORDS_HPP
