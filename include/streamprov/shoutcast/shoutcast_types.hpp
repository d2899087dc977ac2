// StreamProv - Dedicated stream provisioning service
// Streaming-server data types
//
// Structured forms of what the external streaming server reports and of
// what it is asked to configure. The stream reference ("sid") is the
// stream's allocated port number.

#ifndef STREAMPROV_SHOUTCAST_SHOUTCAST_TYPES_HPP
#define STREAMPROV_SHOUTCAST_SHOUTCAST_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "streamprov/core/error_codes.hpp"
#include "streamprov/core/types.hpp"

namespace streamprov {
namespace shoutcast {

using StreamRef = core::PortNumber;

// =============================================================================
// Errors
// =============================================================================

struct StreamingServerError {
    enum class Code {
        None,
        Unreachable,        ///< Connection failed
        Timeout,            ///< No answer within the request timeout
        HttpStatus,         ///< Non-2xx response
        ParseError,         ///< Response body not understood
        NotFound,           ///< Server does not report the stream
        ConfigWriteFailed,  ///< Managed configuration file could not be written
        CircuitOpen         ///< Failing fast after repeated failures
    };

    Code code = Code::None;
    std::string message;
    int httpStatus = 0;

    StreamingServerError() = default;
    StreamingServerError(Code c, std::string msg, int status = 0)
        : code(c), message(std::move(msg)), httpStatus(status) {}

    /**
     * @brief True for failures that mean "the server could not be reached".
     */
    bool isTransportFailure() const {
        return code == Code::Unreachable || code == Code::Timeout || code == Code::CircuitOpen;
    }
};

/**
 * @brief Project-wide numeric code for a streaming-server error.
 */
core::ErrorCode toErrorCode(StreamingServerError::Code code);

std::string streamingServerErrorCodeToString(StreamingServerError::Code code);

// =============================================================================
// Configuration sent to the server
// =============================================================================

/**
 * @brief Mount point configuration for one dedicated stream.
 */
struct StreamServerConfig {
    StreamRef sid = 0;
    std::string sourcePassword;
    std::string adminPassword;
    uint32_t maxListeners = 100;
    uint32_t bitrateKbps = 128;
    uint32_t sampleRate = 44100;
    std::string title;
    std::string genre;
    std::string url;
    bool publicServer = true;
};

// =============================================================================
// Status reported by the server
// =============================================================================

/**
 * @brief Per-stream summary from the server status document.
 */
struct StreamSummary {
    std::string id;
    uint32_t port = 0;
    uint32_t listeners = 0;
    uint32_t peakListeners = 0;
    uint32_t maxListeners = 0;
    std::string title;
    std::string genre;
    std::string url;
    bool sourceConnected = false;
    uint32_t bitrate = 0;
    uint32_t sampleRate = 0;
    uint64_t hits = 0;
};

struct ServerStatus {
    std::string version = "Unknown";
    uint64_t uptimeSeconds = 0;
    uint32_t totalStreams = 0;
    uint32_t activeStreams = 0;     ///< Streams with at least one hit
    uint32_t totalListeners = 0;
    uint32_t peakListeners = 0;
    uint32_t maxListeners = 0;
    std::vector<StreamSummary> streams;
};

/**
 * @brief Live status of one stream.
 */
struct LiveStreamStatus {
    std::string id;
    uint32_t port = 0;
    uint32_t listeners = 0;
    uint32_t peakListeners = 0;
    uint32_t maxListeners = 0;
    std::string title;
    std::string genre;
    std::string url;
    bool sourceConnected = false;
    uint32_t bitrate = 0;
    uint32_t sampleRate = 0;
    uint64_t uptimeSeconds = 0;
    uint64_t hits = 0;
    std::string currentSong;
};

struct ListenerInfo {
    std::string id;
    std::string host;
    std::string userAgent;
    uint64_t connectedSeconds = 0;
    std::string uid;
};

// =============================================================================
// Client state and statistics
// =============================================================================

enum class CircuitState {
    Closed,     ///< Normal operation, requests go through
    Open,       ///< Server is down, requests fail fast
    HalfOpen    ///< Testing if the server recovered
};

struct StreamingClientStats {
    uint64_t totalRequests = 0;
    uint64_t successCount = 0;
    uint64_t failureCount = 0;
    uint64_t timeoutCount = 0;
    uint64_t circuitOpenCount = 0;   ///< Times the circuit was opened
    uint64_t rejectedCount = 0;      ///< Requests refused while open
};

} // namespace shoutcast
} // namespace streamprov

#endif // STREAMPROV_SHOUTCAST_SHOUTCAST_TYPES_HPP
