// StreamProv - Dedicated stream provisioning service
// Monitoring Aggregator - Stream sampling and statistics
//
// Responsibilities:
// - Periodically sample every active stream from the streaming server
// - Append monitoring samples and maintain stream liveness
// - Open and close source sessions on liveness transitions
// - Summaries over a day range, health checks
//
// Runs independently of the coordinator. It never changes a stream's
// lifecycle status.

#ifndef STREAMPROV_MONITORING_MONITORING_AGGREGATOR_HPP
#define STREAMPROV_MONITORING_MONITORING_AGGREGATOR_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "streamprov/core/result.hpp"
#include "streamprov/core/structured_logger.hpp"
#include "streamprov/core/types.hpp"
#include "streamprov/shoutcast/streaming_server_client.hpp"
#include "streamprov/storage/records.hpp"
#include "streamprov/storage/server_registry.hpp"
#include "streamprov/storage/stream_store.hpp"
#include "streamprov/storage/telemetry_store.hpp"

namespace streamprov {
namespace monitoring {

struct MonitoringError {
    enum class Code {
        None,
        NotFound,           ///< Stream does not exist
        StorageFailed,
        ServerUnavailable   ///< Streaming server could not be queried
    };

    Code code = Code::None;
    std::string message;

    MonitoringError() = default;
    MonitoringError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
};

struct MonitoringSettings {
    std::chrono::milliseconds sampleInterval{5000};
    uint32_t recentSampleLimit = 100;
    uint32_t defaultStatsDays = 30;
};

/**
 * @brief What one sampling pass did.
 */
struct SamplingReport {
    uint32_t streamsSampled = 0;
    uint32_t samplesWritten = 0;
    uint32_t errors = 0;
    uint32_t sessionsOpened = 0;
    uint32_t sessionsClosed = 0;
};

struct StreamStatistics {
    storage::StreamRecord stream;
    uint32_t days = 0;
    uint32_t totalSessions = 0;
    double totalDurationHours = 0.0;
    double averageDurationMinutes = 0.0;
    double totalDataGb = 0.0;
    uint32_t peakListeners = 0;
    std::vector<storage::MonitoringSample> recentSamples;   ///< Newest first
};

struct StreamHealth {
    StreamId streamId = core::INVALID_STREAM_ID;
    bool accessible = false;
    std::chrono::milliseconds responseTime{0};
    std::vector<std::string> issues;
    std::optional<shoutcast::LiveStreamStatus> live;

    bool healthy() const { return accessible && issues.empty(); }
};

struct ServerHealth {
    bool reachable = false;
    std::string status = "unknown";
    std::chrono::milliseconds responseTime{0};
    std::optional<shoutcast::ServerStatus> serverStatus;
    std::string error;
};

/// Disconnect reasons recorded on closed sessions.
constexpr const char* DISCONNECT_SOURCE = "source_disconnected";
constexpr const char* DISCONNECT_SUSPENDED = "stream_suspended";
constexpr const char* DISCONNECT_TERMINATED = "stream_terminated";

/**
 * @brief Samples streams and serves statistics.
 *
 * sampleOnce() may be driven directly (tests, one-shot tools) or by the
 * background thread started with start().
 */
class MonitoringAggregator {
public:
    MonitoringAggregator(
        MonitoringSettings settings,
        std::shared_ptr<storage::IStreamStore> streamStore,
        std::shared_ptr<storage::TelemetryStore> telemetry,
        std::shared_ptr<shoutcast::IStreamingServerClient> serverClient,
        std::shared_ptr<storage::ServerRegistry> registry = nullptr,
        core::ServerId serverId = core::INVALID_SERVER_ID,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );

    /**
     * @brief Stops the background thread.
     */
    ~MonitoringAggregator();

    MonitoringAggregator(const MonitoringAggregator&) = delete;
    MonitoringAggregator& operator=(const MonitoringAggregator&) = delete;

    /**
     * @brief Sample every active stream once.
     *
     * A failure for one stream is recorded as a connection error on its
     * sample and does not stop the pass.
     */
    core::Result<SamplingReport, MonitoringError> sampleOnce();

    void start();
    void stop();
    bool isRunning() const;

    /**
     * @brief Session summary over the last days (default from settings)
     *        plus the most recent samples.
     */
    core::Result<StreamStatistics, MonitoringError> getStatistics(
        StreamId streamId, std::optional<uint32_t> days = std::nullopt);

    core::Result<StreamHealth, MonitoringError> checkHealth(StreamId streamId);

    /**
     * @brief Query server status and stamp the registry entry.
     */
    core::Result<ServerHealth, MonitoringError> checkServerHealth();

    /**
     * @brief Close the open session of a stream that stopped serving.
     */
    void onStreamStopped(const storage::StreamRecord& stream, core::LifecycleEventType event);

private:
    void samplingLoop();

    /**
     * @return false when the server could not be queried for this stream
     */
    bool sampleStream(const storage::StreamRecord& stream, SamplingReport& report);

    MonitoringSettings settings_;
    std::shared_ptr<storage::IStreamStore> streamStore_;
    std::shared_ptr<storage::TelemetryStore> telemetry_;
    std::shared_ptr<shoutcast::IStreamingServerClient> serverClient_;
    std::shared_ptr<storage::ServerRegistry> registry_;
    core::ServerId serverId_;
    std::shared_ptr<core::StructuredLogger> logger_;

    // Serializes sampling passes with lifecycle session closes.
    std::mutex sampleMutex_;

    std::mutex threadMutex_;
    std::condition_variable stopCondition_;
    std::atomic<bool> running_{false};
    std::thread samplingThread_;
};

} // namespace monitoring
} // namespace streamprov

#endif // STREAMPROV_MONITORING_MONITORING_AGGREGATOR_HPP
