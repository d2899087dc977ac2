// StreamProv - Dedicated stream provisioning service
// Monitoring Aggregator implementation

#include "streamprov/monitoring/monitoring_aggregator.hpp"

#include <exception>

namespace streamprov {
namespace monitoring {

using core::Result;
using storage::StorageError;
using storage::StreamRecord;
using storage::StreamStatus;

namespace {

const char* const CATEGORY = "Monitoring";

MonitoringError fromStorage(const StorageError& error) {
    if (error.code == StorageError::Code::NotFound) {
        return MonitoringError(MonitoringError::Code::NotFound, error.message);
    }
    return MonitoringError(MonitoringError::Code::StorageFailed, error.message);
}

// Bytes delivered to listeners over one sampling interval.
uint64_t estimateBytes(uint32_t listeners, uint32_t bitrateKbps, std::chrono::milliseconds interval) {
    const uint64_t bytesPerSecond = static_cast<uint64_t>(listeners) * bitrateKbps * 1000 / 8;
    return bytesPerSecond * static_cast<uint64_t>(interval.count()) / 1000;
}

} // anonymous namespace

MonitoringAggregator::MonitoringAggregator(
    MonitoringSettings settings,
    std::shared_ptr<storage::IStreamStore> streamStore,
    std::shared_ptr<storage::TelemetryStore> telemetry,
    std::shared_ptr<shoutcast::IStreamingServerClient> serverClient,
    std::shared_ptr<storage::ServerRegistry> registry,
    core::ServerId serverId,
    std::shared_ptr<core::StructuredLogger> logger)
    : settings_(settings)
    , streamStore_(std::move(streamStore))
    , telemetry_(std::move(telemetry))
    , serverClient_(std::move(serverClient))
    , registry_(std::move(registry))
    , serverId_(serverId)
    , logger_(std::move(logger))
{
}

MonitoringAggregator::~MonitoringAggregator() {
    stop();
}

// =============================================================================
// Sampling
// =============================================================================

Result<SamplingReport, MonitoringError> MonitoringAggregator::sampleOnce() {
    std::lock_guard<std::mutex> lock(sampleMutex_);

    auto streams = streamStore_->listByStatus({StreamStatus::Active});
    if (streams.isError()) {
        return Result<SamplingReport, MonitoringError>::error(fromStorage(streams.error()));
    }

    SamplingReport report;
    for (const auto& stream : streams.value()) {
        report.streamsSampled++;
        if (!sampleStream(stream, report)) {
            report.errors++;
        }
    }

    STREAMPROV_LOG_DEBUG(logger_, CATEGORY,
        "Sampled " + std::to_string(report.streamsSampled) + " streams, " +
        std::to_string(report.samplesWritten) + " samples, " +
        std::to_string(report.errors) + " errors");
    return Result<SamplingReport, MonitoringError>::success(report);
}

bool MonitoringAggregator::sampleStream(const StreamRecord& stream, SamplingReport& report) {
    const TimePoint now = core::SystemClock::now();

    storage::MonitoringSample sample;
    sample.streamId = stream.id;
    sample.timestamp = now;
    sample.bitrate = stream.bitrate;

    auto info = serverClient_->getStreamInfo(stream.port);
    if (info.isError()) {
        sample.connectionErrors = 1;
        auto appended = telemetry_->appendSample(sample);
        if (appended.isSuccess()) {
            report.samplesWritten++;
        } else {
            STREAMPROV_LOG_WARNING(logger_, CATEGORY,
                "Sample for stream " + std::to_string(stream.id) + " not stored: " +
                appended.error().message);
        }

        if (logger_) {
            core::LogContext ctx;
            ctx.streamId = stream.id;
            ctx.userId = stream.userId;
            ctx.port = stream.port;
            ctx.errorCode = static_cast<int32_t>(shoutcast::toErrorCode(info.error().code));
            logger_->errorWithContext("Stream sampling failed: " + info.error().message,
                                      ctx, CATEGORY);
        }
        return false;
    }

    const shoutcast::LiveStreamStatus& live = info.value();
    const bool isLive = live.sourceConnected;
    const uint32_t bitrate = live.bitrate != 0 ? live.bitrate : stream.bitrate;

    sample.listeners = live.listeners;
    sample.isLive = isLive;
    sample.bitrate = bitrate;
    sample.bandwidthKbps = static_cast<double>(live.listeners) * bitrate;
    sample.currentSong = live.currentSong;
    sample.uptimeSeconds = live.uptimeSeconds;

    auto appended = telemetry_->appendSample(sample);
    if (appended.isError()) {
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            "Sample for stream " + std::to_string(stream.id) + " not stored: " +
            appended.error().message);
        return false;
    }
    report.samplesWritten++;

    auto recorded = streamStore_->recordLiveness(
        stream.id, isLive, live.listeners,
        isLive ? std::optional<TimePoint>(now) : std::nullopt);
    if (recorded.isError()) {
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            "Liveness of stream " + std::to_string(stream.id) + " not stored: " +
            recorded.error().message);
        return false;
    }
    if (!recorded.value()) {
        // Left the active state since the listing; lifecycle owns its session.
        return true;
    }

    auto open = telemetry_->findOpenSession(stream.id);
    if (open.isError()) {
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            "Session lookup for stream " + std::to_string(stream.id) + " failed: " +
            open.error().message);
        return false;
    }

    if (isLive) {
        SessionId sessionId = core::INVALID_SESSION_ID;
        uint64_t bytes = 0;
        if (open.value().has_value()) {
            sessionId = open.value()->id;
            bytes = open.value()->bytesTransferred +
                    estimateBytes(live.listeners, bitrate, settings_.sampleInterval);
        } else {
            auto opened = telemetry_->openSession(stream.id, now);
            if (opened.isError()) {
                STREAMPROV_LOG_WARNING(logger_, CATEGORY,
                    "Session for stream " + std::to_string(stream.id) + " not opened: " +
                    opened.error().message);
                return false;
            }
            sessionId = opened.value();
            report.sessionsOpened++;
            STREAMPROV_LOG_INFO(logger_, CATEGORY,
                "Source connected on stream " + std::to_string(stream.id));
        }

        auto updated = telemetry_->updateSession(sessionId, live.listeners, bytes);
        if (updated.isError()) {
            STREAMPROV_LOG_WARNING(logger_, CATEGORY,
                "Session " + std::to_string(sessionId) + " not updated: " +
                updated.error().message);
            return false;
        }
    } else if (open.value().has_value()) {
        auto closed = telemetry_->closeSession(open.value()->id, now, DISCONNECT_SOURCE);
        if (closed.isError()) {
            STREAMPROV_LOG_WARNING(logger_, CATEGORY,
                "Session " + std::to_string(open.value()->id) + " not closed: " +
                closed.error().message);
            return false;
        }
        report.sessionsClosed++;
        STREAMPROV_LOG_INFO(logger_, CATEGORY,
            "Source disconnected from stream " + std::to_string(stream.id));
    }
    return true;
}

void MonitoringAggregator::onStreamStopped(const StreamRecord& stream, core::LifecycleEventType event) {
    std::lock_guard<std::mutex> lock(sampleMutex_);

    auto open = telemetry_->findOpenSession(stream.id);
    if (open.isError()) {
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            "Session lookup for stream " + std::to_string(stream.id) + " failed: " +
            open.error().message);
        return;
    }
    if (!open.value().has_value()) {
        return;
    }

    const char* reason = event == core::LifecycleEventType::Suspended
        ? DISCONNECT_SUSPENDED : DISCONNECT_TERMINATED;
    auto closed = telemetry_->closeSession(open.value()->id, core::SystemClock::now(), reason);
    if (closed.isError()) {
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            "Session " + std::to_string(open.value()->id) + " not closed: " +
            closed.error().message);
        return;
    }
    STREAMPROV_LOG_DEBUG(logger_, CATEGORY,
        "Closed session of stream " + std::to_string(stream.id) + " (" + reason + ")");
}

// =============================================================================
// Background thread
// =============================================================================

void MonitoringAggregator::start() {
    std::lock_guard<std::mutex> lock(threadMutex_);
    if (running_.exchange(true)) {
        return;
    }
    samplingThread_ = std::thread(&MonitoringAggregator::samplingLoop, this);
    STREAMPROV_LOG_INFO(logger_, CATEGORY,
        "Sampling every " + std::to_string(settings_.sampleInterval.count()) + "ms");
}

void MonitoringAggregator::stop() {
    {
        std::lock_guard<std::mutex> lock(threadMutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    stopCondition_.notify_all();
    if (samplingThread_.joinable()) {
        samplingThread_.join();
    }
    STREAMPROV_LOG_INFO(logger_, CATEGORY, "Sampling stopped");
}

bool MonitoringAggregator::isRunning() const {
    return running_.load();
}

void MonitoringAggregator::samplingLoop() {
    while (running_.load()) {
        try {
            auto report = sampleOnce();
            if (report.isError()) {
                STREAMPROV_LOG_ERROR(logger_, CATEGORY,
                    "Sampling pass failed: " + report.error().message);
            }
        } catch (const std::exception& e) {
            STREAMPROV_LOG_ERROR(logger_, CATEGORY,
                std::string("Sampling pass threw: ") + e.what());
        }

        std::unique_lock<std::mutex> lock(threadMutex_);
        stopCondition_.wait_for(lock, settings_.sampleInterval,
            [this]() { return !running_.load(); });
    }
}

// =============================================================================
// Read side
// =============================================================================

Result<StreamStatistics, MonitoringError> MonitoringAggregator::getStatistics(
    StreamId streamId, std::optional<uint32_t> days)
{
    auto stream = streamStore_->findById(streamId);
    if (stream.isError()) {
        return Result<StreamStatistics, MonitoringError>::error(fromStorage(stream.error()));
    }

    StreamStatistics stats;
    stats.stream = stream.value();
    stats.days = days.value_or(settings_.defaultStatsDays);

    const TimePoint since = core::SystemClock::now() - std::chrono::hours(24) * stats.days;
    auto summary = telemetry_->sessionSummary(streamId, since);
    if (summary.isError()) {
        return Result<StreamStatistics, MonitoringError>::error(fromStorage(summary.error()));
    }
    const storage::SessionSummary& s = summary.value();
    stats.totalSessions = s.totalSessions;
    stats.totalDurationHours = s.totalHours();
    stats.averageDurationMinutes = s.averageMinutes();
    stats.totalDataGb = s.totalGigabytes();
    stats.peakListeners = s.peakListeners;

    auto samples = telemetry_->recentSamples(streamId, settings_.recentSampleLimit);
    if (samples.isError()) {
        return Result<StreamStatistics, MonitoringError>::error(fromStorage(samples.error()));
    }
    stats.recentSamples = std::move(samples).value();

    return Result<StreamStatistics, MonitoringError>::success(std::move(stats));
}

Result<StreamHealth, MonitoringError> MonitoringAggregator::checkHealth(StreamId streamId) {
    auto loaded = streamStore_->findById(streamId);
    if (loaded.isError()) {
        return Result<StreamHealth, MonitoringError>::error(fromStorage(loaded.error()));
    }
    const StreamRecord& stream = loaded.value();

    StreamHealth health;
    health.streamId = streamId;

    if (stream.status != StreamStatus::Active) {
        health.issues.push_back(
            std::string("Stream is ") + storage::streamStatusToString(stream.status));
    }
    if (stream.pendingExternalSync) {
        health.issues.push_back("Local changes not yet applied to the streaming server");
    }
    if (stream.isTerminated()) {
        return Result<StreamHealth, MonitoringError>::success(std::move(health));
    }

    const auto started = core::SteadyClock::now();
    auto info = serverClient_->getStreamInfo(stream.port);
    health.responseTime = std::chrono::duration_cast<std::chrono::milliseconds>(
        core::SteadyClock::now() - started);

    if (info.isError()) {
        if (info.error().code == shoutcast::StreamingServerError::Code::NotFound) {
            health.accessible = true;
            health.issues.push_back("Streaming server does not report the stream");
        } else {
            health.issues.push_back("Streaming server unreachable: " + info.error().message);
        }
        return Result<StreamHealth, MonitoringError>::success(std::move(health));
    }

    health.accessible = true;
    const shoutcast::LiveStreamStatus& live = info.value();
    if (!live.sourceConnected) {
        health.issues.push_back("No source connected");
    }
    if (live.maxListeners != 0 && live.listeners >= live.maxListeners) {
        health.issues.push_back("Listener limit reached");
    }
    if (live.sourceConnected && live.bitrate != 0 && live.bitrate != stream.bitrate) {
        health.issues.push_back("Source bitrate " + std::to_string(live.bitrate) +
                                " differs from configured " + std::to_string(stream.bitrate));
    }
    health.live = live;

    return Result<StreamHealth, MonitoringError>::success(std::move(health));
}

Result<ServerHealth, MonitoringError> MonitoringAggregator::checkServerHealth() {
    ServerHealth health;

    const auto started = core::SteadyClock::now();
    auto status = serverClient_->getServerStatus();
    health.responseTime = std::chrono::duration_cast<std::chrono::milliseconds>(
        core::SteadyClock::now() - started);

    uint32_t currentStreams = 0;
    if (status.isSuccess()) {
        health.reachable = true;
        health.status = "healthy";
        currentStreams = status.value().totalStreams;
        health.serverStatus = status.value();
    } else {
        health.status = status.error().isTransportFailure() ? "unreachable" : "degraded";
        health.error = status.error().message;
    }

    if (registry_ && serverId_ != core::INVALID_SERVER_ID) {
        auto stamped = registry_->recordHealthCheck(
            serverId_, health.status, currentStreams, core::SystemClock::now());
        if (stamped.isError()) {
            return Result<ServerHealth, MonitoringError>::error(fromStorage(stamped.error()));
        }
    }

    if (!health.reachable) {
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            "Streaming server health check failed: " + health.error);
    }
    return Result<ServerHealth, MonitoringError>::success(std::move(health));
}

} // namespace monitoring
} // namespace streamprov
