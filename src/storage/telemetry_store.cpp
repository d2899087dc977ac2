// StreamProv - Dedicated stream provisioning service
// Telemetry Store implementation

#include "streamprov/storage/telemetry_store.hpp"

namespace streamprov {
namespace storage {

using core::Result;

namespace {

const char* const SESSION_COLUMNS =
    "id, stream_id, started_at, ended_at, duration_seconds, peak_listeners, "
    "bytes_transferred, encoder, disconnect_reason";

SessionRecord readSession(const Statement& row) {
    SessionRecord session;
    session.id = row.columnInt64(0);
    session.streamId = row.columnInt64(1);
    session.startedAt = core::fromUnixMillis(row.columnInt64(2));
    if (auto ended = row.columnOptionalInt64(3)) {
        session.endedAt = core::fromUnixMillis(*ended);
    }
    session.durationSeconds = static_cast<uint64_t>(row.columnInt64(4));
    session.peakListeners = static_cast<uint32_t>(row.columnInt64(5));
    session.bytesTransferred = static_cast<uint64_t>(row.columnInt64(6));
    session.encoder = row.columnText(7);
    session.disconnectReason = row.columnText(8);
    return session;
}

} // anonymous namespace

TelemetryStore::TelemetryStore(std::shared_ptr<Database> db)
    : db_(std::move(db))
{
}

Result<SessionId, StorageError> TelemetryStore::openSession(
    StreamId streamId, TimePoint startedAt, const std::string& encoder)
{
    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "INSERT INTO stream_sessions (stream_id, started_at, encoder) VALUES (?, ?, ?)");
    if (stmt.isError()) {
        return Result<SessionId, StorageError>::error(stmt.error());
    }
    ParameterBinder binder(stmt.value());
    binder.integer(streamId).timestamp(startedAt).text(encoder);
    auto bound = binder.result();
    if (bound.isError()) {
        return Result<SessionId, StorageError>::error(bound.error());
    }
    auto ran = stmt.value().run();
    if (ran.isError()) {
        return Result<SessionId, StorageError>::error(ran.error());
    }
    return Result<SessionId, StorageError>::success(db_->lastInsertRowId());
}

Result<std::optional<SessionRecord>, StorageError> TelemetryStore::findOpenSession(StreamId streamId) {
    auto guard = db_->lock();

    auto stmt = db_->prepare(std::string("SELECT ") + SESSION_COLUMNS +
                             " FROM stream_sessions WHERE stream_id = ? AND ended_at IS NULL "
                             "ORDER BY started_at DESC LIMIT 1");
    if (stmt.isError()) {
        return Result<std::optional<SessionRecord>, StorageError>::error(stmt.error());
    }
    auto bound = stmt.value().bind(1, static_cast<int64_t>(streamId));
    if (bound.isError()) {
        return Result<std::optional<SessionRecord>, StorageError>::error(bound.error());
    }
    auto row = stmt.value().step();
    if (row.isError()) {
        return Result<std::optional<SessionRecord>, StorageError>::error(row.error());
    }
    if (!row.value()) {
        return Result<std::optional<SessionRecord>, StorageError>::success(std::nullopt);
    }
    return Result<std::optional<SessionRecord>, StorageError>::success(readSession(stmt.value()));
}

Result<void, StorageError> TelemetryStore::updateSession(
    SessionId sessionId, uint32_t peakListeners, uint64_t bytesTransferred)
{
    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "UPDATE stream_sessions SET peak_listeners = MAX(peak_listeners, ?), "
        "bytes_transferred = MAX(bytes_transferred, ?) "
        "WHERE id = ? AND ended_at IS NULL");
    if (stmt.isError()) {
        return Result<void, StorageError>::error(stmt.error());
    }
    ParameterBinder binder(stmt.value());
    binder.integer(peakListeners)
          .integer(static_cast<int64_t>(bytesTransferred))
          .integer(sessionId);
    auto bound = binder.result();
    if (bound.isError()) {
        return bound;
    }
    return stmt.value().run();
}

Result<void, StorageError> TelemetryStore::closeSession(
    SessionId sessionId, TimePoint endedAt, const std::string& disconnectReason)
{
    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "UPDATE stream_sessions SET ended_at = ?1, "
        "duration_seconds = MAX(0, (?1 - started_at) / 1000), disconnect_reason = ?2 "
        "WHERE id = ?3 AND ended_at IS NULL");
    if (stmt.isError()) {
        return Result<void, StorageError>::error(stmt.error());
    }
    ParameterBinder binder(stmt.value());
    binder.timestamp(endedAt).text(disconnectReason).integer(sessionId);
    auto bound = binder.result();
    if (bound.isError()) {
        return bound;
    }
    auto ran = stmt.value().run();
    if (ran.isError()) {
        return ran;
    }
    if (db_->changes() == 0) {
        return Result<void, StorageError>::error(
            StorageError(StorageError::Code::NotFound,
                         "No open session " + std::to_string(sessionId)));
    }
    return Result<void, StorageError>::success();
}

Result<core::SampleId, StorageError> TelemetryStore::appendSample(const MonitoringSample& sample) {
    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "INSERT INTO stream_monitoring (stream_id, timestamp, listeners, is_live, bitrate, "
        "bandwidth_kbps, cpu_usage, memory_usage_mb, connection_errors, current_song, "
        "uptime_seconds) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (stmt.isError()) {
        return Result<core::SampleId, StorageError>::error(stmt.error());
    }
    ParameterBinder binder(stmt.value());
    binder.integer(sample.streamId)
          .timestamp(sample.timestamp)
          .integer(sample.listeners)
          .integer(sample.isLive ? 1 : 0)
          .integer(sample.bitrate)
          .real(sample.bandwidthKbps)
          .real(sample.cpuUsage)
          .real(sample.memoryUsageMb)
          .integer(sample.connectionErrors)
          .text(sample.currentSong)
          .integer(static_cast<int64_t>(sample.uptimeSeconds));
    auto bound = binder.result();
    if (bound.isError()) {
        return Result<core::SampleId, StorageError>::error(bound.error());
    }
    auto ran = stmt.value().run();
    if (ran.isError()) {
        return Result<core::SampleId, StorageError>::error(ran.error());
    }
    return Result<core::SampleId, StorageError>::success(db_->lastInsertRowId());
}

Result<SessionSummary, StorageError> TelemetryStore::sessionSummary(StreamId streamId, TimePoint since) {
    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "SELECT COUNT(*), COALESCE(SUM(duration_seconds), 0), "
        "COALESCE(SUM(bytes_transferred), 0), COALESCE(MAX(peak_listeners), 0) "
        "FROM stream_sessions WHERE stream_id = ? AND started_at >= ?");
    if (stmt.isError()) {
        return Result<SessionSummary, StorageError>::error(stmt.error());
    }
    ParameterBinder binder(stmt.value());
    binder.integer(streamId).timestamp(since);
    auto bound = binder.result();
    if (bound.isError()) {
        return Result<SessionSummary, StorageError>::error(bound.error());
    }
    auto row = stmt.value().step();
    if (row.isError()) {
        return Result<SessionSummary, StorageError>::error(row.error());
    }

    SessionSummary summary;
    summary.totalSessions = static_cast<uint32_t>(stmt.value().columnInt64(0));
    summary.totalDurationSeconds = static_cast<uint64_t>(stmt.value().columnInt64(1));
    summary.totalBytes = static_cast<uint64_t>(stmt.value().columnInt64(2));
    summary.peakListeners = static_cast<uint32_t>(stmt.value().columnInt64(3));
    return Result<SessionSummary, StorageError>::success(summary);
}

Result<std::vector<MonitoringSample>, StorageError> TelemetryStore::recentSamples(
    StreamId streamId, uint32_t limit)
{
    std::vector<MonitoringSample> samples;
    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "SELECT id, stream_id, timestamp, listeners, is_live, bitrate, bandwidth_kbps, "
        "cpu_usage, memory_usage_mb, connection_errors, current_song, uptime_seconds "
        "FROM stream_monitoring WHERE stream_id = ? ORDER BY timestamp DESC, id DESC LIMIT ?");
    if (stmt.isError()) {
        return Result<std::vector<MonitoringSample>, StorageError>::error(stmt.error());
    }
    ParameterBinder binder(stmt.value());
    binder.integer(streamId).integer(limit);
    auto bound = binder.result();
    if (bound.isError()) {
        return Result<std::vector<MonitoringSample>, StorageError>::error(bound.error());
    }

    Statement& query = stmt.value();
    while (true) {
        auto row = query.step();
        if (row.isError()) {
            return Result<std::vector<MonitoringSample>, StorageError>::error(row.error());
        }
        if (!row.value()) {
            break;
        }
        MonitoringSample sample;
        sample.id = query.columnInt64(0);
        sample.streamId = query.columnInt64(1);
        sample.timestamp = core::fromUnixMillis(query.columnInt64(2));
        sample.listeners = static_cast<uint32_t>(query.columnInt64(3));
        sample.isLive = query.columnInt64(4) != 0;
        sample.bitrate = static_cast<uint32_t>(query.columnInt64(5));
        sample.bandwidthKbps = query.columnDouble(6);
        sample.cpuUsage = query.columnDouble(7);
        sample.memoryUsageMb = query.columnDouble(8);
        sample.connectionErrors = static_cast<uint32_t>(query.columnInt64(9));
        sample.currentSong = query.columnText(10);
        sample.uptimeSeconds = static_cast<uint64_t>(query.columnInt64(11));
        samples.push_back(std::move(sample));
    }
    return Result<std::vector<MonitoringSample>, StorageError>::success(std::move(samples));
}

Result<std::vector<SessionRecord>, StorageError> TelemetryStore::sessionsSince(
    StreamId streamId, TimePoint since)
{
    std::vector<SessionRecord> sessions;
    auto guard = db_->lock();

    auto stmt = db_->prepare(std::string("SELECT ") + SESSION_COLUMNS +
                             " FROM stream_sessions WHERE stream_id = ? AND started_at >= ? "
                             "ORDER BY started_at");
    if (stmt.isError()) {
        return Result<std::vector<SessionRecord>, StorageError>::error(stmt.error());
    }
    ParameterBinder binder(stmt.value());
    binder.integer(streamId).timestamp(since);
    auto bound = binder.result();
    if (bound.isError()) {
        return Result<std::vector<SessionRecord>, StorageError>::error(bound.error());
    }

    while (true) {
        auto row = stmt.value().step();
        if (row.isError()) {
            return Result<std::vector<SessionRecord>, StorageError>::error(row.error());
        }
        if (!row.value()) {
            break;
        }
        sessions.push_back(readSession(stmt.value()));
    }
    return Result<std::vector<SessionRecord>, StorageError>::success(std::move(sessions));
}

} // namespace storage
} // namespace streamprov
