// StreamProv - Dedicated stream provisioning service
// Stream Entity Store implementation

#include "streamprov/storage/stream_store.hpp"

namespace streamprov {
namespace storage {

using core::Result;

namespace {

const char* const STREAM_COLUMNS =
    "id, user_id, station_id, port, server_id, source_password, admin_password, "
    "title, description, genre, bitrate, max_listeners, sample_rate, public_server, "
    "status, is_live, current_listeners, peak_listeners, created_at, activated_at, "
    "last_connection_at, suspended_at, terminated_at, suspension_reason, "
    "config_version, pending_external_sync, last_error";

std::optional<TimePoint> optionalTime(const Statement& row, int column) {
    auto millis = row.columnOptionalInt64(column);
    if (!millis) {
        return std::nullopt;
    }
    return core::fromUnixMillis(*millis);
}

Result<StreamRecord, StorageError> readStream(const Statement& row) {
    StreamRecord record;
    record.id = row.columnInt64(0);
    record.userId = row.columnText(1);
    record.stationId = row.columnOptionalText(2);
    record.port = static_cast<PortNumber>(row.columnInt64(3));
    record.serverId = row.columnOptionalInt64(4).value_or(core::INVALID_SERVER_ID);
    record.sourcePassword = row.columnText(5);
    record.adminPassword = row.columnText(6);
    record.title = row.columnText(7);
    record.description = row.columnText(8);
    record.genre = row.columnText(9);
    record.bitrate = static_cast<uint32_t>(row.columnInt64(10));
    record.maxListeners = static_cast<uint32_t>(row.columnInt64(11));
    record.sampleRate = static_cast<uint32_t>(row.columnInt64(12));
    record.publicServer = row.columnInt64(13) != 0;

    auto status = parseStreamStatus(row.columnText(14));
    if (!status) {
        return Result<StreamRecord, StorageError>::error(
            StorageError(StorageError::Code::StepFailed,
                         "Stream " + std::to_string(record.id) + " has unknown status '" +
                         row.columnText(14) + "'"));
    }
    record.status = *status;

    record.isLive = row.columnInt64(15) != 0;
    record.currentListeners = static_cast<uint32_t>(row.columnInt64(16));
    record.peakListeners = static_cast<uint32_t>(row.columnInt64(17));
    record.createdAt = core::fromUnixMillis(row.columnInt64(18));
    record.activatedAt = optionalTime(row, 19);
    record.lastConnectionAt = optionalTime(row, 20);
    record.suspendedAt = optionalTime(row, 21);
    record.terminatedAt = optionalTime(row, 22);
    record.suspensionReason = row.columnText(23);
    record.configVersion = static_cast<uint32_t>(row.columnInt64(24));
    record.pendingExternalSync = row.columnInt64(25) != 0;
    record.lastError = row.columnText(26);
    return Result<StreamRecord, StorageError>::success(std::move(record));
}

std::optional<int64_t> serverRef(core::ServerId id) {
    if (id == core::INVALID_SERVER_ID) {
        return std::nullopt;
    }
    return id;
}

} // anonymous namespace

SqliteStreamStore::SqliteStreamStore(std::shared_ptr<Database> db)
    : db_(std::move(db))
{
}

Result<StreamId, StorageError> SqliteStreamStore::create(const StreamRecord& record) {
    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "INSERT INTO dedicated_streams ("
        "user_id, station_id, port, server_id, source_password, admin_password, "
        "title, description, genre, bitrate, max_listeners, sample_rate, public_server, "
        "status, is_live, current_listeners, peak_listeners, created_at, activated_at, "
        "last_connection_at, suspended_at, terminated_at, suspension_reason, "
        "config_version, pending_external_sync, last_error) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
    if (stmt.isError()) {
        return Result<StreamId, StorageError>::error(stmt.error());
    }

    ParameterBinder binder(stmt.value());
    binder.text(record.userId)
          .optionalText(record.stationId)
          .integer(record.port)
          .optionalInteger(serverRef(record.serverId))
          .text(record.sourcePassword)
          .text(record.adminPassword)
          .text(record.title)
          .text(record.description)
          .text(record.genre)
          .integer(record.bitrate)
          .integer(record.maxListeners)
          .integer(record.sampleRate)
          .integer(record.publicServer ? 1 : 0)
          .text(streamStatusToString(record.status))
          .integer(record.isLive ? 1 : 0)
          .integer(record.currentListeners)
          .integer(record.peakListeners)
          .timestamp(record.createdAt)
          .optionalTimestamp(record.activatedAt)
          .optionalTimestamp(record.lastConnectionAt)
          .optionalTimestamp(record.suspendedAt)
          .optionalTimestamp(record.terminatedAt)
          .text(record.suspensionReason)
          .integer(record.configVersion)
          .integer(record.pendingExternalSync ? 1 : 0)
          .text(record.lastError);
    auto bound = binder.result();
    if (bound.isError()) {
        return Result<StreamId, StorageError>::error(bound.error());
    }

    auto ran = stmt.value().run();
    if (ran.isError()) {
        return Result<StreamId, StorageError>::error(ran.error());
    }
    return Result<StreamId, StorageError>::success(db_->lastInsertRowId());
}

Result<StreamRecord, StorageError> SqliteStreamStore::findById(StreamId id) {
    auto guard = db_->lock();

    auto stmt = db_->prepare(std::string("SELECT ") + STREAM_COLUMNS +
                             " FROM dedicated_streams WHERE id = ?");
    if (stmt.isError()) {
        return Result<StreamRecord, StorageError>::error(stmt.error());
    }
    auto bound = stmt.value().bind(1, static_cast<int64_t>(id));
    if (bound.isError()) {
        return Result<StreamRecord, StorageError>::error(bound.error());
    }
    auto row = stmt.value().step();
    if (row.isError()) {
        return Result<StreamRecord, StorageError>::error(row.error());
    }
    if (!row.value()) {
        return Result<StreamRecord, StorageError>::error(
            StorageError(StorageError::Code::NotFound, "Stream " + std::to_string(id) + " not found"));
    }
    return readStream(stmt.value());
}

Result<StreamRecord, StorageError> SqliteStreamStore::findActiveByUser(const UserId& userId) {
    auto guard = db_->lock();

    auto stmt = db_->prepare(std::string("SELECT ") + STREAM_COLUMNS +
                             " FROM dedicated_streams WHERE user_id = ? AND status != 'terminated' "
                             "ORDER BY id DESC LIMIT 1");
    if (stmt.isError()) {
        return Result<StreamRecord, StorageError>::error(stmt.error());
    }
    auto bound = stmt.value().bind(1, userId);
    if (bound.isError()) {
        return Result<StreamRecord, StorageError>::error(bound.error());
    }
    auto row = stmt.value().step();
    if (row.isError()) {
        return Result<StreamRecord, StorageError>::error(row.error());
    }
    if (!row.value()) {
        return Result<StreamRecord, StorageError>::error(
            StorageError(StorageError::Code::NotFound, "User " + userId + " has no dedicated stream"));
    }
    return readStream(stmt.value());
}

Result<std::vector<StreamRecord>, StorageError> SqliteStreamStore::listByStatus(
    const std::vector<StreamStatus>& statuses)
{
    std::vector<StreamRecord> streams;
    if (statuses.empty()) {
        return Result<std::vector<StreamRecord>, StorageError>::success(std::move(streams));
    }

    std::string placeholders;
    for (size_t i = 0; i < statuses.size(); ++i) {
        placeholders += (i == 0) ? "?" : ", ?";
    }

    auto guard = db_->lock();

    auto stmt = db_->prepare(std::string("SELECT ") + STREAM_COLUMNS +
                             " FROM dedicated_streams WHERE status IN (" + placeholders +
                             ") ORDER BY id");
    if (stmt.isError()) {
        return Result<std::vector<StreamRecord>, StorageError>::error(stmt.error());
    }

    ParameterBinder binder(stmt.value());
    for (StreamStatus status : statuses) {
        binder.text(streamStatusToString(status));
    }
    auto bound = binder.result();
    if (bound.isError()) {
        return Result<std::vector<StreamRecord>, StorageError>::error(bound.error());
    }

    while (true) {
        auto row = stmt.value().step();
        if (row.isError()) {
            return Result<std::vector<StreamRecord>, StorageError>::error(row.error());
        }
        if (!row.value()) {
            break;
        }
        auto record = readStream(stmt.value());
        if (record.isError()) {
            return Result<std::vector<StreamRecord>, StorageError>::error(record.error());
        }
        streams.push_back(std::move(record.value()));
    }
    return Result<std::vector<StreamRecord>, StorageError>::success(std::move(streams));
}

Result<void, StorageError> SqliteStreamStore::update(const StreamRecord& record) {
    auto guard = db_->lock();

    // Liveness columns belong to recordLiveness. Leaving the active
    // status clears the live flag and the listener count.
    auto stmt = db_->prepare(
        "UPDATE dedicated_streams SET "
        "station_id = ?1, server_id = ?2, source_password = ?3, admin_password = ?4, "
        "title = ?5, description = ?6, genre = ?7, bitrate = ?8, max_listeners = ?9, "
        "sample_rate = ?10, public_server = ?11, status = ?12, "
        "is_live = CASE WHEN ?12 = 'active' THEN is_live ELSE 0 END, "
        "current_listeners = CASE WHEN ?12 = 'active' THEN current_listeners ELSE 0 END, "
        "activated_at = ?13, suspended_at = ?14, terminated_at = ?15, "
        "suspension_reason = ?16, config_version = ?17, pending_external_sync = ?18, "
        "last_error = ?19 "
        "WHERE id = ?20");
    if (stmt.isError()) {
        return Result<void, StorageError>::error(stmt.error());
    }

    ParameterBinder binder(stmt.value());
    binder.optionalText(record.stationId)
          .optionalInteger(serverRef(record.serverId))
          .text(record.sourcePassword)
          .text(record.adminPassword)
          .text(record.title)
          .text(record.description)
          .text(record.genre)
          .integer(record.bitrate)
          .integer(record.maxListeners)
          .integer(record.sampleRate)
          .integer(record.publicServer ? 1 : 0)
          .text(streamStatusToString(record.status))
          .optionalTimestamp(record.activatedAt)
          .optionalTimestamp(record.suspendedAt)
          .optionalTimestamp(record.terminatedAt)
          .text(record.suspensionReason)
          .integer(record.configVersion)
          .integer(record.pendingExternalSync ? 1 : 0)
          .text(record.lastError)
          .integer(record.id);
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
                         "Stream " + std::to_string(record.id) + " not found"));
    }
    return Result<void, StorageError>::success();
}

Result<bool, StorageError> SqliteStreamStore::recordLiveness(
    StreamId id, bool isLive, uint32_t currentListeners, std::optional<TimePoint> lastConnectionAt)
{
    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "UPDATE dedicated_streams SET is_live = ?1, current_listeners = ?2, "
        "peak_listeners = MAX(peak_listeners, ?2), "
        "last_connection_at = COALESCE(?3, last_connection_at) "
        "WHERE id = ?4 AND status = 'active'");
    if (stmt.isError()) {
        return Result<bool, StorageError>::error(stmt.error());
    }
    ParameterBinder binder(stmt.value());
    binder.integer(isLive ? 1 : 0)
          .integer(currentListeners)
          .optionalTimestamp(lastConnectionAt)
          .integer(id);
    auto bound = binder.result();
    if (bound.isError()) {
        return Result<bool, StorageError>::error(bound.error());
    }
    auto ran = stmt.value().run();
    if (ran.isError()) {
        return Result<bool, StorageError>::error(ran.error());
    }
    return Result<bool, StorageError>::success(db_->changes() > 0);
}

} // namespace storage
} // namespace streamprov
