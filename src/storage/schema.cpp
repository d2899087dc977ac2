// StreamProv - Dedicated stream provisioning service
// Database schema

#include "streamprov/storage/schema.hpp"

#include <string>

namespace streamprov {
namespace storage {

namespace {

const char* const SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS port_pool (
    port          INTEGER PRIMARY KEY,
    is_allocated  INTEGER NOT NULL DEFAULT 0,
    allocated_at  INTEGER,
    allocated_to  TEXT,
    stream_id     INTEGER
);

CREATE TABLE IF NOT EXISTS streaming_servers (
    id                INTEGER PRIMARY KEY AUTOINCREMENT,
    name              TEXT NOT NULL UNIQUE,
    hostname          TEXT NOT NULL,
    admin_port        INTEGER NOT NULL,
    admin_password    TEXT NOT NULL,
    public_host       TEXT NOT NULL,
    max_streams       INTEGER NOT NULL DEFAULT 100,
    current_streams   INTEGER NOT NULL DEFAULT 0,
    is_active         INTEGER NOT NULL DEFAULT 1,
    is_primary        INTEGER NOT NULL DEFAULT 0,
    last_health_check INTEGER,
    health_status     TEXT NOT NULL DEFAULT 'unknown',
    created_at        INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS dedicated_streams (
    id                    INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id               TEXT NOT NULL,
    station_id            TEXT,
    port                  INTEGER NOT NULL REFERENCES port_pool(port),
    server_id             INTEGER,
    source_password       TEXT NOT NULL,
    admin_password        TEXT NOT NULL,
    title                 TEXT NOT NULL,
    description           TEXT NOT NULL DEFAULT '',
    genre                 TEXT NOT NULL DEFAULT '',
    bitrate               INTEGER NOT NULL,
    max_listeners         INTEGER NOT NULL,
    sample_rate           INTEGER NOT NULL,
    public_server         INTEGER NOT NULL DEFAULT 1,
    status                TEXT NOT NULL,
    is_live               INTEGER NOT NULL DEFAULT 0,
    current_listeners     INTEGER NOT NULL DEFAULT 0,
    peak_listeners        INTEGER NOT NULL DEFAULT 0,
    created_at            INTEGER NOT NULL,
    activated_at          INTEGER,
    last_connection_at    INTEGER,
    suspended_at          INTEGER,
    terminated_at         INTEGER,
    suspension_reason     TEXT NOT NULL DEFAULT '',
    config_version        INTEGER NOT NULL DEFAULT 1,
    pending_external_sync INTEGER NOT NULL DEFAULT 0,
    last_error            TEXT NOT NULL DEFAULT ''
);

CREATE UNIQUE INDEX IF NOT EXISTS idx_streams_live_port
    ON dedicated_streams(port) WHERE status != 'terminated';
CREATE UNIQUE INDEX IF NOT EXISTS idx_streams_live_user
    ON dedicated_streams(user_id) WHERE status != 'terminated';
CREATE INDEX IF NOT EXISTS idx_streams_user_status
    ON dedicated_streams(user_id, status);
CREATE INDEX IF NOT EXISTS idx_streams_status
    ON dedicated_streams(status);

CREATE TABLE IF NOT EXISTS stream_sessions (
    id                INTEGER PRIMARY KEY AUTOINCREMENT,
    stream_id         INTEGER NOT NULL REFERENCES dedicated_streams(id) ON DELETE CASCADE,
    started_at        INTEGER NOT NULL,
    ended_at          INTEGER,
    duration_seconds  INTEGER NOT NULL DEFAULT 0,
    peak_listeners    INTEGER NOT NULL DEFAULT 0,
    bytes_transferred INTEGER NOT NULL DEFAULT 0,
    encoder           TEXT NOT NULL DEFAULT '',
    disconnect_reason TEXT NOT NULL DEFAULT ''
);

CREATE INDEX IF NOT EXISTS idx_sessions_stream_started
    ON stream_sessions(stream_id, started_at);

CREATE TABLE IF NOT EXISTS stream_monitoring (
    id                INTEGER PRIMARY KEY AUTOINCREMENT,
    stream_id         INTEGER NOT NULL REFERENCES dedicated_streams(id) ON DELETE CASCADE,
    timestamp         INTEGER NOT NULL,
    listeners         INTEGER NOT NULL DEFAULT 0,
    is_live           INTEGER NOT NULL DEFAULT 0,
    bitrate           INTEGER NOT NULL DEFAULT 0,
    bandwidth_kbps    REAL NOT NULL DEFAULT 0,
    cpu_usage         REAL NOT NULL DEFAULT 0,
    memory_usage_mb   REAL NOT NULL DEFAULT 0,
    connection_errors INTEGER NOT NULL DEFAULT 0,
    current_song      TEXT NOT NULL DEFAULT '',
    uptime_seconds    INTEGER NOT NULL DEFAULT 0
);

CREATE INDEX IF NOT EXISTS idx_monitoring_stream_time
    ON stream_monitoring(stream_id, timestamp);
)SQL";

} // anonymous namespace

core::Result<void, StorageError> applySchema(Database& db) {
    return db.transaction([&db]() -> core::Result<void, StorageError> {
        auto created = db.execute(SCHEMA_SQL);
        if (created.isError()) {
            return created;
        }
        return db.execute("PRAGMA user_version = " + std::to_string(SCHEMA_VERSION) + ";");
    });
}

} // namespace storage
} // namespace streamprov
