// StreamProv - Dedicated stream provisioning service
// Server Registry implementation

#include "streamprov/storage/server_registry.hpp"

namespace streamprov {
namespace storage {

using core::Result;

namespace {

const char* const SERVER_COLUMNS =
    "id, name, hostname, admin_port, admin_password, public_host, max_streams, "
    "current_streams, is_active, is_primary, last_health_check, health_status";

ServerRecord readServer(const Statement& row) {
    ServerRecord server;
    server.id = row.columnInt64(0);
    server.name = row.columnText(1);
    server.hostname = row.columnText(2);
    server.adminPort = static_cast<uint16_t>(row.columnInt64(3));
    server.adminPassword = row.columnText(4);
    server.publicHost = row.columnText(5);
    server.maxStreams = static_cast<uint32_t>(row.columnInt64(6));
    server.currentStreams = static_cast<uint32_t>(row.columnInt64(7));
    server.isActive = row.columnInt64(8) != 0;
    server.isPrimary = row.columnInt64(9) != 0;
    if (auto checked = row.columnOptionalInt64(10)) {
        server.lastHealthCheck = core::fromUnixMillis(*checked);
    }
    server.healthStatus = row.columnText(11);
    return server;
}

} // anonymous namespace

ServerRegistry::ServerRegistry(std::shared_ptr<Database> db)
    : db_(std::move(db))
{
}

Result<core::ServerId, StorageError> ServerRegistry::upsert(const ServerRecord& server) {
    core::ServerId id = core::INVALID_SERVER_ID;

    auto committed = db_->transaction([&]() -> Result<void, StorageError> {
        auto stmt = db_->prepare(
            "INSERT INTO streaming_servers (name, hostname, admin_port, admin_password, "
            "public_host, max_streams, is_active, is_primary, created_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(name) DO UPDATE SET hostname = excluded.hostname, "
            "admin_port = excluded.admin_port, admin_password = excluded.admin_password, "
            "public_host = excluded.public_host, max_streams = excluded.max_streams, "
            "is_active = excluded.is_active, is_primary = excluded.is_primary "
            "RETURNING id");
        if (stmt.isError()) {
            return Result<void, StorageError>::error(stmt.error());
        }
        ParameterBinder binder(stmt.value());
        binder.text(server.name)
              .text(server.hostname)
              .integer(server.adminPort)
              .text(server.adminPassword)
              .text(server.publicHost.empty() ? server.hostname : server.publicHost)
              .integer(server.maxStreams)
              .integer(server.isActive ? 1 : 0)
              .integer(server.isPrimary ? 1 : 0)
              .timestamp(core::SystemClock::now());
        auto bound = binder.result();
        if (bound.isError()) {
            return bound;
        }
        auto row = stmt.value().step();
        if (row.isError()) {
            return Result<void, StorageError>::error(row.error());
        }
        if (!row.value()) {
            return Result<void, StorageError>::error(
                StorageError(StorageError::Code::StepFailed, "Upsert returned no id"));
        }
        id = stmt.value().columnInt64(0);
        auto finished = stmt.value().run();
        if (finished.isError()) {
            return finished;
        }

        if (server.isPrimary) {
            return setPrimary(id);
        }
        return Result<void, StorageError>::success();
    });

    if (committed.isError()) {
        return Result<core::ServerId, StorageError>::error(committed.error());
    }
    return Result<core::ServerId, StorageError>::success(id);
}

Result<ServerRecord, StorageError> ServerRegistry::primary() {
    auto guard = db_->lock();

    auto stmt = db_->prepare(std::string("SELECT ") + SERVER_COLUMNS +
                             " FROM streaming_servers WHERE is_active = 1 AND is_primary = 1 "
                             "ORDER BY id LIMIT 1");
    if (stmt.isError()) {
        return Result<ServerRecord, StorageError>::error(stmt.error());
    }
    auto row = stmt.value().step();
    if (row.isError()) {
        return Result<ServerRecord, StorageError>::error(row.error());
    }
    if (!row.value()) {
        return Result<ServerRecord, StorageError>::error(
            StorageError(StorageError::Code::NotFound, "No active primary streaming server"));
    }
    return Result<ServerRecord, StorageError>::success(readServer(stmt.value()));
}

Result<ServerRecord, StorageError> ServerRegistry::findById(core::ServerId id) {
    auto guard = db_->lock();

    auto stmt = db_->prepare(std::string("SELECT ") + SERVER_COLUMNS +
                             " FROM streaming_servers WHERE id = ?");
    if (stmt.isError()) {
        return Result<ServerRecord, StorageError>::error(stmt.error());
    }
    auto bound = stmt.value().bind(1, static_cast<int64_t>(id));
    if (bound.isError()) {
        return Result<ServerRecord, StorageError>::error(bound.error());
    }
    auto row = stmt.value().step();
    if (row.isError()) {
        return Result<ServerRecord, StorageError>::error(row.error());
    }
    if (!row.value()) {
        return Result<ServerRecord, StorageError>::error(
            StorageError(StorageError::Code::NotFound, "Server " + std::to_string(id) + " not found"));
    }
    return Result<ServerRecord, StorageError>::success(readServer(stmt.value()));
}

Result<std::vector<ServerRecord>, StorageError> ServerRegistry::list() {
    std::vector<ServerRecord> servers;
    auto guard = db_->lock();

    auto stmt = db_->prepare(std::string("SELECT ") + SERVER_COLUMNS +
                             " FROM streaming_servers ORDER BY id");
    if (stmt.isError()) {
        return Result<std::vector<ServerRecord>, StorageError>::error(stmt.error());
    }
    while (true) {
        auto row = stmt.value().step();
        if (row.isError()) {
            return Result<std::vector<ServerRecord>, StorageError>::error(row.error());
        }
        if (!row.value()) {
            break;
        }
        servers.push_back(readServer(stmt.value()));
    }
    return Result<std::vector<ServerRecord>, StorageError>::success(std::move(servers));
}

Result<void, StorageError> ServerRegistry::setPrimary(core::ServerId id) {
    return db_->transaction([&]() -> Result<void, StorageError> {
        auto stmt = db_->prepare(
            "UPDATE streaming_servers SET is_primary = CASE WHEN id = ? THEN 1 ELSE 0 END");
        if (stmt.isError()) {
            return Result<void, StorageError>::error(stmt.error());
        }
        auto bound = stmt.value().bind(1, static_cast<int64_t>(id));
        if (bound.isError()) {
            return bound;
        }
        auto ran = stmt.value().run();
        if (ran.isError()) {
            return ran;
        }

        auto check = findById(id);
        if (check.isError()) {
            return Result<void, StorageError>::error(check.error());
        }
        return Result<void, StorageError>::success();
    });
}

Result<void, StorageError> ServerRegistry::recordHealthCheck(
    core::ServerId id, const std::string& healthStatus, uint32_t currentStreams, TimePoint at)
{
    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "UPDATE streaming_servers SET health_status = ?, current_streams = ?, "
        "last_health_check = ? WHERE id = ?");
    if (stmt.isError()) {
        return Result<void, StorageError>::error(stmt.error());
    }
    ParameterBinder binder(stmt.value());
    binder.text(healthStatus).integer(currentStreams).timestamp(at).integer(id);
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
            StorageError(StorageError::Code::NotFound, "Server " + std::to_string(id) + " not found"));
    }
    return Result<void, StorageError>::success();
}

} // namespace storage
} // namespace streamprov
