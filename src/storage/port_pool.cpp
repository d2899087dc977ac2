// StreamProv - Dedicated stream provisioning service
// Port Pool implementation

#include "streamprov/storage/port_pool.hpp"

#include <optional>

namespace streamprov {
namespace storage {

using core::Result;

namespace {

const char* const CATEGORY = "PortPool";

PortPoolError storageFailure(const StorageError& error) {
    return PortPoolError(PortPoolError::Code::StorageFailed, error.message);
}

} // anonymous namespace

core::ErrorCode toErrorCode(PortPoolError::Code code) {
    switch (code) {
        case PortPoolError::Code::None: return core::ErrorCode::Success;
        case PortPoolError::Code::NoPortsAvailable: return core::ErrorCode::NoPortsAvailable;
        case PortPoolError::Code::NotFound: return core::ErrorCode::PortNotFound;
        case PortPoolError::Code::InvalidRange: return core::ErrorCode::PortRangeInvalid;
        case PortPoolError::Code::StorageFailed: return core::ErrorCode::StorageError;
        case PortPoolError::Code::OwnerFailed: return core::ErrorCode::StorageError;
    }
    return core::ErrorCode::PortPoolError;
}

SqlitePortPool::SqlitePortPool(
    std::shared_ptr<Database> db,
    std::shared_ptr<core::StructuredLogger> logger)
    : db_(std::move(db))
    , logger_(std::move(logger))
{
}

Result<uint32_t, PortPoolError> SqlitePortPool::initialize(PortNumber rangeStart, PortNumber rangeEnd) {
    if (rangeStart == core::INVALID_PORT || rangeStart > rangeEnd) {
        return Result<uint32_t, PortPoolError>::error(
            PortPoolError(PortPoolError::Code::InvalidRange,
                          "Invalid port range " + std::to_string(rangeStart) + "-" +
                          std::to_string(rangeEnd)));
    }

    uint32_t added = 0;
    auto committed = db_->transaction([&]() -> Result<void, StorageError> {
        auto stmt = db_->prepare("INSERT OR IGNORE INTO port_pool (port, is_allocated) VALUES (?, 0)");
        if (stmt.isError()) {
            return Result<void, StorageError>::error(stmt.error());
        }
        Statement& insert = stmt.value();
        for (uint32_t port = rangeStart; port <= rangeEnd; ++port) {
            insert.reset();
            auto bound = insert.bind(1, static_cast<int64_t>(port));
            if (bound.isError()) {
                return bound;
            }
            auto ran = insert.run();
            if (ran.isError()) {
                return ran;
            }
            added += static_cast<uint32_t>(db_->changes());
        }
        return Result<void, StorageError>::success();
    });

    if (committed.isError()) {
        return Result<uint32_t, PortPoolError>::error(storageFailure(committed.error()));
    }

    STREAMPROV_LOG_INFO(logger_, CATEGORY,
        "Port pool " + std::to_string(rangeStart) + "-" + std::to_string(rangeEnd) +
        " initialized, " + std::to_string(added) + " ports added");
    return Result<uint32_t, PortPoolError>::success(added);
}

Result<PortNumber, PortPoolError> SqlitePortPool::allocate(const UserId& requester) {
    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "UPDATE port_pool "
        "SET is_allocated = 1, allocated_at = ?1, allocated_to = ?2, stream_id = NULL "
        "WHERE is_allocated = 0 AND port = ("
        "  SELECT port FROM port_pool WHERE is_allocated = 0 ORDER BY port LIMIT 1) "
        "RETURNING port");
    if (stmt.isError()) {
        return Result<PortNumber, PortPoolError>::error(storageFailure(stmt.error()));
    }

    Statement& claim = stmt.value();
    auto boundTime = claim.bind(1, core::toUnixMillis(core::SystemClock::now()));
    if (boundTime.isError()) {
        return Result<PortNumber, PortPoolError>::error(storageFailure(boundTime.error()));
    }
    auto boundUser = claim.bind(2, requester);
    if (boundUser.isError()) {
        return Result<PortNumber, PortPoolError>::error(storageFailure(boundUser.error()));
    }

    auto row = claim.step();
    if (row.isError()) {
        return Result<PortNumber, PortPoolError>::error(storageFailure(row.error()));
    }
    if (!row.value()) {
        STREAMPROV_LOG_WARNING(logger_, CATEGORY, "Port pool exhausted, request from " + requester);
        return Result<PortNumber, PortPoolError>::error(
            PortPoolError(PortPoolError::Code::NoPortsAvailable, "No ports available"));
    }

    auto port = static_cast<PortNumber>(claim.columnInt64(0));
    auto finished = claim.run();
    if (finished.isError()) {
        return Result<PortNumber, PortPoolError>::error(storageFailure(finished.error()));
    }

    STREAMPROV_LOG_DEBUG(logger_, CATEGORY,
        "Allocated port " + std::to_string(port) + " to " + requester);
    return Result<PortNumber, PortPoolError>::success(port);
}

Result<PortBinding, PortPoolError> SqlitePortPool::allocateFor(
    const UserId& requester, const OwnerFactory& createOwner)
{
    PortBinding binding;
    std::optional<PortPoolError> failure;

    // Pool errors are carried out in failure; the StorageError returned
    // from the body only drives the rollback.
    auto committed = db_->transaction([&]() -> Result<void, StorageError> {
        auto claimed = allocate(requester);
        if (claimed.isError()) {
            failure = claimed.error();
            return Result<void, StorageError>::error(
                StorageError(StorageError::Code::StepFailed, claimed.error().message));
        }
        binding.port = claimed.value();

        auto owner = createOwner(binding.port);
        if (owner.isError()) {
            failure = PortPoolError(PortPoolError::Code::OwnerFailed,
                                    "Owner of port " + std::to_string(binding.port) +
                                    " not created: " + owner.error().message);
            return Result<void, StorageError>::error(owner.error());
        }
        binding.streamId = owner.value();

        auto bound = bindStream(binding.port, binding.streamId);
        if (bound.isError()) {
            failure = PortPoolError(PortPoolError::Code::OwnerFailed,
                                    "Port " + std::to_string(binding.port) +
                                    " not bound: " + bound.error().message);
            return Result<void, StorageError>::error(
                StorageError(StorageError::Code::StepFailed, bound.error().message));
        }
        return Result<void, StorageError>::success();
    });

    if (committed.isError()) {
        if (failure) {
            return Result<PortBinding, PortPoolError>::error(*failure);
        }
        return Result<PortBinding, PortPoolError>::error(storageFailure(committed.error()));
    }
    return Result<PortBinding, PortPoolError>::success(binding);
}

Result<void, PortPoolError> SqlitePortPool::release(PortNumber port) {
    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "UPDATE port_pool "
        "SET is_allocated = 0, allocated_at = NULL, allocated_to = NULL, stream_id = NULL "
        "WHERE port = ?");
    if (stmt.isError()) {
        return Result<void, PortPoolError>::error(storageFailure(stmt.error()));
    }
    auto bound = stmt.value().bind(1, static_cast<int64_t>(port));
    if (bound.isError()) {
        return Result<void, PortPoolError>::error(storageFailure(bound.error()));
    }
    auto ran = stmt.value().run();
    if (ran.isError()) {
        return Result<void, PortPoolError>::error(storageFailure(ran.error()));
    }
    if (db_->changes() == 0) {
        return Result<void, PortPoolError>::error(
            PortPoolError(PortPoolError::Code::NotFound,
                          "Port " + std::to_string(port) + " is not part of the pool"));
    }

    STREAMPROV_LOG_DEBUG(logger_, CATEGORY, "Released port " + std::to_string(port));
    return Result<void, PortPoolError>::success();
}

Result<void, PortPoolError> SqlitePortPool::bindStream(PortNumber port, StreamId streamId) {
    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "UPDATE port_pool SET stream_id = ? WHERE port = ? AND is_allocated = 1");
    if (stmt.isError()) {
        return Result<void, PortPoolError>::error(storageFailure(stmt.error()));
    }
    Statement& update = stmt.value();
    auto boundStream = update.bind(1, static_cast<int64_t>(streamId));
    if (boundStream.isError()) {
        return Result<void, PortPoolError>::error(storageFailure(boundStream.error()));
    }
    auto boundPort = update.bind(2, static_cast<int64_t>(port));
    if (boundPort.isError()) {
        return Result<void, PortPoolError>::error(storageFailure(boundPort.error()));
    }
    auto ran = update.run();
    if (ran.isError()) {
        return Result<void, PortPoolError>::error(storageFailure(ran.error()));
    }
    if (db_->changes() == 0) {
        return Result<void, PortPoolError>::error(
            PortPoolError(PortPoolError::Code::NotFound,
                          "Port " + std::to_string(port) + " is not allocated"));
    }
    return Result<void, PortPoolError>::success();
}

Result<PortRecord, PortPoolError> SqlitePortPool::getPort(PortNumber port) {
    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "SELECT port, is_allocated, allocated_at, allocated_to, stream_id "
        "FROM port_pool WHERE port = ?");
    if (stmt.isError()) {
        return Result<PortRecord, PortPoolError>::error(storageFailure(stmt.error()));
    }
    Statement& query = stmt.value();
    auto bound = query.bind(1, static_cast<int64_t>(port));
    if (bound.isError()) {
        return Result<PortRecord, PortPoolError>::error(storageFailure(bound.error()));
    }
    auto row = query.step();
    if (row.isError()) {
        return Result<PortRecord, PortPoolError>::error(storageFailure(row.error()));
    }
    if (!row.value()) {
        return Result<PortRecord, PortPoolError>::error(
            PortPoolError(PortPoolError::Code::NotFound,
                          "Port " + std::to_string(port) + " is not part of the pool"));
    }

    PortRecord record;
    record.port = static_cast<PortNumber>(query.columnInt64(0));
    record.allocated = query.columnInt64(1) != 0;
    if (auto at = query.columnOptionalInt64(2)) {
        record.allocatedAt = core::fromUnixMillis(*at);
    }
    record.allocatedTo = query.columnOptionalText(3);
    record.streamId = query.columnOptionalInt64(4);
    return Result<PortRecord, PortPoolError>::success(std::move(record));
}

Result<PoolStatus, PortPoolError> SqlitePortPool::status() {
    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "SELECT COUNT(*), COALESCE(SUM(is_allocated), 0), "
        "COALESCE(MIN(port), 0), COALESCE(MAX(port), 0) FROM port_pool");
    if (stmt.isError()) {
        return Result<PoolStatus, PortPoolError>::error(storageFailure(stmt.error()));
    }
    Statement& query = stmt.value();
    auto row = query.step();
    if (row.isError()) {
        return Result<PoolStatus, PortPoolError>::error(storageFailure(row.error()));
    }

    PoolStatus pool;
    pool.total = static_cast<uint32_t>(query.columnInt64(0));
    pool.allocated = static_cast<uint32_t>(query.columnInt64(1));
    pool.available = pool.total - pool.allocated;
    pool.rangeStart = static_cast<PortNumber>(query.columnInt64(2));
    pool.rangeEnd = static_cast<PortNumber>(query.columnInt64(3));
    pool.allocationRate = pool.total == 0
        ? 0.0
        : 100.0 * static_cast<double>(pool.allocated) / static_cast<double>(pool.total);
    return Result<PoolStatus, PortPoolError>::success(pool);
}

Result<uint32_t, PortPoolError> SqlitePortPool::reclaimOrphaned() {
    auto guard = db_->lock();

    auto stmt = db_->prepare(
        "UPDATE port_pool "
        "SET is_allocated = 0, allocated_at = NULL, allocated_to = NULL, stream_id = NULL "
        "WHERE is_allocated = 1 AND ("
        "  stream_id IS NULL OR NOT EXISTS ("
        "    SELECT 1 FROM dedicated_streams s "
        "    WHERE s.id = port_pool.stream_id AND s.port = port_pool.port "
        "      AND s.status != 'terminated'))");
    if (stmt.isError()) {
        return Result<uint32_t, PortPoolError>::error(storageFailure(stmt.error()));
    }
    auto ran = stmt.value().run();
    if (ran.isError()) {
        return Result<uint32_t, PortPoolError>::error(storageFailure(ran.error()));
    }

    const auto reclaimed = static_cast<uint32_t>(db_->changes());
    if (reclaimed > 0) {
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            "Reclaimed " + std::to_string(reclaimed) + " ports without a live owning stream");
    }
    return Result<uint32_t, PortPoolError>::success(reclaimed);
}

} // namespace storage
} // namespace streamprov
