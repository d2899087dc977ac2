// StreamProv - Dedicated stream provisioning service
// Port Pool - Fixed-range registry of allocatable ports
//
// Responsibilities:
// - Create one row per port in the configured range, idempotently
// - Atomically claim the lowest free port
// - Release ports back to the pool (idempotent)
// - Record which stream owns an allocated port
// - Reclaim ports left without a live owner by an interrupted process

#ifndef STREAMPROV_STORAGE_PORT_POOL_HPP
#define STREAMPROV_STORAGE_PORT_POOL_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "streamprov/core/error_codes.hpp"
#include "streamprov/core/result.hpp"
#include "streamprov/core/structured_logger.hpp"
#include "streamprov/core/types.hpp"
#include "streamprov/storage/database.hpp"
#include "streamprov/storage/records.hpp"

namespace streamprov {
namespace storage {

struct PortPoolError {
    enum class Code {
        None,
        NoPortsAvailable,   ///< Every port in the pool is allocated
        NotFound,           ///< Port is not part of the pool
        InvalidRange,       ///< Range bounds rejected by initialize()
        StorageFailed,      ///< Underlying database error
        OwnerFailed         ///< Owner creation failed; the claim was rolled back
    };

    Code code = Code::None;
    std::string message;

    PortPoolError() = default;
    PortPoolError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
};

core::ErrorCode toErrorCode(PortPoolError::Code code);

/**
 * @brief Creates the stream that will own a freshly claimed port.
 */
using OwnerFactory = std::function<core::Result<StreamId, StorageError>(PortNumber)>;

struct PortBinding {
    PortNumber port = core::INVALID_PORT;
    StreamId streamId = core::INVALID_STREAM_ID;
};

/**
 * @brief Interface for the port pool.
 */
class IPortPool {
public:
    virtual ~IPortPool() = default;

    /**
     * @brief Ensure a row exists for every port in [rangeStart, rangeEnd].
     *
     * Existing rows, allocated or not, are left untouched.
     *
     * @return Number of rows added
     */
    virtual core::Result<uint32_t, PortPoolError> initialize(
        PortNumber rangeStart, PortNumber rangeEnd) = 0;

    /**
     * @brief Claim the lowest-numbered free port for requester.
     *
     * Two concurrent callers never receive the same port.
     */
    virtual core::Result<PortNumber, PortPoolError> allocate(const UserId& requester) = 0;

    /**
     * @brief Claim a port, create its owner and bind the two atomically.
     *
     * Either all three steps commit or none does, so an interrupted
     * process cannot leave a claimed port without an owning stream.
     *
     * @return NoPortsAvailable when the pool is exhausted; OwnerFailed
     *         when createOwner or the binding failed
     */
    virtual core::Result<PortBinding, PortPoolError> allocateFor(
        const UserId& requester, const OwnerFactory& createOwner) = 0;

    /**
     * @brief Return a port to the pool. Releasing a free port succeeds.
     */
    virtual core::Result<void, PortPoolError> release(PortNumber port) = 0;

    /**
     * @brief Record the stream that owns an allocated port.
     */
    virtual core::Result<void, PortPoolError> bindStream(PortNumber port, StreamId streamId) = 0;

    virtual core::Result<PortRecord, PortPoolError> getPort(PortNumber port) = 0;

    virtual core::Result<PoolStatus, PortPoolError> status() = 0;

    /**
     * @brief Free allocated ports whose owner is missing or terminated.
     *
     * Meant for startup, before any provisioning runs.
     * @return Number of ports returned to the pool
     */
    virtual core::Result<uint32_t, PortPoolError> reclaimOrphaned() = 0;
};

/**
 * @brief IPortPool on the port_pool table.
 *
 * Allocation is a single conditional UPDATE on the allocation flag, so
 * it stays correct across threads and across processes sharing the
 * database file.
 */
class SqlitePortPool : public IPortPool {
public:
    SqlitePortPool(
        std::shared_ptr<Database> db,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );

    core::Result<uint32_t, PortPoolError> initialize(
        PortNumber rangeStart, PortNumber rangeEnd) override;
    core::Result<PortNumber, PortPoolError> allocate(const UserId& requester) override;
    core::Result<PortBinding, PortPoolError> allocateFor(
        const UserId& requester, const OwnerFactory& createOwner) override;
    core::Result<void, PortPoolError> release(PortNumber port) override;
    core::Result<void, PortPoolError> bindStream(PortNumber port, StreamId streamId) override;
    core::Result<PortRecord, PortPoolError> getPort(PortNumber port) override;
    core::Result<PoolStatus, PortPoolError> status() override;
    core::Result<uint32_t, PortPoolError> reclaimOrphaned() override;

private:
    std::shared_ptr<Database> db_;
    std::shared_ptr<core::StructuredLogger> logger_;
};

} // namespace storage
} // namespace streamprov

#endif // STREAMPROV_STORAGE_PORT_POOL_HPP
