// StreamProv - Dedicated stream provisioning service
// Stream Entity Store - Persistence of dedicated streams
//
// Streams are never deleted; terminated rows are kept for audit and
// statistics. At most one non-terminated stream exists per user and per
// port, backed by partial unique indexes.

#ifndef STREAMPROV_STORAGE_STREAM_STORE_HPP
#define STREAMPROV_STORAGE_STREAM_STORE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "streamprov/core/result.hpp"
#include "streamprov/core/types.hpp"
#include "streamprov/storage/database.hpp"
#include "streamprov/storage/records.hpp"

namespace streamprov {
namespace storage {

/**
 * @brief Interface for stream persistence.
 */
class IStreamStore {
public:
    virtual ~IStreamStore() = default;

    /**
     * @brief Insert a new stream.
     *
     * The id field of record is ignored.
     * @return The new stream id; ConstraintViolation when the user or the
     *         port already has a non-terminated stream
     */
    virtual core::Result<StreamId, StorageError> create(const StreamRecord& record) = 0;

    /**
     * @return NotFound when no such stream exists
     */
    virtual core::Result<StreamRecord, StorageError> findById(StreamId id) = 0;

    /**
     * @brief The user's non-terminated stream.
     * @return NotFound when the user has none
     */
    virtual core::Result<StreamRecord, StorageError> findActiveByUser(const UserId& userId) = 0;

    /**
     * @brief Streams in any of the given statuses, ordered by id.
     */
    virtual core::Result<std::vector<StreamRecord>, StorageError> listByStatus(
        const std::vector<StreamStatus>& statuses) = 0;

    /**
     * @brief Overwrite the configuration, status and lifecycle columns.
     *
     * The liveness columns (live flag, listener counts, last connection)
     * are left to recordLiveness, except that a status other than active
     * clears the live flag and the current listener count.
     */
    virtual core::Result<void, StorageError> update(const StreamRecord& record) = 0;

    /**
     * @brief Record observed liveness of an active stream.
     *
     * Touches only the liveness columns and only while the stream is
     * active, so it cannot undo a concurrent lifecycle transition. The
     * stored peak never decreases.
     *
     * @return true when the row was updated
     */
    virtual core::Result<bool, StorageError> recordLiveness(
        StreamId id, bool isLive, uint32_t currentListeners,
        std::optional<TimePoint> lastConnectionAt) = 0;
};

class SqliteStreamStore : public IStreamStore {
public:
    explicit SqliteStreamStore(std::shared_ptr<Database> db);

    core::Result<StreamId, StorageError> create(const StreamRecord& record) override;
    core::Result<StreamRecord, StorageError> findById(StreamId id) override;
    core::Result<StreamRecord, StorageError> findActiveByUser(const UserId& userId) override;
    core::Result<std::vector<StreamRecord>, StorageError> listByStatus(
        const std::vector<StreamStatus>& statuses) override;
    core::Result<void, StorageError> update(const StreamRecord& record) override;
    core::Result<bool, StorageError> recordLiveness(
        StreamId id, bool isLive, uint32_t currentListeners,
        std::optional<TimePoint> lastConnectionAt) override;

private:
    std::shared_ptr<Database> db_;
};

} // namespace storage
} // namespace streamprov

#endif // STREAMPROV_STORAGE_STREAM_STORE_HPP
