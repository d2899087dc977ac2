// StreamProv - Dedicated stream provisioning service
// Telemetry Store - Source sessions and monitoring samples
//
// Samples are append-only. A session is open from the moment a source
// connection is detected until it is closed with a disconnect reason.

#ifndef STREAMPROV_STORAGE_TELEMETRY_STORE_HPP
#define STREAMPROV_STORAGE_TELEMETRY_STORE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "streamprov/core/result.hpp"
#include "streamprov/core/types.hpp"
#include "streamprov/storage/database.hpp"
#include "streamprov/storage/records.hpp"

namespace streamprov {
namespace storage {

class TelemetryStore {
public:
    explicit TelemetryStore(std::shared_ptr<Database> db);

    core::Result<SessionId, StorageError> openSession(
        StreamId streamId, TimePoint startedAt, const std::string& encoder = "");

    /**
     * @brief The stream's open session, if any.
     */
    core::Result<std::optional<SessionRecord>, StorageError> findOpenSession(StreamId streamId);

    /**
     * @brief Raise the running peak and byte counters of an open session.
     *
     * The stored peak never decreases.
     */
    core::Result<void, StorageError> updateSession(
        SessionId sessionId, uint32_t peakListeners, uint64_t bytesTransferred);

    /**
     * @brief Close a session and compute its duration.
     * @return NotFound when the session does not exist or is already closed
     */
    core::Result<void, StorageError> closeSession(
        SessionId sessionId, TimePoint endedAt, const std::string& disconnectReason);

    core::Result<core::SampleId, StorageError> appendSample(const MonitoringSample& sample);

    /**
     * @brief Aggregate over sessions started at or after since.
     */
    core::Result<SessionSummary, StorageError> sessionSummary(StreamId streamId, TimePoint since);

    /**
     * @brief Most recent samples, newest first.
     */
    core::Result<std::vector<MonitoringSample>, StorageError> recentSamples(
        StreamId streamId, uint32_t limit);

    core::Result<std::vector<SessionRecord>, StorageError> sessionsSince(
        StreamId streamId, TimePoint since);

private:
    std::shared_ptr<Database> db_;
};

} // namespace storage
} // namespace streamprov

#endif // STREAMPROV_STORAGE_TELEMETRY_STORE_HPP
