// StreamProv - Dedicated stream provisioning service
// Reconciliation Service - Post-provision verification and resync
//
// Brings streams whose external configuration failed, or was lost, back
// in line with the streaming server, through the task queue so that
// every attempt is retried and reported.

#ifndef STREAMPROV_PROVISIONING_RECONCILIATION_SERVICE_HPP
#define STREAMPROV_PROVISIONING_RECONCILIATION_SERVICE_HPP

#include <chrono>
#include <cstdint>
#include <memory>

#include "streamprov/core/result.hpp"
#include "streamprov/core/structured_logger.hpp"
#include "streamprov/provisioning/provisioning_coordinator.hpp"
#include "streamprov/provisioning/task_queue.hpp"
#include "streamprov/shoutcast/streaming_server_client.hpp"
#include "streamprov/storage/stream_store.hpp"

namespace streamprov {
namespace provisioning {

struct ReconciliationSettings {
    uint32_t maxAttempts = 3;
    std::chrono::milliseconds retryDelay{2000};
};

class ReconciliationService {
public:
    ReconciliationService(
        ReconciliationSettings settings,
        std::shared_ptr<ProvisioningCoordinator> coordinator,
        std::shared_ptr<storage::IStreamStore> streamStore,
        std::shared_ptr<shoutcast::IStreamingServerClient> serverClient,
        std::shared_ptr<TaskQueue> queue,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );

    /**
     * @brief Queue a verification task for one stream.
     */
    core::Result<TaskId, TaskError> scheduleVerification(StreamId streamId);

    /**
     * @brief Queue a verification task for every non-terminated stream.
     * @return Number of tasks queued
     */
    core::Result<uint32_t, TaskError> reconcileAll();

    /**
     * @brief One verification pass for a stream, run synchronously.
     *
     * provisioning / error: retry external configuration.
     * active: confirm the server reports the stream, else mark it error.
     * suspended / terminated: nothing to do.
     *
     * @return Retryable failure when the stream is not yet in sync
     */
    core::Result<void, TaskError> verify(StreamId streamId);

private:
    ReconciliationSettings settings_;
    std::shared_ptr<ProvisioningCoordinator> coordinator_;
    std::shared_ptr<storage::IStreamStore> streamStore_;
    std::shared_ptr<shoutcast::IStreamingServerClient> serverClient_;
    std::shared_ptr<TaskQueue> queue_;
    std::shared_ptr<core::StructuredLogger> logger_;
};

} // namespace provisioning
} // namespace streamprov

#endif // STREAMPROV_PROVISIONING_RECONCILIATION_SERVICE_HPP
