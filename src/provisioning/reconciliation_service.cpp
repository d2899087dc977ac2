// StreamProv - Dedicated stream provisioning service
// Reconciliation Service implementation

#include "streamprov/provisioning/reconciliation_service.hpp"

namespace streamprov {
namespace provisioning {

using core::Result;

namespace {

const char* const CATEGORY = "Reconciliation";

Result<void, TaskError> retryable(const std::string& message) {
    return Result<void, TaskError>::error(TaskError(TaskError::Code::Retryable, message));
}

} // anonymous namespace

ReconciliationService::ReconciliationService(
    ReconciliationSettings settings,
    std::shared_ptr<ProvisioningCoordinator> coordinator,
    std::shared_ptr<storage::IStreamStore> streamStore,
    std::shared_ptr<shoutcast::IStreamingServerClient> serverClient,
    std::shared_ptr<TaskQueue> queue,
    std::shared_ptr<core::StructuredLogger> logger)
    : settings_(settings)
    , coordinator_(std::move(coordinator))
    , streamStore_(std::move(streamStore))
    , serverClient_(std::move(serverClient))
    , queue_(std::move(queue))
    , logger_(std::move(logger))
{
}

Result<TaskId, TaskError> ReconciliationService::scheduleVerification(StreamId streamId) {
    TaskOptions options;
    options.name = "verify-stream-" + std::to_string(streamId);
    options.maxAttempts = settings_.maxAttempts;
    options.retryDelay = settings_.retryDelay;

    return queue_->submit([this, streamId]() { return verify(streamId); }, options);
}

Result<uint32_t, TaskError> ReconciliationService::reconcileAll() {
    auto streams = streamStore_->listByStatus({
        StreamStatus::Provisioning, StreamStatus::Error, StreamStatus::Active});
    if (streams.isError()) {
        return Result<uint32_t, TaskError>::error(
            TaskError(TaskError::Code::Failed, "Stream listing failed: " + streams.error().message));
    }

    uint32_t queued = 0;
    for (const auto& stream : streams.value()) {
        auto submitted = scheduleVerification(stream.id);
        if (submitted.isError()) {
            return Result<uint32_t, TaskError>::error(submitted.error());
        }
        queued++;
    }

    STREAMPROV_LOG_INFO(logger_, CATEGORY,
        "Queued verification for " + std::to_string(queued) + " streams");
    return Result<uint32_t, TaskError>::success(queued);
}

Result<void, TaskError> ReconciliationService::verify(StreamId streamId) {
    auto loaded = coordinator_->getStream(streamId);
    if (loaded.isError()) {
        if (loaded.error().code == ProvisioningError::Code::NotFound) {
            return Result<void, TaskError>::error(
                TaskError(TaskError::Code::Failed, loaded.error().message));
        }
        return retryable(loaded.error().message);
    }
    const StreamRecord& stream = loaded.value();

    switch (stream.status) {
        case StreamStatus::Suspended:
        case StreamStatus::Terminated:
            return Result<void, TaskError>::success();

        case StreamStatus::Provisioning:
        case StreamStatus::Error: {
            auto retried = coordinator_->retryConfiguration(streamId);
            if (retried.isError()) {
                if (retried.error().code == ProvisioningError::Code::InvalidTransition) {
                    // Another path already moved the stream on.
                    return Result<void, TaskError>::success();
                }
                return retryable(retried.error().message);
            }
            STREAMPROV_LOG_INFO(logger_, CATEGORY,
                "Stream " + std::to_string(streamId) + " configured on retry");
            return Result<void, TaskError>::success();
        }

        case StreamStatus::Active: {
            if (stream.pendingExternalSync) {
                auto synced = coordinator_->retryConfiguration(streamId);
                if (synced.isError() &&
                    synced.error().code != ProvisioningError::Code::InvalidTransition) {
                    return retryable(synced.error().message);
                }
                return Result<void, TaskError>::success();
            }

            auto info = serverClient_->getStreamInfo(stream.port);
            if (info.isSuccess()) {
                return Result<void, TaskError>::success();
            }
            if (info.error().code == shoutcast::StreamingServerError::Code::NotFound) {
                auto marked = coordinator_->markConfigurationLost(
                    streamId, "Streaming server does not report the stream");
                if (marked.isError()) {
                    return retryable(marked.error().message);
                }
                return retryable("Stream " + std::to_string(streamId) +
                                 " missing on streaming server");
            }
            return retryable(info.error().message);
        }
    }
    return Result<void, TaskError>::success();
}

} // namespace provisioning
} // namespace streamprov
