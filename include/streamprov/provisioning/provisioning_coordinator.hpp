// StreamProv - Dedicated stream provisioning service
// Provisioning Coordinator - Dedicated stream lifecycle
//
// Responsibilities:
// - Provision: allocate port, generate credentials, persist, configure server
// - Suspend / resume / terminate / update transitions
// - Retry external configuration without reallocating
// - Keep port pool, stream store and streaming server consistent
//
// Failure policy:
// - Local failures after a port was claimed release the port
// - External failures never roll back local state; the stream is left
//   in a status from which configuration can be retried

#ifndef STREAMPROV_PROVISIONING_PROVISIONING_COORDINATOR_HPP
#define STREAMPROV_PROVISIONING_PROVISIONING_COORDINATOR_HPP

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "streamprov/core/result.hpp"
#include "streamprov/core/structured_logger.hpp"
#include "streamprov/core/types.hpp"
#include "streamprov/provisioning/credential_generator.hpp"
#include "streamprov/provisioning/stream_types.hpp"
#include "streamprov/shoutcast/streaming_server_client.hpp"
#include "streamprov/storage/port_pool.hpp"
#include "streamprov/storage/stream_store.hpp"

namespace streamprov {
namespace provisioning {

struct CoordinatorSettings {
    std::string publicHost = "localhost";   ///< Host encoders and listeners connect to
    core::ServerId serverId = core::INVALID_SERVER_ID;
    uint32_t defaultBitrate = 128;
    uint32_t defaultMaxListeners = 100;
    uint32_t defaultSampleRate = 44100;
    std::string defaultGenre = "Various";
    bool defaultPublicServer = true;
    bool kickSourceOnSuspend = false;
    size_t secretLength = MIN_SECRET_LENGTH;
};

/**
 * @brief Orchestrates the dedicated stream lifecycle.
 *
 * Thread-safe. Transitions on the same stream are serialized; different
 * streams proceed independently. Lifecycle operations accept an optional
 * requester: when given and not the owner, the stream is reported as
 * NotFound.
 *
 * @code
 * ProvisioningCoordinator coordinator(settings, portPool, streamStore, client, logger);
 *
 * ProvisionRequest request;
 * request.userId = "user-17";
 * request.title = "Night Shift";
 * auto outcome = coordinator.provision(request);
 * if (outcome.isSuccess()) {
 *     auto& details = outcome.value().connection;
 * }
 * @endcode
 */
class ProvisioningCoordinator {
public:
    /// Called after a new stream row was committed.
    using ProvisionedCallback = std::function<void(const StreamRecord&)>;

    /// Called after a stream stopped serving (suspended or terminated).
    /// Runs without any stream lock held.
    using StoppedCallback = std::function<void(const StreamRecord&, core::LifecycleEventType)>;

    ProvisioningCoordinator(
        CoordinatorSettings settings,
        std::shared_ptr<storage::IPortPool> portPool,
        std::shared_ptr<storage::IStreamStore> streamStore,
        std::shared_ptr<shoutcast::IStreamingServerClient> serverClient,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );

    ProvisioningCoordinator(const ProvisioningCoordinator&) = delete;
    ProvisioningCoordinator& operator=(const ProvisioningCoordinator&) = delete;

    /**
     * @brief Give the user a dedicated stream.
     *
     * Idempotent per user: a user with a non-terminated stream gets it
     * back with disposition AlreadyProvisioned and nothing is allocated.
     * A failed external configuration still returns the stream, with
     * disposition CreatedPendingConfiguration. So does a failure to record
     * the configuration outcome once the stream row is committed.
     *
     * @return NoCapacity when the pool is exhausted, InvalidRequest,
     *         PersistenceFailed (nothing was committed, the port is free)
     */
    core::Result<ProvisionOutcome, ProvisioningError> provision(const ProvisionRequest& request);

    /**
     * @brief active -> suspended. Port and credentials are kept.
     */
    core::Result<StreamRecord, ProvisioningError> suspend(
        StreamId streamId,
        const std::string& reason = "",
        const std::optional<UserId>& requester = std::nullopt);

    /**
     * @brief suspended -> active.
     */
    core::Result<StreamRecord, ProvisioningError> resume(
        StreamId streamId,
        const std::optional<UserId>& requester = std::nullopt);

    /**
     * @brief Any status -> terminated, releasing the port.
     *
     * Terminating a terminated stream succeeds without side effects on
     * a port that was already handed to another stream.
     */
    core::Result<StreamRecord, ProvisioningError> terminate(
        StreamId streamId,
        const std::optional<UserId>& requester = std::nullopt);

    /**
     * @brief Apply a partial change.
     *
     * The local change is committed first. A failed push to the
     * streaming server leaves pendingExternalSync set instead of
     * rolling back.
     */
    core::Result<StreamRecord, ProvisioningError> update(
        StreamId streamId,
        const StreamUpdate& change,
        const std::optional<UserId>& requester = std::nullopt);

    /**
     * @brief Re-run external configuration with the same port and credentials.
     *
     * Valid for provisioning and error streams, and for active streams
     * with a pending external sync.
     */
    core::Result<StreamRecord, ProvisioningError> retryConfiguration(
        StreamId streamId,
        const std::optional<UserId>& requester = std::nullopt);

    /**
     * @brief Move an active stream the server no longer reports to error.
     */
    core::Result<StreamRecord, ProvisioningError> markConfigurationLost(
        StreamId streamId, const std::string& reason);

    core::Result<StreamRecord, ProvisioningError> getStream(
        StreamId streamId,
        const std::optional<UserId>& requester = std::nullopt);

    /**
     * @brief The user's non-terminated stream.
     */
    core::Result<StreamRecord, ProvisioningError> findUserStream(const UserId& userId);

    core::Result<void, ProvisioningError> setSongTitle(
        StreamId streamId,
        const std::string& song,
        const std::optional<UserId>& requester = std::nullopt);

    core::Result<std::vector<shoutcast::ListenerInfo>, ProvisioningError> listListeners(
        StreamId streamId,
        const std::optional<UserId>& requester = std::nullopt);

    core::Result<void, ProvisioningError> kickListener(
        StreamId streamId,
        const std::string& listenerUid,
        const std::optional<UserId>& requester = std::nullopt);

    ConnectionDetails connectionDetails(const StreamRecord& stream) const;

    void setProvisionedCallback(ProvisionedCallback callback);
    void setStoppedCallback(StoppedCallback callback);

    const CoordinatorSettings& settings() const { return settings_; }

private:
    static constexpr size_t LOCK_STRIPES = 32;

    std::mutex& streamLock(StreamId streamId);

    core::Result<StreamRecord, ProvisioningError> loadOwned(
        StreamId streamId, const std::optional<UserId>& requester);

    /**
     * @brief Push the stream's configuration and record the outcome.
     *
     * Success makes the stream active; failure moves it to error.
     * Returns the persisted record and the external error, if any.
     */
    core::Result<StreamRecord, ProvisioningError> configureExternal(
        StreamRecord stream, std::optional<shoutcast::StreamingServerError>& externalError);

    core::Result<void, ProvisioningError> persist(const StreamRecord& stream);

    /**
     * @brief Release the stream's port if the pool still assigns it to this stream.
     */
    void releasePortIfOwned(const StreamRecord& stream);

    shoutcast::StreamServerConfig serverConfig(const StreamRecord& stream) const;

    ProvisioningError externalFailure(const shoutcast::StreamingServerError& error) const;

    void notifyProvisioned(const StreamRecord& stream);
    void notifyStopped(const StreamRecord& stream, core::LifecycleEventType event);

    void logFailure(const std::string& message, const StreamRecord& stream, core::ErrorCode code);

    ProvisionOutcome makeOutcome(ProvisionDisposition disposition, StreamRecord stream) const;

    CoordinatorSettings settings_;
    std::shared_ptr<storage::IPortPool> portPool_;
    std::shared_ptr<storage::IStreamStore> streamStore_;
    std::shared_ptr<shoutcast::IStreamingServerClient> serverClient_;
    std::shared_ptr<core::StructuredLogger> logger_;

    std::mutex credentialMutex_;
    CredentialGenerator credentials_;

    std::array<std::mutex, LOCK_STRIPES> streamLocks_;

    std::mutex callbackMutex_;
    ProvisionedCallback provisionedCallback_;
    StoppedCallback stoppedCallback_;
};

} // namespace provisioning
} // namespace streamprov

#endif // STREAMPROV_PROVISIONING_PROVISIONING_COORDINATOR_HPP
