// StreamProv - Dedicated stream provisioning service
// Provisioning Coordinator implementation

#include "streamprov/provisioning/provisioning_coordinator.hpp"

#include "streamprov/provisioning/request_validator.hpp"

namespace streamprov {
namespace provisioning {

using core::Result;
using core::LifecycleEventType;
using storage::StorageError;

namespace {

const char* const CATEGORY = "Coordinator";

ProvisioningError persistenceFailure(const std::string& what, const StorageError& error) {
    return ProvisioningError(ProvisioningError::Code::PersistenceFailed, what + ": " + error.message);
}

ProvisioningError invalidTransition(const std::string& action, StreamStatus from) {
    return ProvisioningError(ProvisioningError::Code::InvalidTransition,
                             std::string("Cannot ") + action + " a stream in status " +
                             storage::streamStatusToString(from));
}

ProvisioningError notFound(StreamId streamId) {
    return ProvisioningError(ProvisioningError::Code::NotFound,
                             "Stream " + std::to_string(streamId) + " not found");
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

ProvisioningCoordinator::ProvisioningCoordinator(
    CoordinatorSettings settings,
    std::shared_ptr<storage::IPortPool> portPool,
    std::shared_ptr<storage::IStreamStore> streamStore,
    std::shared_ptr<shoutcast::IStreamingServerClient> serverClient,
    std::shared_ptr<core::StructuredLogger> logger)
    : settings_(std::move(settings))
    , portPool_(std::move(portPool))
    , streamStore_(std::move(streamStore))
    , serverClient_(std::move(serverClient))
    , logger_(std::move(logger))
    , credentials_(settings_.secretLength)
{
}

void ProvisioningCoordinator::setProvisionedCallback(ProvisionedCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    provisionedCallback_ = std::move(callback);
}

void ProvisioningCoordinator::setStoppedCallback(StoppedCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    stoppedCallback_ = std::move(callback);
}

// =============================================================================
// Provision
// =============================================================================

Result<ProvisionOutcome, ProvisioningError> ProvisioningCoordinator::provision(
    const ProvisionRequest& request)
{
    auto valid = validateProvisionRequest(request);
    if (valid.isError()) {
        return Result<ProvisionOutcome, ProvisioningError>::error(valid.error());
    }

    auto existing = streamStore_->findActiveByUser(request.userId);
    if (existing.isSuccess()) {
        STREAMPROV_LOG_INFO(logger_, CATEGORY,
            "User " + request.userId + " already has stream " +
            std::to_string(existing.value().id));
        return Result<ProvisionOutcome, ProvisioningError>::success(
            makeOutcome(ProvisionDisposition::AlreadyProvisioned, std::move(existing.value())));
    }
    if (existing.error().code != StorageError::Code::NotFound) {
        return Result<ProvisionOutcome, ProvisioningError>::error(
            persistenceFailure("Stream lookup failed", existing.error()));
    }

    StreamCredentials secrets;
    {
        std::lock_guard<std::mutex> lock(credentialMutex_);
        auto generated = credentials_.generate();
        if (generated.isError()) {
            return Result<ProvisionOutcome, ProvisioningError>::error(
                ProvisioningError(ProvisioningError::Code::PersistenceFailed,
                                  "Credential generation failed: " + generated.error().message));
        }
        secrets = std::move(generated.value());
    }

    StreamRecord stream;
    stream.userId = request.userId;
    stream.stationId = request.stationId;
    stream.serverId = settings_.serverId;
    stream.sourcePassword = std::move(secrets.sourcePassword);
    stream.adminPassword = std::move(secrets.adminPassword);
    stream.title = request.title;
    stream.description = request.description.value_or("");
    stream.genre = request.genre.value_or(settings_.defaultGenre);
    stream.bitrate = request.bitrate.value_or(settings_.defaultBitrate);
    stream.maxListeners = request.maxListeners.value_or(settings_.defaultMaxListeners);
    stream.sampleRate = settings_.defaultSampleRate;
    stream.publicServer = settings_.defaultPublicServer;
    stream.status = StreamStatus::Provisioning;
    stream.createdAt = core::SystemClock::now();

    // Port claim, stream insert and binding commit together or not at all.
    std::optional<StorageError> createError;
    auto claimed = portPool_->allocateFor(request.userId,
        [&](PortNumber port) -> Result<StreamId, StorageError> {
            stream.port = port;
            auto created = streamStore_->create(stream);
            if (created.isError()) {
                createError = created.error();
            }
            return created;
        });

    if (claimed.isError()) {
        const storage::PortPoolError& error = claimed.error();
        if (error.code == storage::PortPoolError::Code::NoPortsAvailable) {
            return Result<ProvisionOutcome, ProvisioningError>::error(
                ProvisioningError(ProvisioningError::Code::NoCapacity,
                                  "No ports available for dedicated streams"));
        }
        if (createError && createError->code == StorageError::Code::ConstraintViolation) {
            // A concurrent request for the same user won the insert.
            auto winner = streamStore_->findActiveByUser(request.userId);
            if (winner.isSuccess()) {
                return Result<ProvisionOutcome, ProvisioningError>::success(
                    makeOutcome(ProvisionDisposition::AlreadyProvisioned, std::move(winner.value())));
            }
        }
        logFailure("Stream persistence failed: " + error.message, stream,
                   storage::toErrorCode(error.code));
        return Result<ProvisionOutcome, ProvisioningError>::error(
            ProvisioningError(ProvisioningError::Code::PersistenceFailed,
                              "Stream persistence failed: " + error.message));
    }
    stream.port = claimed.value().port;
    stream.id = claimed.value().streamId;
    const PortNumber port = stream.port;

    if (logger_) {
        logger_->logLifecycleEvent(LifecycleEventType::Provisioned, stream.id, stream.userId, port);
    }

    std::optional<shoutcast::StreamingServerError> externalError;
    Result<StreamRecord, ProvisioningError> configured = [&]() {
        std::lock_guard<std::mutex> lock(streamLock(stream.id));
        return configureExternal(stream, externalError);
    }();
    if (configured.isError()) {
        // The stream and its port are committed; reconciliation finishes the job.
        ProvisionOutcome pending = makeOutcome(ProvisionDisposition::CreatedPendingConfiguration,
                                               std::move(stream));
        pending.externalError = configured.error().message;
        notifyProvisioned(pending.stream);
        return Result<ProvisionOutcome, ProvisioningError>::success(std::move(pending));
    }

    ProvisionOutcome outcome = makeOutcome(
        externalError ? ProvisionDisposition::CreatedPendingConfiguration
                      : ProvisionDisposition::Created,
        std::move(configured.value()));
    if (externalError) {
        outcome.externalError = externalError->message;
    }

    notifyProvisioned(outcome.stream);
    return Result<ProvisionOutcome, ProvisioningError>::success(std::move(outcome));
}

// =============================================================================
// Lifecycle transitions
// =============================================================================

Result<StreamRecord, ProvisioningError> ProvisioningCoordinator::suspend(
    StreamId streamId, const std::string& reason, const std::optional<UserId>& requester)
{
    std::unique_lock<std::mutex> lock(streamLock(streamId));

    auto loaded = loadOwned(streamId, requester);
    if (loaded.isError()) {
        return loaded;
    }
    StreamRecord stream = std::move(loaded.value());

    if (stream.status != StreamStatus::Active) {
        return Result<StreamRecord, ProvisioningError>::error(invalidTransition("suspend", stream.status));
    }

    if (settings_.kickSourceOnSuspend) {
        auto kicked = serverClient_->kickSource(stream.port);
        if (kicked.isError()) {
            STREAMPROV_LOG_WARNING(logger_, CATEGORY,
                "Could not disconnect source of stream " + std::to_string(stream.id) + ": " +
                kicked.error().message);
        }
    }

    stream.status = StreamStatus::Suspended;
    stream.isLive = false;
    stream.currentListeners = 0;
    stream.suspendedAt = core::SystemClock::now();
    stream.suspensionReason = reason;

    auto saved = persist(stream);
    if (saved.isError()) {
        return Result<StreamRecord, ProvisioningError>::error(saved.error());
    }

    if (logger_) {
        logger_->logLifecycleEvent(LifecycleEventType::Suspended, stream.id, stream.userId,
                                   stream.port, reason);
    }

    lock.unlock();
    notifyStopped(stream, LifecycleEventType::Suspended);
    return Result<StreamRecord, ProvisioningError>::success(std::move(stream));
}

Result<StreamRecord, ProvisioningError> ProvisioningCoordinator::resume(
    StreamId streamId, const std::optional<UserId>& requester)
{
    std::lock_guard<std::mutex> lock(streamLock(streamId));

    auto loaded = loadOwned(streamId, requester);
    if (loaded.isError()) {
        return loaded;
    }
    StreamRecord stream = std::move(loaded.value());

    if (stream.status != StreamStatus::Suspended) {
        return Result<StreamRecord, ProvisioningError>::error(invalidTransition("resume", stream.status));
    }

    stream.status = StreamStatus::Active;
    stream.suspendedAt.reset();
    stream.suspensionReason.clear();
    if (!stream.activatedAt) {
        stream.activatedAt = core::SystemClock::now();
    }

    auto saved = persist(stream);
    if (saved.isError()) {
        return Result<StreamRecord, ProvisioningError>::error(saved.error());
    }
    if (logger_) {
        logger_->logLifecycleEvent(LifecycleEventType::Resumed, stream.id, stream.userId, stream.port);
    }

    // Changes made while suspended are pushed now.
    if (stream.pendingExternalSync) {
        std::optional<shoutcast::StreamingServerError> externalError;
        return configureExternal(std::move(stream), externalError);
    }
    return Result<StreamRecord, ProvisioningError>::success(std::move(stream));
}

Result<StreamRecord, ProvisioningError> ProvisioningCoordinator::terminate(
    StreamId streamId, const std::optional<UserId>& requester)
{
    std::unique_lock<std::mutex> lock(streamLock(streamId));

    auto loaded = loadOwned(streamId, requester);
    if (loaded.isError()) {
        return loaded;
    }
    StreamRecord stream = std::move(loaded.value());

    if (stream.status == StreamStatus::Terminated) {
        // A previous attempt may have stopped before returning the port.
        releasePortIfOwned(stream);
        return Result<StreamRecord, ProvisioningError>::success(std::move(stream));
    }

    auto removed = serverClient_->removeStream(stream.port);
    if (removed.isError()) {
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            "Streaming server did not remove stream " + std::to_string(stream.id) + ": " +
            removed.error().message);
    }

    stream.status = StreamStatus::Terminated;
    stream.isLive = false;
    stream.currentListeners = 0;
    stream.terminatedAt = core::SystemClock::now();

    auto saved = persist(stream);
    if (saved.isError()) {
        return Result<StreamRecord, ProvisioningError>::error(saved.error());
    }

    if (logger_) {
        logger_->logLifecycleEvent(LifecycleEventType::Terminated, stream.id, stream.userId, stream.port);
    }
    releasePortIfOwned(stream);

    lock.unlock();
    notifyStopped(stream, LifecycleEventType::Terminated);
    return Result<StreamRecord, ProvisioningError>::success(std::move(stream));
}

Result<StreamRecord, ProvisioningError> ProvisioningCoordinator::update(
    StreamId streamId, const StreamUpdate& change, const std::optional<UserId>& requester)
{
    std::lock_guard<std::mutex> lock(streamLock(streamId));

    auto loaded = loadOwned(streamId, requester);
    if (loaded.isError()) {
        return loaded;
    }
    StreamRecord stream = std::move(loaded.value());

    if (stream.status == StreamStatus::Terminated) {
        return Result<StreamRecord, ProvisioningError>::error(invalidTransition("update", stream.status));
    }
    auto valid = validateStreamUpdate(change);
    if (valid.isError()) {
        return Result<StreamRecord, ProvisioningError>::error(valid.error());
    }
    if (change.empty()) {
        return Result<StreamRecord, ProvisioningError>::success(std::move(stream));
    }

    bool configChanged = false;
    bool metadataChanged = false;

    if (change.title && *change.title != stream.title) {
        stream.title = *change.title;
        metadataChanged = true;
    }
    if (change.genre && *change.genre != stream.genre) {
        stream.genre = *change.genre;
        metadataChanged = true;
    }
    if (change.description) {
        stream.description = *change.description;
    }
    if (change.bitrate && *change.bitrate != stream.bitrate) {
        stream.bitrate = *change.bitrate;
        configChanged = true;
    }
    if (change.maxListeners && *change.maxListeners != stream.maxListeners) {
        stream.maxListeners = *change.maxListeners;
        configChanged = true;
    }
    if (change.publicServer && *change.publicServer != stream.publicServer) {
        stream.publicServer = *change.publicServer;
        configChanged = true;
    }

    if (configChanged) {
        stream.configVersion++;
    }
    const bool pushNow = stream.status == StreamStatus::Active && (configChanged || metadataChanged);
    if (stream.status == StreamStatus::Suspended && (configChanged || metadataChanged)) {
        stream.pendingExternalSync = true;
    }

    auto saved = persist(stream);
    if (saved.isError()) {
        return Result<StreamRecord, ProvisioningError>::error(saved.error());
    }
    if (logger_) {
        logger_->logLifecycleEvent(LifecycleEventType::Updated, stream.id, stream.userId, stream.port,
                                   "config_version=" + std::to_string(stream.configVersion));
    }

    if (!pushNow) {
        return Result<StreamRecord, ProvisioningError>::success(std::move(stream));
    }

    if (configChanged) {
        std::optional<shoutcast::StreamingServerError> externalError;
        auto configured = configureExternal(stream, externalError);
        if (configured.isError()) {
            return configured;
        }
        stream = std::move(configured.value());
        if (externalError) {
            return Result<StreamRecord, ProvisioningError>::success(std::move(stream));
        }
    }

    if (metadataChanged) {
        shoutcast::MetadataUpdate metadata;
        metadata.title = stream.title;
        metadata.genre = stream.genre;
        auto pushed = serverClient_->updateMetadata(stream.port, metadata);
        if (pushed.isError()) {
            STREAMPROV_LOG_WARNING(logger_, CATEGORY,
                "Metadata update for stream " + std::to_string(stream.id) +
                " not applied: " + pushed.error().message);
            stream.pendingExternalSync = true;
            stream.lastError = pushed.error().message;
            auto flagged = persist(stream);
            if (flagged.isError()) {
                return Result<StreamRecord, ProvisioningError>::error(flagged.error());
            }
        }
    }
    return Result<StreamRecord, ProvisioningError>::success(std::move(stream));
}

Result<StreamRecord, ProvisioningError> ProvisioningCoordinator::retryConfiguration(
    StreamId streamId, const std::optional<UserId>& requester)
{
    std::lock_guard<std::mutex> lock(streamLock(streamId));

    auto loaded = loadOwned(streamId, requester);
    if (loaded.isError()) {
        return loaded;
    }
    StreamRecord stream = std::move(loaded.value());

    const bool retryable = stream.status == StreamStatus::Provisioning ||
                           stream.status == StreamStatus::Error ||
                           (stream.status == StreamStatus::Active && stream.pendingExternalSync);
    if (!retryable) {
        return Result<StreamRecord, ProvisioningError>::error(
            invalidTransition("retry configuration of", stream.status));
    }

    const bool wasActive = stream.status == StreamStatus::Active;

    std::optional<shoutcast::StreamingServerError> externalError;
    auto configured = configureExternal(std::move(stream), externalError);
    if (configured.isError()) {
        return configured;
    }
    if (externalError) {
        return Result<StreamRecord, ProvisioningError>::error(externalFailure(*externalError));
    }

    if (wasActive) {
        shoutcast::MetadataUpdate metadata;
        metadata.title = configured.value().title;
        metadata.genre = configured.value().genre;
        auto pushed = serverClient_->updateMetadata(configured.value().port, metadata);
        if (pushed.isError()) {
            STREAMPROV_LOG_WARNING(logger_, CATEGORY,
                "Metadata refresh for stream " + std::to_string(streamId) + " failed: " +
                pushed.error().message);
        }
    }
    return configured;
}

Result<StreamRecord, ProvisioningError> ProvisioningCoordinator::markConfigurationLost(
    StreamId streamId, const std::string& reason)
{
    std::lock_guard<std::mutex> lock(streamLock(streamId));

    auto loaded = loadOwned(streamId, std::nullopt);
    if (loaded.isError()) {
        return loaded;
    }
    StreamRecord stream = std::move(loaded.value());
    if (stream.status != StreamStatus::Active) {
        return Result<StreamRecord, ProvisioningError>::success(std::move(stream));
    }

    stream.status = StreamStatus::Error;
    stream.isLive = false;
    stream.currentListeners = 0;
    stream.lastError = reason;

    auto saved = persist(stream);
    if (saved.isError()) {
        return Result<StreamRecord, ProvisioningError>::error(saved.error());
    }
    if (logger_) {
        logger_->logLifecycleEvent(LifecycleEventType::ConfigurationFailed, stream.id, stream.userId,
                                   stream.port, reason);
    }
    return Result<StreamRecord, ProvisioningError>::success(std::move(stream));
}

// =============================================================================
// Queries and pass-throughs
// =============================================================================

Result<StreamRecord, ProvisioningError> ProvisioningCoordinator::getStream(
    StreamId streamId, const std::optional<UserId>& requester)
{
    return loadOwned(streamId, requester);
}

Result<StreamRecord, ProvisioningError> ProvisioningCoordinator::findUserStream(const UserId& userId) {
    auto found = streamStore_->findActiveByUser(userId);
    if (found.isError()) {
        if (found.error().code == StorageError::Code::NotFound) {
            return Result<StreamRecord, ProvisioningError>::error(
                ProvisioningError(ProvisioningError::Code::NotFound,
                                  "User " + userId + " has no dedicated stream"));
        }
        return Result<StreamRecord, ProvisioningError>::error(
            persistenceFailure("Stream lookup failed", found.error()));
    }
    return Result<StreamRecord, ProvisioningError>::success(std::move(found.value()));
}

Result<void, ProvisioningError> ProvisioningCoordinator::setSongTitle(
    StreamId streamId, const std::string& song, const std::optional<UserId>& requester)
{
    auto loaded = loadOwned(streamId, requester);
    if (loaded.isError()) {
        return Result<void, ProvisioningError>::error(loaded.error());
    }
    if (loaded.value().status != StreamStatus::Active) {
        return Result<void, ProvisioningError>::error(
            invalidTransition("set the song title of", loaded.value().status));
    }
    auto pushed = serverClient_->setSongTitle(loaded.value().port, song);
    if (pushed.isError()) {
        return Result<void, ProvisioningError>::error(externalFailure(pushed.error()));
    }
    return Result<void, ProvisioningError>::success();
}

Result<std::vector<shoutcast::ListenerInfo>, ProvisioningError> ProvisioningCoordinator::listListeners(
    StreamId streamId, const std::optional<UserId>& requester)
{
    using ListenersResult = Result<std::vector<shoutcast::ListenerInfo>, ProvisioningError>;

    auto loaded = loadOwned(streamId, requester);
    if (loaded.isError()) {
        return ListenersResult::error(loaded.error());
    }
    if (loaded.value().status != StreamStatus::Active) {
        return ListenersResult::error(invalidTransition("list listeners of", loaded.value().status));
    }
    auto listeners = serverClient_->getListeners(loaded.value().port);
    if (listeners.isError()) {
        return ListenersResult::error(externalFailure(listeners.error()));
    }
    return ListenersResult::success(std::move(listeners.value()));
}

Result<void, ProvisioningError> ProvisioningCoordinator::kickListener(
    StreamId streamId, const std::string& listenerUid, const std::optional<UserId>& requester)
{
    auto loaded = loadOwned(streamId, requester);
    if (loaded.isError()) {
        return Result<void, ProvisioningError>::error(loaded.error());
    }
    if (loaded.value().status != StreamStatus::Active) {
        return Result<void, ProvisioningError>::error(
            invalidTransition("kick listeners of", loaded.value().status));
    }
    auto kicked = serverClient_->kickListener(loaded.value().port, listenerUid);
    if (kicked.isError()) {
        return Result<void, ProvisioningError>::error(externalFailure(kicked.error()));
    }
    return Result<void, ProvisioningError>::success();
}

ConnectionDetails ProvisioningCoordinator::connectionDetails(const StreamRecord& stream) const {
    ConnectionDetails details;
    details.host = settings_.publicHost;
    details.port = stream.port;
    details.sourcePassword = stream.sourcePassword;
    details.adminPassword = stream.adminPassword;
    details.listenerUrl = "http://" + settings_.publicHost + ":" + std::to_string(stream.port);
    return details;
}

// =============================================================================
// Helpers
// =============================================================================

std::mutex& ProvisioningCoordinator::streamLock(StreamId streamId) {
    return streamLocks_[static_cast<uint64_t>(streamId) % LOCK_STRIPES];
}

Result<StreamRecord, ProvisioningError> ProvisioningCoordinator::loadOwned(
    StreamId streamId, const std::optional<UserId>& requester)
{
    auto found = streamStore_->findById(streamId);
    if (found.isError()) {
        if (found.error().code == StorageError::Code::NotFound) {
            return Result<StreamRecord, ProvisioningError>::error(notFound(streamId));
        }
        return Result<StreamRecord, ProvisioningError>::error(
            persistenceFailure("Stream lookup failed", found.error()));
    }
    if (requester && *requester != found.value().userId) {
        return Result<StreamRecord, ProvisioningError>::error(notFound(streamId));
    }
    return Result<StreamRecord, ProvisioningError>::success(std::move(found.value()));
}

Result<StreamRecord, ProvisioningError> ProvisioningCoordinator::configureExternal(
    StreamRecord stream, std::optional<shoutcast::StreamingServerError>& externalError)
{
    externalError.reset();

    auto created = serverClient_->createStream(serverConfig(stream));
    if (created.isSuccess()) {
        if (stream.status != StreamStatus::Active && stream.status != StreamStatus::Suspended) {
            stream.status = StreamStatus::Active;
        }
        if (!stream.activatedAt) {
            stream.activatedAt = core::SystemClock::now();
        }
        stream.pendingExternalSync = false;
        stream.lastError.clear();
    } else {
        externalError = created.error();
        if (stream.status == StreamStatus::Provisioning || stream.status == StreamStatus::Error) {
            stream.status = StreamStatus::Error;
        } else {
            stream.pendingExternalSync = true;
        }
        stream.lastError = created.error().message;
    }

    auto saved = persist(stream);
    if (saved.isError()) {
        logFailure("Could not record configuration outcome: " + saved.error().message, stream,
                   core::ErrorCode::StorageError);
        return Result<StreamRecord, ProvisioningError>::error(saved.error());
    }

    if (logger_) {
        if (externalError) {
            core::LogContext ctx;
            ctx.streamId = stream.id;
            ctx.userId = stream.userId;
            ctx.port = stream.port;
            ctx.errorCode = static_cast<int32_t>(shoutcast::toErrorCode(externalError->code));
            logger_->errorWithContext("External configuration failed: " + externalError->message,
                                      ctx, CATEGORY);
            logger_->logLifecycleEvent(LifecycleEventType::ConfigurationFailed, stream.id,
                                       stream.userId, stream.port, externalError->message);
        } else {
            logger_->logLifecycleEvent(LifecycleEventType::Activated, stream.id, stream.userId,
                                       stream.port,
                                       "config_version=" + std::to_string(stream.configVersion));
        }
    }
    return Result<StreamRecord, ProvisioningError>::success(std::move(stream));
}

Result<void, ProvisioningError> ProvisioningCoordinator::persist(const StreamRecord& stream) {
    auto saved = streamStore_->update(stream);
    if (saved.isError()) {
        return Result<void, ProvisioningError>::error(
            persistenceFailure("Stream " + std::to_string(stream.id) + " update failed", saved.error()));
    }
    return Result<void, ProvisioningError>::success();
}

void ProvisioningCoordinator::releasePortIfOwned(const StreamRecord& stream) {
    auto port = portPool_->getPort(stream.port);
    if (port.isError()) {
        if (port.error().code != storage::PortPoolError::Code::NotFound) {
            logFailure("Port lookup failed during release: " + port.error().message, stream,
                       storage::toErrorCode(port.error().code));
        }
        return;
    }
    const storage::PortRecord& record = port.value();
    if (!record.allocated || record.streamId != std::optional<StreamId>(stream.id)) {
        return;
    }

    auto released = portPool_->release(stream.port);
    if (released.isError()) {
        logFailure("Port release failed: " + released.error().message, stream,
                   storage::toErrorCode(released.error().code));
        return;
    }
    if (logger_) {
        logger_->logLifecycleEvent(LifecycleEventType::PortReleased, stream.id, stream.userId,
                                   stream.port);
    }
}

shoutcast::StreamServerConfig ProvisioningCoordinator::serverConfig(const StreamRecord& stream) const {
    shoutcast::StreamServerConfig config;
    config.sid = stream.port;
    config.sourcePassword = stream.sourcePassword;
    config.adminPassword = stream.adminPassword;
    config.maxListeners = stream.maxListeners;
    config.bitrateKbps = stream.bitrate;
    config.sampleRate = stream.sampleRate;
    config.title = stream.title;
    config.genre = stream.genre;
    config.publicServer = stream.publicServer;
    return config;
}

ProvisioningError ProvisioningCoordinator::externalFailure(
    const shoutcast::StreamingServerError& error) const
{
    if (error.isTransportFailure()) {
        return ProvisioningError(ProvisioningError::Code::Unreachable,
                                 "Streaming server unreachable: " + error.message);
    }
    return ProvisioningError(ProvisioningError::Code::ExternalConfigurationFailed, error.message);
}

void ProvisioningCoordinator::notifyProvisioned(const StreamRecord& stream) {
    ProvisionedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = provisionedCallback_;
    }
    if (callback) {
        callback(stream);
    }
}

// Callers must not hold a stream lock: callbacks may re-enter the coordinator.
void ProvisioningCoordinator::notifyStopped(const StreamRecord& stream, LifecycleEventType event) {
    StoppedCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = stoppedCallback_;
    }
    if (callback) {
        callback(stream, event);
    }
}

void ProvisioningCoordinator::logFailure(
    const std::string& message, const StreamRecord& stream, core::ErrorCode code)
{
    if (!logger_) {
        return;
    }
    core::LogContext ctx;
    ctx.streamId = stream.id;
    ctx.userId = stream.userId;
    ctx.port = stream.port;
    ctx.errorCode = static_cast<int32_t>(code);
    logger_->errorWithContext(message, ctx, CATEGORY);
}

ProvisionOutcome ProvisioningCoordinator::makeOutcome(
    ProvisionDisposition disposition, StreamRecord stream) const
{
    ProvisionOutcome outcome;
    outcome.disposition = disposition;
    outcome.connection = connectionDetails(stream);
    outcome.stream = std::move(stream);
    return outcome;
}

} // namespace provisioning
} // namespace streamprov
