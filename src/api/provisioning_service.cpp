// StreamProv - Dedicated stream provisioning service
// Provisioning Service implementation

#include "streamprov/api/provisioning_service.hpp"

#include "streamprov/core/http_client.hpp"
#include "streamprov/core/log_rotation.hpp"
#include "streamprov/shoutcast/shoutcast_client.hpp"
#include "streamprov/storage/schema.hpp"

namespace streamprov {
namespace api {

using core::Result;

namespace {

const char* const CATEGORY = "Service";

} // anonymous namespace

const char* serviceStateToString(ServiceState state) {
    switch (state) {
        case ServiceState::Uninitialized: return "uninitialized";
        case ServiceState::Initialized: return "initialized";
        case ServiceState::Running: return "running";
        case ServiceState::Stopped: return "stopped";
    }
    return "unknown";
}

ProvisioningService::ProvisioningService(
    std::shared_ptr<shoutcast::IStreamingServerClient> serverClient)
    : serverClient_(std::move(serverClient))
{
}

ProvisioningService::~ProvisioningService() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

Result<void, ServiceError> ProvisioningService::initialize(const core::Configuration& config) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (state_.load() != ServiceState::Uninitialized) {
        return Result<void, ServiceError>::error(
            ServiceError(ServiceError::Code::InvalidState, "Service is already initialized"));
    }
    config_ = config;

    buildLogger(config.logging);
    STREAMPROV_LOG_INFO(logger_, CATEGORY, "Initializing provisioning service");

    auto storage = openStorage(config);
    if (storage.isError()) {
        STREAMPROV_LOG_ERROR(logger_, CATEGORY, storage.error().message);
        return storage;
    }

    if (!serverClient_) {
        shoutcast::ShoutcastClientConfig clientConfig;
        clientConfig.hostname = config.streamingServer.hostname;
        clientConfig.adminPort = config.streamingServer.adminPort;
        clientConfig.adminPassword = config.streamingServer.adminPassword;
        clientConfig.configFilePath = config.streamingServer.configFilePath;
        clientConfig.requestTimeoutMs = config.streamingServer.requestTimeoutMs;
        clientConfig.circuitBreakerThreshold = config.streamingServer.circuitBreakerThreshold;
        clientConfig.circuitBreakerResetMs = config.streamingServer.circuitBreakerResetMs;
        serverClient_ = std::make_shared<shoutcast::ShoutcastClient>(
            clientConfig, std::make_shared<core::BeastHttpClient>(), logger_);
    }

    auto registered = registerServer(config.streamingServer);
    if (registered.isError()) {
        STREAMPROV_LOG_ERROR(logger_, CATEGORY, registered.error().message);
        return registered;
    }

    provisioning::CoordinatorSettings settings;
    settings.publicHost = config.streamingServer.effectivePublicHost();
    settings.serverId = serverId_;
    settings.defaultBitrate = config.defaults.bitrate;
    settings.defaultMaxListeners = config.defaults.maxListeners;
    settings.defaultSampleRate = config.defaults.sampleRate;
    settings.defaultGenre = config.defaults.genre;
    settings.defaultPublicServer = config.defaults.publicServer;
    settings.kickSourceOnSuspend = config.provisioning.kickSourceOnSuspend;
    coordinator_ = std::make_shared<provisioning::ProvisioningCoordinator>(
        settings, portPool_, streamStore_, serverClient_, logger_);

    taskQueue_ = std::make_shared<provisioning::TaskQueue>(
        config.provisioning.workerThreads, logger_);

    provisioning::ReconciliationSettings reconcileSettings;
    reconcileSettings.maxAttempts = config.provisioning.verificationMaxAttempts;
    reconcileSettings.retryDelay =
        std::chrono::milliseconds(config.provisioning.verificationRetryDelayMs);
    reconciliation_ = std::make_shared<provisioning::ReconciliationService>(
        reconcileSettings, coordinator_, streamStore_, serverClient_, taskQueue_, logger_);

    monitoring::MonitoringSettings monitorSettings;
    monitorSettings.sampleInterval = std::chrono::milliseconds(config.monitoring.sampleIntervalMs);
    monitorSettings.recentSampleLimit = config.monitoring.recentSampleLimit;
    monitorSettings.defaultStatsDays = config.monitoring.defaultStatsDays;
    monitor_ = std::make_shared<monitoring::MonitoringAggregator>(
        monitorSettings, streamStore_, telemetry_, serverClient_, registry_, serverId_, logger_);

    wireCallbacks(config.provisioning.verifyAfterProvision);

    state_.store(ServiceState::Initialized);
    STREAMPROV_LOG_INFO(logger_, CATEGORY, "Provisioning service initialized");
    return Result<void, ServiceError>::success();
}

Result<void, ServiceError> ProvisioningService::start() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    const ServiceState current = state_.load();
    if (current == ServiceState::Running) {
        return Result<void, ServiceError>::success();
    }
    if (current != ServiceState::Initialized) {
        return Result<void, ServiceError>::error(
            ServiceError(ServiceError::Code::InvalidState,
                         std::string("Cannot start from state ") + serviceStateToString(current)));
    }

    taskQueue_->start();
    if (config_.monitoring.enabled) {
        monitor_->start();
    }

    auto health = monitor_->checkServerHealth();
    if (health.isError()) {
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            "Server health check not recorded: " + health.error().message);
    }

    auto queued = reconciliation_->reconcileAll();
    if (queued.isError()) {
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            "Startup reconciliation not queued: " + queued.error().message);
    }

    state_.store(ServiceState::Running);
    STREAMPROV_LOG_INFO(logger_, CATEGORY, "Provisioning service running");
    return Result<void, ServiceError>::success();
}

void ProvisioningService::stop() {
    std::lock_guard<std::mutex> lock(stateMutex_);
    const ServiceState current = state_.load();
    if (current == ServiceState::Uninitialized || current == ServiceState::Stopped) {
        return;
    }

    STREAMPROV_LOG_INFO(logger_, CATEGORY, "Stopping provisioning service");

    // Monitoring first so no sample races the queue shutdown.
    if (monitor_) {
        monitor_->stop();
    }
    if (taskQueue_) {
        taskQueue_->shutdown();
        const auto stats = taskQueue_->getStatistics();
        STREAMPROV_LOG_INFO(logger_, CATEGORY,
            "Task queue stopped: " + std::to_string(stats.succeeded) + " succeeded, " +
            std::to_string(stats.failed) + " failed, " +
            std::to_string(stats.retried) + " retries");
    }

    state_.store(ServiceState::Stopped);
    STREAMPROV_LOG_INFO(logger_, CATEGORY, "Provisioning service stopped");
    if (logger_) {
        logger_->flush();
    }
}

ServiceState ProvisioningService::state() const {
    return state_.load();
}

// =============================================================================
// Component construction
// =============================================================================

void ProvisioningService::buildLogger(const core::LoggingConfig& logging) {
    logger_ = std::make_shared<core::StructuredLogger>();
    logger_->setLevel(logging.level);
    logger_->setJsonFormat(logging.enableJson);

    if (logging.enableConsole) {
        logger_->addSink(std::make_shared<core::ConsoleSink>());
    }
    if (logging.enableFile) {
        core::RotationPolicy policy;
        policy.maxFileSize = static_cast<uint64_t>(logging.maxFileSizeMB) * 1024 * 1024;
        policy.maxBackupFiles = logging.maxFiles;
        policy.compress = logging.compress;
        logger_->addSink(std::make_shared<core::FileSink>(logging.filePath, policy));
    }
}

Result<void, ServiceError> ProvisioningService::openStorage(const core::Configuration& config) {
    auto opened = storage::Database::open(config.database.path);
    if (opened.isError()) {
        return Result<void, ServiceError>::error(
            ServiceError(ServiceError::Code::StorageFailed,
                         "Cannot open database " + config.database.path + ": " +
                         opened.error().message));
    }
    database_ = std::shared_ptr<storage::Database>(std::move(opened).value());

    auto migrated = storage::applySchema(*database_);
    if (migrated.isError()) {
        return Result<void, ServiceError>::error(
            ServiceError(ServiceError::Code::StorageFailed,
                         "Schema migration failed: " + migrated.error().message));
    }

    portPool_ = std::make_shared<storage::SqlitePortPool>(database_, logger_);
    streamStore_ = std::make_shared<storage::SqliteStreamStore>(database_);
    telemetry_ = std::make_shared<storage::TelemetryStore>(database_);
    registry_ = std::make_shared<storage::ServerRegistry>(database_);

    auto seeded = portPool_->initialize(config.pool.rangeStart, config.pool.rangeEnd);
    if (seeded.isError()) {
        return Result<void, ServiceError>::error(
            ServiceError(ServiceError::Code::PoolInitFailed,
                         "Port pool initialization failed: " + seeded.error().message));
    }

    // A process that died mid-provision or mid-terminate can leave a port
    // allocated without a live owner.
    auto reclaimed = portPool_->reclaimOrphaned();
    if (reclaimed.isError()) {
        return Result<void, ServiceError>::error(
            ServiceError(ServiceError::Code::PoolInitFailed,
                         "Port reclamation failed: " + reclaimed.error().message));
    }
    STREAMPROV_LOG_INFO(logger_, CATEGORY,
        "Database " + config.database.path + " ready, " +
        std::to_string(seeded.value()) + " new ports, " +
        std::to_string(reclaimed.value()) + " reclaimed");
    return Result<void, ServiceError>::success();
}

Result<void, ServiceError> ProvisioningService::registerServer(
    const core::StreamingServerConfig& server)
{
    storage::ServerRecord record;
    record.name = server.name;
    record.hostname = server.hostname;
    record.adminPort = server.adminPort;
    record.adminPassword = server.adminPassword;
    record.publicHost = server.effectivePublicHost();
    record.maxStreams = server.maxStreams;
    record.isActive = true;
    record.isPrimary = true;

    auto upserted = registry_->upsert(record);
    if (upserted.isError()) {
        return Result<void, ServiceError>::error(
            ServiceError(ServiceError::Code::ServerRegistrationFailed,
                         "Streaming server registration failed: " + upserted.error().message));
    }
    serverId_ = upserted.value();
    STREAMPROV_LOG_INFO(logger_, CATEGORY,
        "Primary streaming server " + server.name + " at " + server.hostname + ":" +
        std::to_string(server.adminPort));
    return Result<void, ServiceError>::success();
}

void ProvisioningService::wireCallbacks(bool verifyAfterProvision) {
    // Weak: the reconciliation service already holds the coordinator.
    std::weak_ptr<provisioning::ReconciliationService> reconciliation = reconciliation_;
    std::weak_ptr<monitoring::MonitoringAggregator> monitor = monitor_;
    auto logger = logger_;

    if (verifyAfterProvision) {
        coordinator_->setProvisionedCallback(
            [reconciliation, logger](const storage::StreamRecord& stream) {
                auto service = reconciliation.lock();
                if (!service) {
                    return;
                }
                auto scheduled = service->scheduleVerification(stream.id);
                if (scheduled.isError()) {
                    STREAMPROV_LOG_WARNING(logger, CATEGORY,
                        "Verification of stream " + std::to_string(stream.id) +
                        " not queued: " + scheduled.error().message);
                }
            });
    }

    coordinator_->setStoppedCallback(
        [monitor](const storage::StreamRecord& stream, core::LifecycleEventType event) {
            if (auto aggregator = monitor.lock()) {
                aggregator->onStreamStopped(stream, event);
            }
        });
}

} // namespace api
} // namespace streamprov
