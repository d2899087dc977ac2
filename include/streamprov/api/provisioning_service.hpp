// StreamProv - Dedicated stream provisioning service
// Provisioning Service - Wires all components into the service lifecycle
//
// Responsibilities:
// - Build the logger and its sinks from configuration
// - Open the database, apply the schema, seed the port pool
// - Register the configured streaming server as primary
// - Construct coordinator, task queue, reconciliation and monitoring
// - Start and stop background work in order

#ifndef STREAMPROV_API_PROVISIONING_SERVICE_HPP
#define STREAMPROV_API_PROVISIONING_SERVICE_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "streamprov/core/config_manager.hpp"
#include "streamprov/core/result.hpp"
#include "streamprov/core/structured_logger.hpp"
#include "streamprov/monitoring/monitoring_aggregator.hpp"
#include "streamprov/provisioning/provisioning_coordinator.hpp"
#include "streamprov/provisioning/reconciliation_service.hpp"
#include "streamprov/provisioning/task_queue.hpp"
#include "streamprov/shoutcast/streaming_server_client.hpp"
#include "streamprov/storage/database.hpp"
#include "streamprov/storage/port_pool.hpp"
#include "streamprov/storage/server_registry.hpp"
#include "streamprov/storage/stream_store.hpp"
#include "streamprov/storage/telemetry_store.hpp"

namespace streamprov {
namespace api {

/**
 * @brief Service lifecycle state.
 */
enum class ServiceState {
    Uninitialized,
    Initialized,    ///< Components built, background work not running
    Running,
    Stopped
};

const char* serviceStateToString(ServiceState state);

struct ServiceError {
    enum class Code {
        None = 0,
        InvalidState,           ///< Operation not valid in current state
        ConfigurationInvalid,
        StorageFailed,          ///< Database could not be opened or migrated
        PoolInitFailed,
        ServerRegistrationFailed
    };

    Code code = Code::None;
    std::string message;

    ServiceError() = default;
    ServiceError(Code c, std::string msg = "")
        : code(c), message(std::move(msg)) {}
};

/**
 * @brief Owns every component of a running provisioning service.
 *
 * Components are constructed explicitly in initialize() and handed to each
 * other; nothing is global. The streaming-server client may be injected,
 * otherwise a ShoutcastClient over Boost.Beast is built from configuration.
 *
 * @code
 * ProvisioningService service;
 * auto init = service.initialize(configManager.getConfig());
 * if (init.isError()) { ... }
 * service.start();
 * auto outcome = service.coordinator()->provision(request);
 * service.stop();
 * @endcode
 */
class ProvisioningService {
public:
    explicit ProvisioningService(
        std::shared_ptr<shoutcast::IStreamingServerClient> serverClient = nullptr);

    /**
     * @brief Calls stop().
     */
    ~ProvisioningService();

    ProvisioningService(const ProvisioningService&) = delete;
    ProvisioningService& operator=(const ProvisioningService&) = delete;

    /**
     * @brief Build all components from config.
     *
     * Seeds the port pool from the configured range (ports already present
     * are kept) and registers the streaming server as primary.
     */
    core::Result<void, ServiceError> initialize(const core::Configuration& config);

    /**
     * @brief Start the task queue and the monitoring thread, then queue a
     *        verification for every non-terminated stream.
     */
    core::Result<void, ServiceError> start();

    /**
     * @brief Stop monitoring, drain nothing further from the queue, flush logs.
     */
    void stop();

    ServiceState state() const;

    std::shared_ptr<core::StructuredLogger> logger() const { return logger_; }
    std::shared_ptr<storage::Database> database() const { return database_; }
    std::shared_ptr<storage::IPortPool> portPool() const { return portPool_; }
    std::shared_ptr<storage::IStreamStore> streamStore() const { return streamStore_; }
    std::shared_ptr<storage::TelemetryStore> telemetry() const { return telemetry_; }
    std::shared_ptr<storage::ServerRegistry> serverRegistry() const { return registry_; }
    std::shared_ptr<shoutcast::IStreamingServerClient> serverClient() const { return serverClient_; }
    std::shared_ptr<provisioning::ProvisioningCoordinator> coordinator() const { return coordinator_; }
    std::shared_ptr<provisioning::TaskQueue> taskQueue() const { return taskQueue_; }
    std::shared_ptr<provisioning::ReconciliationService> reconciliation() const { return reconciliation_; }
    std::shared_ptr<monitoring::MonitoringAggregator> monitor() const { return monitor_; }

    core::ServerId serverId() const { return serverId_; }

private:
    void buildLogger(const core::LoggingConfig& logging);
    core::Result<void, ServiceError> openStorage(const core::Configuration& config);
    core::Result<void, ServiceError> registerServer(const core::StreamingServerConfig& server);
    void wireCallbacks(bool verifyAfterProvision);

    mutable std::mutex stateMutex_;
    std::atomic<ServiceState> state_{ServiceState::Uninitialized};
    core::Configuration config_;

    std::shared_ptr<core::StructuredLogger> logger_;
    std::shared_ptr<storage::Database> database_;
    std::shared_ptr<storage::IPortPool> portPool_;
    std::shared_ptr<storage::IStreamStore> streamStore_;
    std::shared_ptr<storage::TelemetryStore> telemetry_;
    std::shared_ptr<storage::ServerRegistry> registry_;
    std::shared_ptr<shoutcast::IStreamingServerClient> serverClient_;
    std::shared_ptr<provisioning::ProvisioningCoordinator> coordinator_;
    std::shared_ptr<provisioning::TaskQueue> taskQueue_;
    std::shared_ptr<provisioning::ReconciliationService> reconciliation_;
    std::shared_ptr<monitoring::MonitoringAggregator> monitor_;

    core::ServerId serverId_ = core::INVALID_SERVER_ID;
};

} // namespace api
} // namespace streamprov

#endif // STREAMPROV_API_PROVISIONING_SERVICE_HPP
