// StreamProv - Dedicated stream provisioning service
// SHOUTcast DNAS admin client
//
// Responsibilities:
// - Authenticated GET /admin.cgi?pass=...&mode=...&sid=... requests
// - Parse the XML status documents into structured types
// - Maintain the managed per-stream configuration file
// - Circuit breaker for a failing server
//
// Each call is an independent request; no connection is kept.

#ifndef STREAMPROV_SHOUTCAST_SHOUTCAST_CLIENT_HPP
#define STREAMPROV_SHOUTCAST_SHOUTCAST_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "streamprov/core/http_client.hpp"
#include "streamprov/core/structured_logger.hpp"
#include "streamprov/shoutcast/streaming_server_client.hpp"
#include "streamprov/shoutcast/xml_reader.hpp"

namespace streamprov {
namespace shoutcast {

struct ShoutcastClientConfig {
    std::string hostname = "localhost";
    uint16_t adminPort = 8000;
    std::string adminPassword;
    std::string configFilePath;                 ///< Empty: mount points are managed elsewhere
    uint32_t requestTimeoutMs = 10000;
    uint32_t circuitBreakerThreshold = 5;       ///< Consecutive failures before opening
    uint32_t circuitBreakerResetMs = 30000;     ///< Open duration before a trial request
};

/**
 * @brief IStreamingServerClient for SHOUTcast DNAS v2.
 *
 * Thread-safe. Transport failures and 5xx responses count toward the
 * circuit breaker; 4xx responses and unparseable bodies do not.
 *
 * @code
 * ShoutcastClientConfig cfg;
 * cfg.hostname = "radio.example.net";
 * cfg.adminPassword = "secret";
 * ShoutcastClient client(cfg, std::make_shared<core::BeastHttpClient>(), logger);
 *
 * auto status = client.getServerStatus();
 * @endcode
 */
class ShoutcastClient : public IStreamingServerClient {
public:
    ShoutcastClient(
        ShoutcastClientConfig config,
        std::shared_ptr<core::IHttpClient> httpClient,
        std::shared_ptr<core::StructuredLogger> logger = nullptr
    );

    ~ShoutcastClient() override = default;

    ShoutcastClient(const ShoutcastClient&) = delete;
    ShoutcastClient& operator=(const ShoutcastClient&) = delete;

    core::Result<ServerStatus, StreamingServerError> getServerStatus() override;
    core::Result<void, StreamingServerError> createStream(const StreamServerConfig& config) override;
    core::Result<void, StreamingServerError> removeStream(StreamRef sid) override;
    core::Result<void, StreamingServerError> updateMetadata(
        StreamRef sid, const MetadataUpdate& update) override;
    core::Result<void, StreamingServerError> setSongTitle(
        StreamRef sid, const std::string& song) override;
    core::Result<void, StreamingServerError> kickSource(StreamRef sid) override;
    core::Result<void, StreamingServerError> kickListener(
        StreamRef sid, const std::string& listenerUid) override;
    core::Result<std::vector<ListenerInfo>, StreamingServerError> getListeners(StreamRef sid) override;
    core::Result<LiveStreamStatus, StreamingServerError> getStreamInfo(StreamRef sid) override;
    core::Result<void, StreamingServerError> reloadConfiguration() override;

    CircuitState getCircuitState() const;
    StreamingClientStats getStatistics() const;

private:
    /**
     * @brief Issue one admin request and return the body of a 2xx answer.
     */
    core::Result<std::string, StreamingServerError> adminRequest(const core::QueryParams& params);

    core::Result<XmlElement, StreamingServerError> adminXml(const core::QueryParams& params);

    core::Result<void, StreamingServerError> adminCommand(const core::QueryParams& params);

    core::Result<void, StreamingServerError> writeStreamConfig(
        const StreamServerConfig* config, StreamRef sid, bool& changed);

    bool allowRequest();
    void recordSuccess();
    void recordFailure();

    ShoutcastClientConfig config_;
    std::shared_ptr<core::IHttpClient> httpClient_;
    std::shared_ptr<core::StructuredLogger> logger_;

    mutable std::mutex circuitMutex_;
    CircuitState circuitState_ = CircuitState::Closed;
    uint32_t failureCount_ = 0;
    std::chrono::steady_clock::time_point openedAt_;

    mutable std::mutex statsMutex_;
    StreamingClientStats stats_;

    std::mutex configFileMutex_;
};

} // namespace shoutcast
} // namespace streamprov

#endif // STREAMPROV_SHOUTCAST_SHOUTCAST_CLIENT_HPP
