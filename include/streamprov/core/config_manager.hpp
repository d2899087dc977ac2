// StreamProv - Dedicated stream provisioning service
// Configuration Manager - Handles configuration loading and validation
//
// Responsibilities:
// - Parse JSON and YAML configuration file formats
// - Support STREAMPROV_* environment variable overrides
// - Validate configuration on startup with field-level error messages
// - Apply defaults when the configuration file is absent
// - Report effective configuration values through a log callback

#ifndef STREAMPROV_CORE_CONFIG_MANAGER_HPP
#define STREAMPROV_CORE_CONFIG_MANAGER_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

#include "streamprov/core/log_sink.hpp"
#include "streamprov/core/result.hpp"
#include "streamprov/core/types.hpp"

namespace streamprov {
namespace core {

/**
 * @brief Configuration file format.
 */
enum class ConfigFormat {
    JSON,
    YAML
};

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief Port pool range, inclusive on both ends.
 */
struct PoolConfig {
    uint16_t rangeStart = 8100;
    uint16_t rangeEnd = 8200;
};

/**
 * @brief Defaults applied to new streams when the request leaves them unset.
 */
struct StreamDefaultsConfig {
    uint32_t bitrate = 128;          ///< kbps
    uint32_t maxListeners = 100;
    uint32_t sampleRate = 44100;     ///< Hz
    std::string genre = "Various";
    bool publicServer = true;
};

/**
 * @brief Connection details for the external streaming server.
 */
struct StreamingServerConfig {
    std::string name = "primary";
    std::string hostname = "localhost";
    uint16_t adminPort = 8000;
    std::string adminPassword;                 ///< Required
    std::string publicHost;                    ///< Host for listener URLs; empty means hostname
    uint32_t maxStreams = 100;
    std::string configFilePath;                ///< Managed stream config file; empty disables writes
    uint32_t requestTimeoutMs = 10000;
    uint32_t circuitBreakerThreshold = 5;
    uint32_t circuitBreakerResetMs = 30000;

    std::string effectivePublicHost() const {
        return publicHost.empty() ? hostname : publicHost;
    }
};

struct DatabaseConfig {
    std::string path = "streamprov.db";
};

/**
 * @brief Logging configuration section.
 */
struct LoggingConfig {
    LogLevel level = LogLevel::Info;
    bool enableConsole = true;
    bool enableFile = false;
    std::string filePath = "streamprov.log";
    bool enableJson = false;
    uint32_t maxFileSizeMB = 100;
    uint32_t maxFiles = 5;
    bool compress = true;
};

struct MonitoringConfig {
    bool enabled = true;
    uint32_t sampleIntervalMs = 5000;
    uint32_t recentSampleLimit = 100;
    uint32_t defaultStatsDays = 30;
};

struct ProvisioningConfig {
    bool kickSourceOnSuspend = false;
    bool verifyAfterProvision = true;
    uint32_t verificationMaxAttempts = 3;
    uint32_t verificationRetryDelayMs = 2000;
    uint32_t workerThreads = 1;
};

/**
 * @brief Complete service configuration.
 */
struct Configuration {
    PoolConfig pool;
    StreamDefaultsConfig defaults;
    StreamingServerConfig streamingServer;
    DatabaseConfig database;
    LoggingConfig logging;
    MonitoringConfig monitoring;
    ProvisioningConfig provisioning;
};

// =============================================================================
// Configuration Error
// =============================================================================

struct ConfigError {
    enum class Code {
        None,
        FileNotFound,
        ParseError,
        ValidationError,
        UnsupportedFormat,
        IOError
    };

    Code code = Code::None;
    std::string message;
    std::string field;        ///< Field that caused the error (if applicable)
    int line = -1;            ///< Line number in config file (if applicable)

    ConfigError() = default;
    ConfigError(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    ConfigError(Code c, std::string msg, std::string f)
        : code(c), message(std::move(msg)), field(std::move(f)) {}
    ConfigError(Code c, std::string msg, std::string f, int l)
        : code(c), message(std::move(msg)), field(std::move(f)), line(l) {}
};

using ConfigLogCallback = std::function<void(const std::string&)>;

/**
 * @brief Parse a log level name, rejecting unknown names.
 */
std::optional<LogLevel> parseLogLevel(const std::string& str);

/**
 * @brief Configuration manager.
 *
 * Thread Safety: all public methods are thread-safe (shared_mutex for the
 * configuration, a separate mutex for the log callback).
 *
 * @code
 * ConfigManager manager;
 * manager.setLogCallback([](const std::string& msg) { std::cerr << msg << "\n"; });
 *
 * auto result = manager.loadFromFile("streamprov.yaml");
 * if (result.isError()) {
 *     manager.loadDefaults();
 * }
 * manager.applyEnvironmentOverrides();
 *
 * auto valid = manager.validate();
 * if (valid.isError()) {
 *     std::cerr << "Config error: " << valid.error().message;
 *     return 1;
 * }
 * Configuration config = manager.getConfig();
 * @endcode
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Load configuration from a file.
     *
     * Format is chosen by extension: .json, .yaml or .yml. Values absent
     * from the file keep their defaults. Type errors are reported here;
     * cross-field rules are checked by validate(), after environment
     * overrides have been applied.
     */
    Result<void, ConfigError> loadFromFile(const std::string& filePath);

    Result<void, ConfigError> loadFromJsonString(const std::string& jsonContent);
    Result<void, ConfigError> loadFromYamlString(const std::string& yamlContent);

    /**
     * @brief Reset to default configuration.
     */
    Result<void, ConfigError> loadDefaults();

    /**
     * @brief Apply environment variable overrides.
     *
     * Supported environment variables:
     * - STREAMPROV_DB_PATH
     * - STREAMPROV_PORT_RANGE_START / STREAMPROV_PORT_RANGE_END
     * - STREAMPROV_SERVER_HOST / STREAMPROV_SERVER_ADMIN_PORT
     * - STREAMPROV_SERVER_ADMIN_PASSWORD / STREAMPROV_SERVER_PUBLIC_HOST
     * - STREAMPROV_LOG_LEVEL (debug|info|warning|error)
     * - STREAMPROV_LOG_JSON (true|false)
     * - STREAMPROV_MONITOR_INTERVAL_MS
     * - STREAMPROV_KICK_SOURCE_ON_SUSPEND (true|false)
     *
     * Invalid values are reported through the log callback and ignored.
     */
    void applyEnvironmentOverrides();

    /**
     * @brief Validate the current configuration.
     *
     * Checks the pool range (start <= end, both >= 1024), the admin
     * password, request timeout (100-60000 ms), sampling interval
     * (>= 100 ms) and non-zero limits.
     */
    Result<void, ConfigError> validate() const;

    /**
     * @brief Snapshot of the current configuration.
     */
    Configuration getConfig() const;

    /**
     * @brief Dump the effective configuration with secrets masked.
     */
    std::string dumpConfig(ConfigFormat format = ConfigFormat::JSON) const;

    void setLogCallback(ConfigLogCallback callback);

private:
    Result<void, ConfigError> parseJson(const std::string& content);
    Result<void, ConfigError> parseYaml(const std::string& content);

    std::optional<ConfigFormat> detectFormat(const std::string& filePath) const;
    Result<std::string, ConfigError> readFile(const std::string& filePath) const;

    std::optional<std::string> getEnvVar(const char* name) const;
    void log(const std::string& message) const;
    void logEffectiveConfig() const;

    mutable std::shared_mutex configMutex_;
    Configuration config_;

    mutable std::mutex logMutex_;
    ConfigLogCallback logCallback_;
};

} // namespace core
} // namespace streamprov

#endif // STREAMPROV_CORE_CONFIG_MANAGER_HPP
