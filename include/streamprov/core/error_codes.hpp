// StreamProv - Dedicated stream provisioning service
// Project-wide error codes and Error structure

#ifndef STREAMPROV_CORE_ERROR_CODES_HPP
#define STREAMPROV_CORE_ERROR_CODES_HPP

#include <cstdint>
#include <string>

namespace streamprov {
namespace core {

/**
 * @brief Numeric error codes shared by all layers.
 *
 * Component error structs map their own codes onto these values when
 * they log, so that aggregated logs can be filtered by a single
 * "error_code" field regardless of which component failed.
 */
enum class ErrorCode : uint32_t {
    // General (0-99)
    Success = 0,
    Unknown = 1,
    InvalidArgument = 2,
    InvalidState = 3,
    NotFound = 4,
    AlreadyExists = 5,

    // Port pool (100-199)
    PortPoolError = 100,
    NoPortsAvailable = 101,
    PortNotFound = 102,
    PortRangeInvalid = 103,

    // Provisioning lifecycle (200-299)
    ProvisioningError = 200,
    NoCapacity = 201,
    InvalidTransition = 202,
    InvalidRequest = 203,
    ExternalConfigurationFailed = 204,

    // External streaming server (300-399)
    StreamingServerError = 300,
    Unreachable = 301,
    Timeout = 302,
    HttpStatus = 303,
    ResponseParseError = 304,
    CircuitOpen = 305,

    // Persistence (400-499)
    StorageError = 400,
    StorageOpenFailed = 401,
    StorageQueryFailed = 402,
    StorageConstraintViolation = 403,

    // Configuration (500-599)
    ConfigError = 500,
    ConfigInvalid = 501,
    ConfigNotFound = 502,
    ConfigParseError = 503,

    // I/O (600-699)
    IOError = 600,
    FileNotFound = 601,
    FileWriteError = 602,
};

/**
 * @brief Human-readable name of an error code.
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::PortPoolError: return "Port pool error";
        case ErrorCode::NoPortsAvailable: return "No ports available";
        case ErrorCode::PortNotFound: return "Port not found";
        case ErrorCode::PortRangeInvalid: return "Port range invalid";
        case ErrorCode::ProvisioningError: return "Provisioning error";
        case ErrorCode::NoCapacity: return "No capacity";
        case ErrorCode::InvalidTransition: return "Invalid transition";
        case ErrorCode::InvalidRequest: return "Invalid request";
        case ErrorCode::ExternalConfigurationFailed: return "External configuration failed";
        case ErrorCode::StreamingServerError: return "Streaming server error";
        case ErrorCode::Unreachable: return "Streaming server unreachable";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::HttpStatus: return "Unexpected HTTP status";
        case ErrorCode::ResponseParseError: return "Response parse error";
        case ErrorCode::CircuitOpen: return "Circuit open";
        case ErrorCode::StorageError: return "Storage error";
        case ErrorCode::StorageOpenFailed: return "Storage open failed";
        case ErrorCode::StorageQueryFailed: return "Storage query failed";
        case ErrorCode::StorageConstraintViolation: return "Storage constraint violation";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::ConfigInvalid: return "Configuration invalid";
        case ErrorCode::ConfigNotFound: return "Configuration not found";
        case ErrorCode::ConfigParseError: return "Configuration parse error";
        case ErrorCode::IOError: return "I/O error";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileWriteError: return "File write error";
        default: return "Unknown error code";
    }
}

/**
 * @brief Error with code, message and optional context.
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;

    Error(ErrorCode c = ErrorCode::Unknown,
          std::string msg = "",
          std::string ctx = "")
        : code(c)
        , message(std::move(msg))
        , context(std::move(ctx)) {}

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == ErrorCode::Success;
    }

    /**
     * @brief Format as "<code name>: <message> [<context>]".
     */
    [[nodiscard]] std::string toString() const {
        std::string result = errorCodeToString(code);
        if (!message.empty()) {
            result += ": " + message;
        }
        if (!context.empty()) {
            result += " [" + context + "]";
        }
        return result;
    }
};

} // namespace core
} // namespace streamprov

#endif // STREAMPROV_CORE_ERROR_CODES_HPP
