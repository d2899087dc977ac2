// StreamProv - Dedicated stream provisioning service
// Provisioning request, update and outcome types

#ifndef STREAMPROV_PROVISIONING_STREAM_TYPES_HPP
#define STREAMPROV_PROVISIONING_STREAM_TYPES_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "streamprov/core/error_codes.hpp"
#include "streamprov/core/types.hpp"
#include "streamprov/storage/records.hpp"

namespace streamprov {
namespace provisioning {

using storage::StreamRecord;
using storage::StreamStatus;

// =============================================================================
// Limits
// =============================================================================

constexpr size_t MAX_TITLE_LENGTH = 255;
constexpr size_t MAX_DESCRIPTION_LENGTH = 1000;
constexpr size_t MAX_GENRE_LENGTH = 100;
constexpr uint32_t MIN_LISTENERS = 1;
constexpr uint32_t MAX_LISTENERS = 1000;
constexpr std::array<uint32_t, 6> ALLOWED_BITRATES = {64, 96, 128, 192, 256, 320};

// =============================================================================
// Errors
// =============================================================================

struct ProvisioningError {
    enum class Code {
        None,
        NoCapacity,                   ///< Port pool exhausted, nothing was created
        NotFound,                     ///< No such stream, or not owned by the requester
        InvalidTransition,            ///< Lifecycle change not allowed from the current status
        ExternalConfigurationFailed,  ///< Streaming server rejected the request
        Unreachable,                  ///< Streaming server did not answer
        InvalidRequest,               ///< Request failed validation
        PersistenceFailed             ///< Local store failed; allocations were compensated
    };

    Code code = Code::None;
    std::string message;

    ProvisioningError() = default;
    ProvisioningError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
};

core::ErrorCode toErrorCode(ProvisioningError::Code code);

std::string provisioningErrorCodeToString(ProvisioningError::Code code);

// =============================================================================
// Requests
// =============================================================================

struct ProvisionRequest {
    UserId userId;
    std::string title;
    std::optional<std::string> description;
    std::optional<std::string> genre;
    std::optional<uint32_t> maxListeners;
    std::optional<uint32_t> bitrate;
    std::optional<StationId> stationId;
};

/**
 * @brief Partial change to a stream. Unset fields are left as they are.
 */
struct StreamUpdate {
    std::optional<std::string> title;
    std::optional<std::string> description;
    std::optional<std::string> genre;
    std::optional<uint32_t> maxListeners;
    std::optional<uint32_t> bitrate;
    std::optional<bool> publicServer;

    bool empty() const {
        return !title && !description && !genre && !maxListeners && !bitrate && !publicServer;
    }
};

// =============================================================================
// Outcomes
// =============================================================================

/**
 * @brief What an encoder needs to connect, and where listeners tune in.
 */
struct ConnectionDetails {
    std::string host;
    PortNumber port = core::INVALID_PORT;
    std::string sourcePassword;
    std::string adminPassword;
    std::string listenerUrl;
};

enum class ProvisionDisposition {
    Created,                       ///< New stream, external server configured
    AlreadyProvisioned,            ///< User already had a stream; it is returned unchanged
    CreatedPendingConfiguration    ///< New stream, external configuration failed; retry later
};

const char* provisionDispositionToString(ProvisionDisposition disposition);

struct ProvisionOutcome {
    ProvisionDisposition disposition = ProvisionDisposition::Created;
    StreamRecord stream;
    ConnectionDetails connection;
    std::string externalError;     ///< Set for CreatedPendingConfiguration
};

} // namespace provisioning
} // namespace streamprov

#endif // STREAMPROV_PROVISIONING_STREAM_TYPES_HPP
