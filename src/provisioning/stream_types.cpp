// StreamProv - Dedicated stream provisioning service
// Provisioning type helpers

#include "streamprov/provisioning/stream_types.hpp"

namespace streamprov {
namespace provisioning {

core::ErrorCode toErrorCode(ProvisioningError::Code code) {
    switch (code) {
        case ProvisioningError::Code::None: return core::ErrorCode::Success;
        case ProvisioningError::Code::NoCapacity: return core::ErrorCode::NoCapacity;
        case ProvisioningError::Code::NotFound: return core::ErrorCode::NotFound;
        case ProvisioningError::Code::InvalidTransition: return core::ErrorCode::InvalidTransition;
        case ProvisioningError::Code::ExternalConfigurationFailed:
            return core::ErrorCode::ExternalConfigurationFailed;
        case ProvisioningError::Code::Unreachable: return core::ErrorCode::Unreachable;
        case ProvisioningError::Code::InvalidRequest: return core::ErrorCode::InvalidRequest;
        case ProvisioningError::Code::PersistenceFailed: return core::ErrorCode::StorageError;
    }
    return core::ErrorCode::ProvisioningError;
}

std::string provisioningErrorCodeToString(ProvisioningError::Code code) {
    switch (code) {
        case ProvisioningError::Code::None: return "none";
        case ProvisioningError::Code::NoCapacity: return "no_capacity";
        case ProvisioningError::Code::NotFound: return "not_found";
        case ProvisioningError::Code::InvalidTransition: return "invalid_transition";
        case ProvisioningError::Code::ExternalConfigurationFailed: return "external_configuration_failed";
        case ProvisioningError::Code::Unreachable: return "unreachable";
        case ProvisioningError::Code::InvalidRequest: return "invalid_request";
        case ProvisioningError::Code::PersistenceFailed: return "persistence_failed";
    }
    return "unknown";
}

const char* provisionDispositionToString(ProvisionDisposition disposition) {
    switch (disposition) {
        case ProvisionDisposition::Created: return "created";
        case ProvisionDisposition::AlreadyProvisioned: return "already_provisioned";
        case ProvisionDisposition::CreatedPendingConfiguration: return "created_pending_configuration";
    }
    return "unknown";
}

} // namespace provisioning
} // namespace streamprov
