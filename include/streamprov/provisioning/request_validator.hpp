// StreamProv - Dedicated stream provisioning service
// Provisioning request validation

#ifndef STREAMPROV_PROVISIONING_REQUEST_VALIDATOR_HPP
#define STREAMPROV_PROVISIONING_REQUEST_VALIDATOR_HPP

#include <cstdint>

#include "streamprov/core/result.hpp"
#include "streamprov/provisioning/stream_types.hpp"

namespace streamprov {
namespace provisioning {

/**
 * @brief Check a provision request.
 *
 * Title 1-255 characters and not blank, description at most 1000,
 * max listeners 1-1000, bitrate one of ALLOWED_BITRATES.
 *
 * @return InvalidRequest naming the first offending field
 */
core::Result<void, ProvisioningError> validateProvisionRequest(const ProvisionRequest& request);

core::Result<void, ProvisioningError> validateStreamUpdate(const StreamUpdate& update);

bool isAllowedBitrate(uint32_t kbps);

} // namespace provisioning
} // namespace streamprov

#endif // STREAMPROV_PROVISIONING_REQUEST_VALIDATOR_HPP
