// StreamProv - Dedicated stream provisioning service
// Provisioning request validation

#include "streamprov/provisioning/request_validator.hpp"

#include <algorithm>
#include <cctype>

namespace streamprov {
namespace provisioning {

using core::Result;

namespace {

Result<void, ProvisioningError> invalid(const std::string& message) {
    return Result<void, ProvisioningError>::error(
        ProvisioningError(ProvisioningError::Code::InvalidRequest, message));
}

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

Result<void, ProvisioningError> checkTitle(const std::string& title) {
    if (title.empty() || isBlank(title)) {
        return invalid("title must not be empty");
    }
    if (title.size() > MAX_TITLE_LENGTH) {
        return invalid("title must be at most " + std::to_string(MAX_TITLE_LENGTH) + " characters");
    }
    return Result<void, ProvisioningError>::success();
}

Result<void, ProvisioningError> checkCommon(
    const std::optional<std::string>& description,
    const std::optional<std::string>& genre,
    const std::optional<uint32_t>& maxListeners,
    const std::optional<uint32_t>& bitrate)
{
    if (description && description->size() > MAX_DESCRIPTION_LENGTH) {
        return invalid("description must be at most " +
                       std::to_string(MAX_DESCRIPTION_LENGTH) + " characters");
    }
    if (genre && genre->size() > MAX_GENRE_LENGTH) {
        return invalid("genre must be at most " + std::to_string(MAX_GENRE_LENGTH) + " characters");
    }
    if (maxListeners && (*maxListeners < MIN_LISTENERS || *maxListeners > MAX_LISTENERS)) {
        return invalid("max_listeners must be between " + std::to_string(MIN_LISTENERS) +
                       " and " + std::to_string(MAX_LISTENERS));
    }
    if (bitrate && !isAllowedBitrate(*bitrate)) {
        return invalid("bitrate " + std::to_string(*bitrate) +
                       " is not one of 64, 96, 128, 192, 256, 320");
    }
    return Result<void, ProvisioningError>::success();
}

} // anonymous namespace

bool isAllowedBitrate(uint32_t kbps) {
    return std::find(ALLOWED_BITRATES.begin(), ALLOWED_BITRATES.end(), kbps) != ALLOWED_BITRATES.end();
}

Result<void, ProvisioningError> validateProvisionRequest(const ProvisionRequest& request) {
    if (request.userId.empty()) {
        return invalid("user id is required");
    }
    auto title = checkTitle(request.title);
    if (title.isError()) {
        return title;
    }
    return checkCommon(request.description, request.genre, request.maxListeners, request.bitrate);
}

Result<void, ProvisioningError> validateStreamUpdate(const StreamUpdate& update) {
    if (update.title) {
        auto title = checkTitle(*update.title);
        if (title.isError()) {
            return title;
        }
    }
    return checkCommon(update.description, update.genre, update.maxListeners, update.bitrate);
}

} // namespace provisioning
} // namespace streamprov
