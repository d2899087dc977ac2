// StreamProv - Dedicated stream provisioning service
// Persisted entity helpers

#include "streamprov/storage/records.hpp"

namespace streamprov {
namespace storage {

const char* streamStatusToString(StreamStatus status) {
    switch (status) {
        case StreamStatus::Provisioning: return "provisioning";
        case StreamStatus::Active: return "active";
        case StreamStatus::Suspended: return "suspended";
        case StreamStatus::Error: return "error";
        case StreamStatus::Terminated: return "terminated";
    }
    return "unknown";
}

std::optional<StreamStatus> parseStreamStatus(const std::string& text) {
    if (text == "provisioning") return StreamStatus::Provisioning;
    if (text == "active") return StreamStatus::Active;
    if (text == "suspended") return StreamStatus::Suspended;
    if (text == "error") return StreamStatus::Error;
    if (text == "terminated") return StreamStatus::Terminated;
    return std::nullopt;
}

} // namespace storage
} // namespace streamprov
