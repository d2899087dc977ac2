// StreamProv - Dedicated stream provisioning service
// Streaming-server data type helpers

#include "streamprov/shoutcast/shoutcast_types.hpp"

namespace streamprov {
namespace shoutcast {

core::ErrorCode toErrorCode(StreamingServerError::Code code) {
    switch (code) {
        case StreamingServerError::Code::None:
            return core::ErrorCode::Success;
        case StreamingServerError::Code::Unreachable:
            return core::ErrorCode::Unreachable;
        case StreamingServerError::Code::Timeout:
            return core::ErrorCode::Timeout;
        case StreamingServerError::Code::HttpStatus:
            return core::ErrorCode::HttpStatus;
        case StreamingServerError::Code::ParseError:
            return core::ErrorCode::ResponseParseError;
        case StreamingServerError::Code::NotFound:
            return core::ErrorCode::NotFound;
        case StreamingServerError::Code::ConfigWriteFailed:
            return core::ErrorCode::FileWriteError;
        case StreamingServerError::Code::CircuitOpen:
            return core::ErrorCode::CircuitOpen;
    }
    return core::ErrorCode::StreamingServerError;
}

std::string streamingServerErrorCodeToString(StreamingServerError::Code code) {
    switch (code) {
        case StreamingServerError::Code::None: return "none";
        case StreamingServerError::Code::Unreachable: return "unreachable";
        case StreamingServerError::Code::Timeout: return "timeout";
        case StreamingServerError::Code::HttpStatus: return "http_status";
        case StreamingServerError::Code::ParseError: return "parse_error";
        case StreamingServerError::Code::NotFound: return "not_found";
        case StreamingServerError::Code::ConfigWriteFailed: return "config_write_failed";
        case StreamingServerError::Code::CircuitOpen: return "circuit_open";
    }
    return "unknown";
}

} // namespace shoutcast
} // namespace streamprov
