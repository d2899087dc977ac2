// StreamProv - Dedicated stream provisioning service
// Streaming-server client interface
//
// The narrow set of operations the provisioning layer needs against the
// external streaming server's admin interface. Every operation is an
// independent request with a bounded timeout; failures come back as
// StreamingServerError, never as exceptions.

#ifndef STREAMPROV_SHOUTCAST_STREAMING_SERVER_CLIENT_HPP
#define STREAMPROV_SHOUTCAST_STREAMING_SERVER_CLIENT_HPP

#include <optional>
#include <string>
#include <vector>

#include "streamprov/core/result.hpp"
#include "streamprov/shoutcast/shoutcast_types.hpp"

namespace streamprov {
namespace shoutcast {

/**
 * @brief Descriptive fields pushed to a running stream.
 *
 * Unset fields are left unchanged on the server.
 */
struct MetadataUpdate {
    std::optional<std::string> title;
    std::optional<std::string> genre;
    std::optional<std::string> url;

    bool empty() const { return !title && !genre && !url; }
};

/**
 * @brief Interface for the external streaming server.
 */
class IStreamingServerClient {
public:
    virtual ~IStreamingServerClient() = default;

    virtual core::Result<ServerStatus, StreamingServerError> getServerStatus() = 0;

    /**
     * @brief Open (or re-open with new settings) a mount point.
     *
     * Safe to repeat for a stream that may already be configured.
     */
    virtual core::Result<void, StreamingServerError> createStream(const StreamServerConfig& config) = 0;

    /**
     * @brief Remove a mount point. Removing an unknown stream succeeds.
     */
    virtual core::Result<void, StreamingServerError> removeStream(StreamRef sid) = 0;

    virtual core::Result<void, StreamingServerError> updateMetadata(
        StreamRef sid, const MetadataUpdate& update) = 0;

    virtual core::Result<void, StreamingServerError> setSongTitle(
        StreamRef sid, const std::string& song) = 0;

    /**
     * @brief Disconnect the source encoder of a stream.
     */
    virtual core::Result<void, StreamingServerError> kickSource(StreamRef sid) = 0;

    virtual core::Result<void, StreamingServerError> kickListener(
        StreamRef sid, const std::string& listenerUid) = 0;

    virtual core::Result<std::vector<ListenerInfo>, StreamingServerError> getListeners(StreamRef sid) = 0;

    /**
     * @brief Live status of a stream.
     * @return NotFound when the server does not report the stream
     */
    virtual core::Result<LiveStreamStatus, StreamingServerError> getStreamInfo(StreamRef sid) = 0;

    virtual core::Result<void, StreamingServerError> reloadConfiguration() = 0;
};

} // namespace shoutcast
} // namespace streamprov

#endif // STREAMPROV_SHOUTCAST_STREAMING_SERVER_CLIENT_HPP
