// StreamProv - Dedicated stream provisioning service
// SHOUTcast DNAS admin client implementation

#include "streamprov/shoutcast/shoutcast_client.hpp"

#include <cstdlib>

#include "streamprov/shoutcast/shoutcast_config_file.hpp"

namespace streamprov {
namespace shoutcast {

using core::Result;
using core::QueryParams;

namespace {

const char* const CATEGORY = "ShoutcastClient";

uint64_t toUint(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    return end == text.c_str() ? 0 : static_cast<uint64_t>(value);
}

uint32_t toUint32(const std::string& text) {
    return static_cast<uint32_t>(toUint(text));
}

std::string sidText(StreamRef sid) {
    return std::to_string(sid);
}

StreamSummary toSummary(const XmlElement& stream) {
    StreamSummary summary;
    summary.id = stream.attribute("ID");
    summary.port = toUint32(stream.childText("SERVERPORT"));
    summary.listeners = toUint32(stream.childText("CURRENTLISTENERS"));
    summary.peakListeners = toUint32(stream.childText("PEAKLISTENERS"));
    summary.maxListeners = toUint32(stream.childText("MAXLISTENERS"));
    summary.title = stream.childText("SERVERTITLE");
    summary.genre = stream.childText("SERVERGENRE");
    summary.url = stream.childText("SERVERURL");
    summary.sourceConnected = stream.childText("STREAMSTATUS", "0") == "1";
    summary.bitrate = toUint32(stream.childText("BITRATE"));
    summary.sampleRate = toUint32(stream.childText("SAMPLERATE"));
    summary.hits = toUint(stream.childText("STREAMHITS"));
    return summary;
}

LiveStreamStatus toLiveStatus(const XmlElement& stream) {
    LiveStreamStatus status;
    status.id = stream.attribute("ID");
    status.port = toUint32(stream.childText("SERVERPORT"));
    status.listeners = toUint32(stream.childText("CURRENTLISTENERS"));
    status.peakListeners = toUint32(stream.childText("PEAKLISTENERS"));
    status.maxListeners = toUint32(stream.childText("MAXLISTENERS"));
    status.title = stream.childText("SERVERTITLE");
    status.genre = stream.childText("SERVERGENRE");
    status.url = stream.childText("SERVERURL");
    status.sourceConnected = stream.childText("STREAMSTATUS", "0") == "1";
    status.bitrate = toUint32(stream.childText("BITRATE"));
    status.sampleRate = toUint32(stream.childText("SAMPLERATE"));
    status.uptimeSeconds = toUint(stream.childText("STREAMUPTIME"));
    status.hits = toUint(stream.childText("STREAMHITS"));
    status.currentSong = stream.childText("SONGTITLE");
    return status;
}

// A per-stream document either wraps the stream in <STREAM ID=".."> or
// reports its fields directly under the root element.
const XmlElement* locateStream(const XmlElement& root, StreamRef sid) {
    const std::string wanted = sidText(sid);
    auto streams = root.findAll("STREAM");
    for (const XmlElement* stream : streams) {
        if (stream->attribute("ID") == wanted || stream->childText("SERVERPORT") == wanted) {
            return stream;
        }
    }
    if (streams.size() == 1 && streams.front()->attribute("ID").empty()) {
        return streams.front();
    }
    if (streams.empty() && root.child("CURRENTLISTENERS") != nullptr) {
        return &root;
    }
    return nullptr;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

ShoutcastClient::ShoutcastClient(
    ShoutcastClientConfig config,
    std::shared_ptr<core::IHttpClient> httpClient,
    std::shared_ptr<core::StructuredLogger> logger)
    : config_(std::move(config))
    , httpClient_(std::move(httpClient))
    , logger_(std::move(logger))
{
}

// =============================================================================
// Operations
// =============================================================================

Result<ServerStatus, StreamingServerError> ShoutcastClient::getServerStatus() {
    auto doc = adminXml({{"mode", "viewxml"}});
    if (doc.isError()) {
        return Result<ServerStatus, StreamingServerError>::error(doc.error());
    }
    const XmlElement& root = doc.value();

    ServerStatus status;
    if (const XmlElement* version = root.findFirst("VERSION")) {
        if (!version->text.empty()) {
            status.version = version->text;
        }
    }
    if (const XmlElement* uptime = root.findFirst("UPTIME")) {
        status.uptimeSeconds = toUint(uptime->text);
    }

    for (const XmlElement* stream : root.findAll("STREAM")) {
        StreamSummary summary = toSummary(*stream);
        if (summary.hits > 0) {
            status.activeStreams++;
        }
        status.totalListeners += summary.listeners;
        status.peakListeners += summary.peakListeners;
        status.maxListeners += summary.maxListeners;
        status.streams.push_back(std::move(summary));
    }
    status.totalStreams = static_cast<uint32_t>(status.streams.size());

    // Single-stream servers report totals at the root.
    if (status.streams.empty()) {
        status.totalListeners = toUint32(root.childText("CURRENTLISTENERS"));
        status.peakListeners = toUint32(root.childText("PEAKLISTENERS"));
        status.maxListeners = toUint32(root.childText("MAXLISTENERS"));
    }

    return Result<ServerStatus, StreamingServerError>::success(std::move(status));
}

Result<void, StreamingServerError> ShoutcastClient::createStream(const StreamServerConfig& config) {
    STREAMPROV_LOG_INFO(logger_, CATEGORY,
        "Configuring mount point for stream " + sidText(config.sid));

    bool changed = false;
    auto written = writeStreamConfig(&config, config.sid, changed);
    if (written.isError()) {
        return written;
    }

    return reloadConfiguration();
}

Result<void, StreamingServerError> ShoutcastClient::removeStream(StreamRef sid) {
    STREAMPROV_LOG_INFO(logger_, CATEGORY, "Removing mount point for stream " + sidText(sid));

    bool changed = false;
    auto written = writeStreamConfig(nullptr, sid, changed);
    if (written.isError()) {
        return written;
    }
    if (!changed && !config_.configFilePath.empty()) {
        return Result<void, StreamingServerError>::success();
    }

    return reloadConfiguration();
}

Result<void, StreamingServerError> ShoutcastClient::updateMetadata(
    StreamRef sid, const MetadataUpdate& update)
{
    if (update.empty()) {
        return Result<void, StreamingServerError>::success();
    }

    QueryParams params = {{"mode", "updinfo"}, {"sid", sidText(sid)}};
    if (update.title) {
        params.emplace_back("title", *update.title);
    }
    if (update.genre) {
        params.emplace_back("genre", *update.genre);
    }
    if (update.url) {
        params.emplace_back("url", *update.url);
    }
    return adminCommand(params);
}

Result<void, StreamingServerError> ShoutcastClient::setSongTitle(StreamRef sid, const std::string& song) {
    return adminCommand({{"mode", "updinfo"}, {"sid", sidText(sid)}, {"song", song}});
}

Result<void, StreamingServerError> ShoutcastClient::kickSource(StreamRef sid) {
    STREAMPROV_LOG_INFO(logger_, CATEGORY, "Disconnecting source of stream " + sidText(sid));
    return adminCommand({{"mode", "kicksrc"}, {"sid", sidText(sid)}});
}

Result<void, StreamingServerError> ShoutcastClient::kickListener(
    StreamRef sid, const std::string& listenerUid)
{
    return adminCommand({{"mode", "kick"}, {"sid", sidText(sid)}, {"uid", listenerUid}});
}

Result<std::vector<ListenerInfo>, StreamingServerError> ShoutcastClient::getListeners(StreamRef sid) {
    auto doc = adminXml({{"mode", "viewxml"}, {"sid", sidText(sid)}, {"page", "3"}});
    if (doc.isError()) {
        return Result<std::vector<ListenerInfo>, StreamingServerError>::error(doc.error());
    }

    std::vector<ListenerInfo> listeners;
    for (const XmlElement* element : doc.value().findAll("LISTENER")) {
        ListenerInfo info;
        info.id = element->attribute("ID");
        info.host = element->childText("HOSTNAME");
        info.userAgent = element->childText("USERAGENT");
        info.connectedSeconds = toUint(element->childText("CONNECTTIME"));
        info.uid = element->childText("UID");
        listeners.push_back(std::move(info));
    }
    return Result<std::vector<ListenerInfo>, StreamingServerError>::success(std::move(listeners));
}

Result<LiveStreamStatus, StreamingServerError> ShoutcastClient::getStreamInfo(StreamRef sid) {
    auto doc = adminXml({{"mode", "viewxml"}, {"sid", sidText(sid)}});
    if (doc.isError()) {
        const auto& err = doc.error();
        if (err.code == StreamingServerError::Code::HttpStatus && err.httpStatus == 404) {
            return Result<LiveStreamStatus, StreamingServerError>::error(
                StreamingServerError(StreamingServerError::Code::NotFound,
                                     "Stream " + sidText(sid) + " not reported by server", 404));
        }
        return Result<LiveStreamStatus, StreamingServerError>::error(err);
    }

    const XmlElement* stream = locateStream(doc.value(), sid);
    if (stream == nullptr) {
        return Result<LiveStreamStatus, StreamingServerError>::error(
            StreamingServerError(StreamingServerError::Code::NotFound,
                                 "Stream " + sidText(sid) + " not reported by server"));
    }
    return Result<LiveStreamStatus, StreamingServerError>::success(toLiveStatus(*stream));
}

Result<void, StreamingServerError> ShoutcastClient::reloadConfiguration() {
    return adminCommand({{"mode", "reload"}});
}

// =============================================================================
// Circuit breaker and statistics
// =============================================================================

CircuitState ShoutcastClient::getCircuitState() const {
    std::lock_guard<std::mutex> lock(circuitMutex_);
    return circuitState_;
}

StreamingClientStats ShoutcastClient::getStatistics() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

bool ShoutcastClient::allowRequest() {
    std::lock_guard<std::mutex> lock(circuitMutex_);

    if (circuitState_ == CircuitState::Open) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - openedAt_);
        if (elapsed.count() < static_cast<int64_t>(config_.circuitBreakerResetMs)) {
            return false;
        }
        circuitState_ = CircuitState::HalfOpen;
    }
    return true;
}

void ShoutcastClient::recordSuccess() {
    std::lock_guard<std::mutex> lock(circuitMutex_);
    circuitState_ = CircuitState::Closed;
    failureCount_ = 0;
}

void ShoutcastClient::recordFailure() {
    bool opened = false;
    {
        std::lock_guard<std::mutex> lock(circuitMutex_);
        if (circuitState_ == CircuitState::HalfOpen) {
            circuitState_ = CircuitState::Open;
            openedAt_ = std::chrono::steady_clock::now();
            opened = true;
        } else if (circuitState_ == CircuitState::Closed) {
            if (++failureCount_ >= config_.circuitBreakerThreshold) {
                circuitState_ = CircuitState::Open;
                openedAt_ = std::chrono::steady_clock::now();
                opened = true;
            }
        }
    }

    if (opened) {
        {
            std::lock_guard<std::mutex> statsLock(statsMutex_);
            stats_.circuitOpenCount++;
        }
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            "Circuit opened for " + config_.hostname + ":" + std::to_string(config_.adminPort));
    }
}

// =============================================================================
// Request plumbing
// =============================================================================

Result<std::string, StreamingServerError> ShoutcastClient::adminRequest(const QueryParams& params) {
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.totalRequests++;
    }

    if (!allowRequest()) {
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.rejectedCount++;
            stats_.failureCount++;
        }
        return Result<std::string, StreamingServerError>::error(
            StreamingServerError(StreamingServerError::Code::CircuitOpen,
                                 "Streaming server circuit is open"));
    }

    QueryParams withAuth;
    withAuth.reserve(params.size() + 1);
    withAuth.emplace_back("pass", config_.adminPassword);
    withAuth.insert(withAuth.end(), params.begin(), params.end());

    core::HttpRequest request;
    request.url = "http://" + config_.hostname + ":" + std::to_string(config_.adminPort) +
                  "/admin.cgi?" + core::buildQueryString(withAuth);

    auto response = httpClient_->get(request, std::chrono::milliseconds(config_.requestTimeoutMs));

    std::string mode;
    for (const auto& param : params) {
        if (param.first == "mode") {
            mode = param.second;
        }
    }

    if (response.isError()) {
        const auto& httpError = response.error();
        bool timedOut = httpError.code == core::HttpError::Code::Timeout;
        recordFailure();
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.failureCount++;
            if (timedOut) {
                stats_.timeoutCount++;
            }
        }
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            "Admin request mode=" + mode + " failed: " + httpError.message);
        return Result<std::string, StreamingServerError>::error(
            StreamingServerError(timedOut ? StreamingServerError::Code::Timeout
                                          : StreamingServerError::Code::Unreachable,
                                 httpError.message));
    }

    const auto& httpResponse = response.value();
    if (!httpResponse.isSuccess()) {
        if (httpResponse.statusCode >= 500) {
            recordFailure();
        } else {
            recordSuccess();
        }
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.failureCount++;
        }
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            "Admin request mode=" + mode + " returned HTTP " +
            std::to_string(httpResponse.statusCode));
        return Result<std::string, StreamingServerError>::error(
            StreamingServerError(StreamingServerError::Code::HttpStatus,
                                 "Streaming server returned HTTP " +
                                 std::to_string(httpResponse.statusCode),
                                 httpResponse.statusCode));
    }

    recordSuccess();
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.successCount++;
    }
    return Result<std::string, StreamingServerError>::success(httpResponse.body);
}

Result<XmlElement, StreamingServerError> ShoutcastClient::adminXml(const QueryParams& params) {
    auto body = adminRequest(params);
    if (body.isError()) {
        return Result<XmlElement, StreamingServerError>::error(body.error());
    }

    auto doc = parseXml(body.value());
    if (doc.isError()) {
        STREAMPROV_LOG_WARNING(logger_, CATEGORY,
            "Unparseable status document: " + doc.error().message);
        return Result<XmlElement, StreamingServerError>::error(
            StreamingServerError(StreamingServerError::Code::ParseError,
                                 "Invalid XML from streaming server: " + doc.error().message));
    }
    return Result<XmlElement, StreamingServerError>::success(std::move(doc.value()));
}

Result<void, StreamingServerError> ShoutcastClient::adminCommand(const QueryParams& params) {
    auto body = adminRequest(params);
    if (body.isError()) {
        return Result<void, StreamingServerError>::error(body.error());
    }
    return Result<void, StreamingServerError>::success();
}

Result<void, StreamingServerError> ShoutcastClient::writeStreamConfig(
    const StreamServerConfig* config, StreamRef sid, bool& changed)
{
    changed = false;
    if (config_.configFilePath.empty()) {
        STREAMPROV_LOG_DEBUG(logger_, CATEGORY,
            "No managed configuration file; only reloading for stream " + sidText(sid));
        return Result<void, StreamingServerError>::success();
    }

    std::lock_guard<std::mutex> lock(configFileMutex_);

    ShoutcastConfigFile file(config_.configFilePath);
    auto loaded = file.load();
    if (loaded.isError()) {
        return Result<void, StreamingServerError>::error(
            StreamingServerError(StreamingServerError::Code::ConfigWriteFailed, loaded.error().message));
    }

    if (config != nullptr) {
        file.upsertStream(*config);
        changed = true;
    } else {
        changed = file.removeStream(sid);
        if (!changed) {
            return Result<void, StreamingServerError>::success();
        }
    }

    auto saved = file.save();
    if (saved.isError()) {
        STREAMPROV_LOG_ERROR(logger_, CATEGORY, saved.error().message);
        return Result<void, StreamingServerError>::error(
            StreamingServerError(StreamingServerError::Code::ConfigWriteFailed, saved.error().message));
    }
    return Result<void, StreamingServerError>::success();
}

} // namespace shoutcast
} // namespace streamprov
