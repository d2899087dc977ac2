// StreamProv - Dedicated stream provisioning service
// Managed streaming-server configuration file
//
// The streaming server reads its per-stream settings from an INI-style
// file of "key_<sid>=value" lines. Mount points are created by writing the
// stream's lines into that file and asking the server to reload. Lines
// that do not belong to a managed stream (globals, comments) are kept
// verbatim.

#ifndef STREAMPROV_SHOUTCAST_SHOUTCAST_CONFIG_FILE_HPP
#define STREAMPROV_SHOUTCAST_SHOUTCAST_CONFIG_FILE_HPP

#include <string>
#include <vector>

#include "streamprov/core/result.hpp"
#include "streamprov/shoutcast/shoutcast_types.hpp"

namespace streamprov {
namespace shoutcast {

struct ConfigFileError {
    enum class Code {
        None,
        ReadFailed,
        WriteFailed
    };

    Code code = Code::None;
    std::string message;

    ConfigFileError() = default;
    ConfigFileError(Code c, std::string msg) : code(c), message(std::move(msg)) {}
};

/**
 * @brief In-memory editor for the streaming server's stream configuration.
 *
 * Not thread-safe; callers serialize load/modify/save.
 *
 * @code
 * ShoutcastConfigFile file("/etc/sc_serv/streams.conf");
 * file.load();
 * file.upsertStream(config);
 * auto saved = file.save();
 * @endcode
 */
class ShoutcastConfigFile {
public:
    explicit ShoutcastConfigFile(std::string path);

    /**
     * @brief Read the file. A missing file loads as empty.
     */
    core::Result<void, ConfigFileError> load();

    /**
     * @brief Replace the file atomically (temp file + rename).
     */
    core::Result<void, ConfigFileError> save() const;

    /**
     * @brief Insert or replace all lines of one stream.
     */
    void upsertStream(const StreamServerConfig& config);

    /**
     * @brief Remove all lines of one stream.
     * @return true if any line was removed
     */
    bool removeStream(StreamRef sid);

    bool hasStream(StreamRef sid) const;

    /**
     * @brief Value of "<key>_<sid>", empty if absent.
     */
    std::string streamValue(const std::string& key, StreamRef sid) const;

    std::string render() const;

    const std::string& path() const { return path_; }

private:
    static bool belongsTo(const std::string& line, StreamRef sid);

    std::string path_;
    std::vector<std::string> lines_;
};

} // namespace shoutcast
} // namespace streamprov

#endif // STREAMPROV_SHOUTCAST_SHOUTCAST_CONFIG_FILE_HPP
