// StreamProv - Dedicated stream provisioning service
// Managed streaming-server configuration file implementation

#include "streamprov/shoutcast/shoutcast_config_file.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>

namespace streamprov {
namespace shoutcast {

using core::Result;

namespace {

const char* const MARKER_PREFIX = "; streamprov stream ";

std::string markerFor(StreamRef sid) {
    return MARKER_PREFIX + std::to_string(sid);
}

std::string keyOf(const std::string& line) {
    size_t eq = line.find('=');
    if (eq == std::string::npos) {
        return "";
    }
    size_t start = line.find_first_not_of(" \t");
    size_t end = line.find_last_not_of(" \t", eq == 0 ? 0 : eq - 1);
    if (start == std::string::npos || end == std::string::npos || start > end) {
        return "";
    }
    return line.substr(start, end - start + 1);
}

} // anonymous namespace

ShoutcastConfigFile::ShoutcastConfigFile(std::string path)
    : path_(std::move(path))
{
}

Result<void, ConfigFileError> ShoutcastConfigFile::load() {
    lines_.clear();

    std::ifstream in(path_);
    if (!in.is_open()) {
        if (errno == ENOENT) {
            return Result<void, ConfigFileError>::success();
        }
        return Result<void, ConfigFileError>::error(
            ConfigFileError(ConfigFileError::Code::ReadFailed,
                            "Cannot open " + path_ + ": " + std::strerror(errno)));
    }

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines_.push_back(line);
    }

    if (in.bad()) {
        return Result<void, ConfigFileError>::error(
            ConfigFileError(ConfigFileError::Code::ReadFailed, "Read error on " + path_));
    }
    return Result<void, ConfigFileError>::success();
}

Result<void, ConfigFileError> ShoutcastConfigFile::save() const {
    const std::string tempPath = path_ + ".tmp";
    {
        std::ofstream out(tempPath, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            return Result<void, ConfigFileError>::error(
                ConfigFileError(ConfigFileError::Code::WriteFailed,
                                "Cannot create " + tempPath + ": " + std::strerror(errno)));
        }
        out << render();
        out.flush();
        if (!out) {
            std::remove(tempPath.c_str());
            return Result<void, ConfigFileError>::error(
                ConfigFileError(ConfigFileError::Code::WriteFailed, "Write error on " + tempPath));
        }
    }

    if (std::rename(tempPath.c_str(), path_.c_str()) != 0) {
        std::string reason = std::strerror(errno);
        std::remove(tempPath.c_str());
        return Result<void, ConfigFileError>::error(
            ConfigFileError(ConfigFileError::Code::WriteFailed,
                            "Cannot replace " + path_ + ": " + reason));
    }
    return Result<void, ConfigFileError>::success();
}

void ShoutcastConfigFile::upsertStream(const StreamServerConfig& config) {
    removeStream(config.sid);

    const std::string sid = std::to_string(config.sid);

    if (!lines_.empty() && !lines_.back().empty()) {
        lines_.push_back("");
    }
    lines_.push_back(markerFor(config.sid));
    lines_.push_back("streamid_" + sid + "=" + sid);
    lines_.push_back("streampath_" + sid + "=/stream/" + sid);
    lines_.push_back("streampassword_" + sid + "=" + config.sourcePassword);
    lines_.push_back("streamadminpassword_" + sid + "=" + config.adminPassword);
    lines_.push_back("streammaxuser_" + sid + "=" + std::to_string(config.maxListeners));
    lines_.push_back("streammaxbitrate_" + sid + "=" + std::to_string(config.bitrateKbps * 1000));
    lines_.push_back("streampublic_" + sid + "=" + (config.publicServer ? "always" : "never"));
}

bool ShoutcastConfigFile::removeStream(StreamRef sid) {
    size_t before = lines_.size();
    std::vector<std::string> kept;
    kept.reserve(lines_.size());
    for (const auto& line : lines_) {
        if (!belongsTo(line, sid)) {
            kept.push_back(line);
        }
    }
    // Drop a blank separator left at the end by the removed block.
    while (!kept.empty() && kept.back().empty() && kept.size() < before) {
        kept.pop_back();
    }
    bool removed = kept.size() != before;
    if (removed) {
        lines_ = std::move(kept);
    }
    return removed;
}

bool ShoutcastConfigFile::hasStream(StreamRef sid) const {
    return !streamValue("streamid", sid).empty();
}

std::string ShoutcastConfigFile::streamValue(const std::string& key, StreamRef sid) const {
    const std::string wanted = key + "_" + std::to_string(sid);
    for (const auto& line : lines_) {
        if (keyOf(line) == wanted) {
            return line.substr(line.find('=') + 1);
        }
    }
    return "";
}

std::string ShoutcastConfigFile::render() const {
    std::ostringstream oss;
    for (const auto& line : lines_) {
        oss << line << "\n";
    }
    return oss.str();
}

bool ShoutcastConfigFile::belongsTo(const std::string& line, StreamRef sid) {
    if (line == markerFor(sid)) {
        return true;
    }
    const std::string suffix = "_" + std::to_string(sid);
    std::string key = keyOf(line);
    return key.size() > suffix.size() &&
           key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace shoutcast
} // namespace streamprov
