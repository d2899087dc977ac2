// StreamProv - Dedicated stream provisioning service
// Configuration Manager Implementation

#include "streamprov/core/config_manager.hpp"
#include "streamprov/core/structured_logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace streamprov {
namespace core {

// =============================================================================
// Simple JSON Parser (Minimal implementation for configuration)
// =============================================================================

namespace {

enum class JsonType {
    Null,
    Boolean,
    Number,
    String,
    Array,
    Object
};

struct JsonValue {
    JsonType type = JsonType::Null;
    bool boolValue = false;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    std::map<std::string, JsonValue> objectValue;

    bool isBool() const { return type == JsonType::Boolean; }
    bool isNumber() const { return type == JsonType::Number; }
    bool isString() const { return type == JsonType::String; }
    bool isObject() const { return type == JsonType::Object; }

    bool contains(const std::string& key) const {
        return isObject() && objectValue.find(key) != objectValue.end();
    }

    const JsonValue& operator[](const std::string& key) const {
        static const JsonValue nullValue;
        if (!isObject()) return nullValue;
        auto it = objectValue.find(key);
        return it != objectValue.end() ? it->second : nullValue;
    }
};

std::optional<double> parseDouble(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<uint64_t> parseUnsigned(const std::string& text) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
            [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

std::optional<bool> parseBoolText(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        return false;
    }
    return std::nullopt;
}

class JsonParser {
public:
    explicit JsonParser(const std::string& input) : input_(input), pos_(0) {}

    Result<JsonValue, ConfigError> parse() {
        skipWhitespace();
        auto result = parseValue();
        if (result.isError()) {
            return result;
        }
        skipWhitespace();
        if (pos_ < input_.size()) {
            return fail("Unexpected characters after JSON value");
        }
        return result;
    }

private:
    const std::string& input_;
    size_t pos_;

    Result<JsonValue, ConfigError> fail(const std::string& message) const {
        return Result<JsonValue, ConfigError>::error(
            ConfigError(ConfigError::Code::ParseError, message, "", currentLine()));
    }

    int currentLine() const {
        return 1 + static_cast<int>(std::count(input_.begin(),
            input_.begin() + static_cast<std::ptrdiff_t>(std::min(pos_, input_.size())), '\n'));
    }

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_]))) {
            pos_++;
        }
    }

    char peek() const {
        return pos_ < input_.size() ? input_[pos_] : '\0';
    }

    char consume() {
        return pos_ < input_.size() ? input_[pos_++] : '\0';
    }

    bool match(char c) {
        if (peek() == c) {
            consume();
            return true;
        }
        return false;
    }

    Result<JsonValue, ConfigError> parseValue() {
        skipWhitespace();
        char c = peek();

        if (c == '"') return parseString();
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't' || c == 'f') return parseBool();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        if (c == '\0') {
            return fail("Unexpected end of input");
        }
        return fail("Unexpected character: " + std::string(1, c));
    }

    Result<JsonValue, ConfigError> parseString() {
        if (!match('"')) {
            return fail("Expected '\"'");
        }

        std::string result;
        while (pos_ < input_.size() && peek() != '"') {
            char c = consume();
            if (c == '\\') {
                char escaped = consume();
                switch (escaped) {
                    case '"': result += '"'; break;
                    case '\\': result += '\\'; break;
                    case '/': result += '/'; break;
                    case 'b': result += '\b'; break;
                    case 'f': result += '\f'; break;
                    case 'n': result += '\n'; break;
                    case 'r': result += '\r'; break;
                    case 't': result += '\t'; break;
                    default: result += escaped; break;
                }
            } else {
                result += c;
            }
        }

        if (!match('"')) {
            return fail("Unterminated string");
        }

        JsonValue value;
        value.type = JsonType::String;
        value.stringValue = std::move(result);
        return Result<JsonValue, ConfigError>::success(std::move(value));
    }

    Result<JsonValue, ConfigError> parseNumber() {
        size_t start = pos_;
        if (peek() == '-') consume();

        while (std::isdigit(static_cast<unsigned char>(peek()))) consume();

        if (peek() == '.') {
            consume();
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        if (peek() == 'e' || peek() == 'E') {
            consume();
            if (peek() == '+' || peek() == '-') consume();
            while (std::isdigit(static_cast<unsigned char>(peek()))) consume();
        }

        std::string numStr = input_.substr(start, pos_ - start);
        auto number = parseDouble(numStr);
        if (!number) {
            return fail("Invalid number: " + numStr);
        }

        JsonValue value;
        value.type = JsonType::Number;
        value.numberValue = *number;
        return Result<JsonValue, ConfigError>::success(std::move(value));
    }

    Result<JsonValue, ConfigError> parseBool() {
        JsonValue value;
        value.type = JsonType::Boolean;
        if (input_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            value.boolValue = true;
            return Result<JsonValue, ConfigError>::success(std::move(value));
        }
        if (input_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return Result<JsonValue, ConfigError>::success(std::move(value));
        }
        return fail("Expected 'true' or 'false'");
    }

    Result<JsonValue, ConfigError> parseNull() {
        if (input_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return Result<JsonValue, ConfigError>::success(JsonValue{});
        }
        return fail("Expected 'null'");
    }

    Result<JsonValue, ConfigError> parseArray() {
        if (!match('[')) {
            return fail("Expected '['");
        }

        JsonValue value;
        value.type = JsonType::Array;

        skipWhitespace();
        if (match(']')) {
            return Result<JsonValue, ConfigError>::success(std::move(value));
        }

        while (true) {
            auto elementResult = parseValue();
            if (elementResult.isError()) {
                return elementResult;
            }
            value.arrayValue.push_back(std::move(elementResult.value()));

            skipWhitespace();
            if (match(']')) break;
            if (!match(',')) {
                return fail("Expected ',' or ']' in array");
            }
        }

        return Result<JsonValue, ConfigError>::success(std::move(value));
    }

    Result<JsonValue, ConfigError> parseObject() {
        if (!match('{')) {
            return fail("Expected '{'");
        }

        JsonValue value;
        value.type = JsonType::Object;

        skipWhitespace();
        if (match('}')) {
            return Result<JsonValue, ConfigError>::success(std::move(value));
        }

        while (true) {
            skipWhitespace();
            auto keyResult = parseString();
            if (keyResult.isError()) {
                return fail("Expected string key in object");
            }
            std::string key = keyResult.value().stringValue;

            skipWhitespace();
            if (!match(':')) {
                return fail("Expected ':' after key");
            }

            auto valueResult = parseValue();
            if (valueResult.isError()) {
                return valueResult;
            }
            value.objectValue[key] = std::move(valueResult.value());

            skipWhitespace();
            if (match('}')) break;
            if (!match(',')) {
                return fail("Expected ',' or '}' in object");
            }
        }

        return Result<JsonValue, ConfigError>::success(std::move(value));
    }
};

// =============================================================================
// Simple YAML Parser (block mappings and scalars only)
// =============================================================================

class YamlParser {
public:
    explicit YamlParser(const std::string& input) : input_(input) {}

    Result<JsonValue, ConfigError> parse() {
        lines_.clear();
        std::istringstream stream(input_);
        std::string line;
        while (std::getline(stream, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            lines_.push_back(line);
        }

        for (size_t i = 0; i < lines_.size(); ++i) {
            if (!isBlankOrComment(lines_[i]) &&
                lines_[i].find('\t') < lines_[i].find_first_not_of(" \t")) {
                return Result<JsonValue, ConfigError>::error(
                    ConfigError(ConfigError::Code::ParseError,
                                "Tabs are not allowed for indentation", "",
                                static_cast<int>(i + 1)));
            }
        }

        JsonValue root;
        root.type = JsonType::Object;
        auto result = parseObject(root.objectValue, 0, 0, lines_.size());
        if (result.isError()) {
            return Result<JsonValue, ConfigError>::error(result.error());
        }
        return Result<JsonValue, ConfigError>::success(std::move(root));
    }

private:
    std::string input_;
    std::vector<std::string> lines_;

    static size_t getIndent(const std::string& line) {
        size_t indent = 0;
        for (char c : line) {
            if (c == ' ') indent++;
            else break;
        }
        return indent;
    }

    static std::string trim(const std::string& s) {
        size_t start = 0;
        while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
        size_t end = s.size();
        while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
        return s.substr(start, end - start);
    }

    static bool isBlankOrComment(const std::string& line) {
        std::string trimmed = trim(line);
        return trimmed.empty() || trimmed[0] == '#';
    }

    // Strips a trailing " # comment" outside of quotes.
    static std::string stripComment(const std::string& value) {
        char quote = '\0';
        for (size_t i = 0; i < value.size(); ++i) {
            char c = value[i];
            if (quote != '\0') {
                if (c == quote) quote = '\0';
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '#' && (i == 0 || value[i - 1] == ' ')) {
                return trim(value.substr(0, i));
            }
        }
        return value;
    }

    Result<void, ConfigError> parseObject(std::map<std::string, JsonValue>& obj,
                                          size_t baseIndent, size_t startLine, size_t endLine) {
        size_t i = startLine;
        while (i < endLine) {
            if (isBlankOrComment(lines_[i])) {
                i++;
                continue;
            }

            size_t indent = getIndent(lines_[i]);
            if (indent < baseIndent) {
                break;
            }

            std::string line = trim(lines_[i]);
            size_t colonPos = line.find(':');
            if (colonPos == std::string::npos) {
                return Result<void, ConfigError>::error(
                    ConfigError(ConfigError::Code::ParseError,
                                "Expected 'key: value'", "", static_cast<int>(i + 1)));
            }

            std::string key = trim(line.substr(0, colonPos));
            std::string valueStr = stripComment(trim(line.substr(colonPos + 1)));

            if (valueStr.empty()) {
                size_t nestedEnd = i + 1;
                size_t nestedIndent = 0;
                while (nestedEnd < endLine) {
                    if (isBlankOrComment(lines_[nestedEnd])) {
                        nestedEnd++;
                        continue;
                    }
                    size_t childIndent = getIndent(lines_[nestedEnd]);
                    if (childIndent <= indent) {
                        break;
                    }
                    if (nestedIndent == 0) {
                        nestedIndent = childIndent;
                    }
                    nestedEnd++;
                }

                JsonValue nested;
                if (nestedIndent > 0) {
                    nested.type = JsonType::Object;
                    auto result = parseObject(nested.objectValue, nestedIndent, i + 1, nestedEnd);
                    if (result.isError()) {
                        return result;
                    }
                }
                obj[key] = std::move(nested);
                i = nestedEnd;
            } else {
                obj[key] = parseScalar(valueStr);
                i++;
            }
        }
        return Result<void, ConfigError>::success();
    }

    static JsonValue parseScalar(const std::string& value) {
        JsonValue result;

        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            result.type = JsonType::String;
            result.stringValue = value.substr(1, value.size() - 2);
            return result;
        }

        if (value == "true" || value == "True" || value == "TRUE") {
            result.type = JsonType::Boolean;
            result.boolValue = true;
            return result;
        }
        if (value == "false" || value == "False" || value == "FALSE") {
            result.type = JsonType::Boolean;
            result.boolValue = false;
            return result;
        }

        if (value == "null" || value == "~") {
            return result;
        }

        if (auto number = parseDouble(value)) {
            result.type = JsonType::Number;
            result.numberValue = *number;
            return result;
        }

        result.type = JsonType::String;
        result.stringValue = value;
        return result;
    }
};

// =============================================================================
// Tree -> Configuration
// =============================================================================

ConfigError validationError(const std::string& field, const std::string& message) {
    return ConfigError(ConfigError::Code::ValidationError, field + " " + message, field);
}

// Reads an unsigned integer field; absent keys leave out untouched.
template <typename T>
Result<void, ConfigError> readUnsigned(const JsonValue& section, const std::string& sectionName,
                                       const std::string& key, T& out) {
    if (!section.contains(key)) {
        return Result<void, ConfigError>::success();
    }
    const JsonValue& value = section[key];
    std::string field = sectionName + "." + key;
    if (!value.isNumber() || value.numberValue < 0 ||
        value.numberValue > static_cast<double>(std::numeric_limits<T>::max()) ||
        value.numberValue != static_cast<double>(static_cast<uint64_t>(value.numberValue))) {
        return Result<void, ConfigError>::error(
            validationError(field, "must be an unsigned integer in range"));
    }
    out = static_cast<T>(value.numberValue);
    return Result<void, ConfigError>::success();
}

Result<void, ConfigError> readBool(const JsonValue& section, const std::string& sectionName,
                                   const std::string& key, bool& out) {
    if (!section.contains(key)) {
        return Result<void, ConfigError>::success();
    }
    const JsonValue& value = section[key];
    if (!value.isBool()) {
        return Result<void, ConfigError>::error(
            validationError(sectionName + "." + key, "must be a boolean"));
    }
    out = value.boolValue;
    return Result<void, ConfigError>::success();
}

// Numbers are accepted and rendered back to text (YAML passwords like 12345).
Result<void, ConfigError> readString(const JsonValue& section, const std::string& sectionName,
                                     const std::string& key, std::string& out) {
    if (!section.contains(key)) {
        return Result<void, ConfigError>::success();
    }
    const JsonValue& value = section[key];
    if (value.isString()) {
        out = value.stringValue;
    } else if (value.isNumber()) {
        std::ostringstream oss;
        oss << value.numberValue;
        out = oss.str();
    } else {
        return Result<void, ConfigError>::error(
            validationError(sectionName + "." + key, "must be a string"));
    }
    return Result<void, ConfigError>::success();
}

#define STREAMPROV_CONFIG_TRY(expr) \
    do { \
        auto _r = (expr); \
        if (_r.isError()) return _r; \
    } while (0)

Result<void, ConfigError> applyTree(const JsonValue& root, Configuration& config) {
    if (!root.isObject()) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ParseError, "Configuration root must be an object"));
    }

    if (root.contains("pool")) {
        const JsonValue& s = root["pool"];
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "pool", "rangeStart", config.pool.rangeStart));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "pool", "rangeEnd", config.pool.rangeEnd));
    }

    if (root.contains("defaults")) {
        const JsonValue& s = root["defaults"];
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "defaults", "bitrate", config.defaults.bitrate));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "defaults", "maxListeners", config.defaults.maxListeners));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "defaults", "sampleRate", config.defaults.sampleRate));
        STREAMPROV_CONFIG_TRY(readString(s, "defaults", "genre", config.defaults.genre));
        STREAMPROV_CONFIG_TRY(readBool(s, "defaults", "publicServer", config.defaults.publicServer));
    }

    if (root.contains("streamingServer")) {
        const JsonValue& s = root["streamingServer"];
        auto& ss = config.streamingServer;
        STREAMPROV_CONFIG_TRY(readString(s, "streamingServer", "name", ss.name));
        STREAMPROV_CONFIG_TRY(readString(s, "streamingServer", "hostname", ss.hostname));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "streamingServer", "adminPort", ss.adminPort));
        STREAMPROV_CONFIG_TRY(readString(s, "streamingServer", "adminPassword", ss.adminPassword));
        STREAMPROV_CONFIG_TRY(readString(s, "streamingServer", "publicHost", ss.publicHost));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "streamingServer", "maxStreams", ss.maxStreams));
        STREAMPROV_CONFIG_TRY(readString(s, "streamingServer", "configFilePath", ss.configFilePath));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "streamingServer", "requestTimeoutMs", ss.requestTimeoutMs));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "streamingServer", "circuitBreakerThreshold",
                                           ss.circuitBreakerThreshold));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "streamingServer", "circuitBreakerResetMs",
                                           ss.circuitBreakerResetMs));
    }

    if (root.contains("database")) {
        STREAMPROV_CONFIG_TRY(readString(root["database"], "database", "path", config.database.path));
    }

    if (root.contains("logging")) {
        const JsonValue& s = root["logging"];
        auto& lg = config.logging;
        if (s.contains("level")) {
            std::string levelStr;
            STREAMPROV_CONFIG_TRY(readString(s, "logging", "level", levelStr));
            auto level = parseLogLevel(levelStr);
            if (!level) {
                return Result<void, ConfigError>::error(
                    ConfigError(ConfigError::Code::ValidationError,
                                "Invalid logging.level: " + levelStr +
                                ". Valid values: debug, info, warning, error",
                                "logging.level"));
            }
            lg.level = *level;
        }
        STREAMPROV_CONFIG_TRY(readBool(s, "logging", "enableConsole", lg.enableConsole));
        STREAMPROV_CONFIG_TRY(readBool(s, "logging", "enableFile", lg.enableFile));
        STREAMPROV_CONFIG_TRY(readString(s, "logging", "filePath", lg.filePath));
        STREAMPROV_CONFIG_TRY(readBool(s, "logging", "enableJson", lg.enableJson));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "logging", "maxFileSizeMB", lg.maxFileSizeMB));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "logging", "maxFiles", lg.maxFiles));
        STREAMPROV_CONFIG_TRY(readBool(s, "logging", "compress", lg.compress));
    }

    if (root.contains("monitoring")) {
        const JsonValue& s = root["monitoring"];
        auto& mon = config.monitoring;
        STREAMPROV_CONFIG_TRY(readBool(s, "monitoring", "enabled", mon.enabled));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "monitoring", "sampleIntervalMs", mon.sampleIntervalMs));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "monitoring", "recentSampleLimit", mon.recentSampleLimit));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "monitoring", "defaultStatsDays", mon.defaultStatsDays));
    }

    if (root.contains("provisioning")) {
        const JsonValue& s = root["provisioning"];
        auto& prov = config.provisioning;
        STREAMPROV_CONFIG_TRY(readBool(s, "provisioning", "kickSourceOnSuspend", prov.kickSourceOnSuspend));
        STREAMPROV_CONFIG_TRY(readBool(s, "provisioning", "verifyAfterProvision", prov.verifyAfterProvision));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "provisioning", "verificationMaxAttempts",
                                           prov.verificationMaxAttempts));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "provisioning", "verificationRetryDelayMs",
                                           prov.verificationRetryDelayMs));
        STREAMPROV_CONFIG_TRY(readUnsigned(s, "provisioning", "workerThreads", prov.workerThreads));
    }

    return Result<void, ConfigError>::success();
}

#undef STREAMPROV_CONFIG_TRY

const char* boolText(bool value) {
    return value ? "true" : "false";
}

std::string mask(const std::string& secret) {
    return secret.empty() ? "" : "********";
}

} // anonymous namespace

std::optional<LogLevel> parseLogLevel(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    return std::nullopt;
}

// =============================================================================
// ConfigManager Implementation
// =============================================================================

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

Result<void, ConfigError> ConfigManager::loadFromFile(const std::string& filePath) {
    auto format = detectFormat(filePath);
    if (!format) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::UnsupportedFormat,
                        "Unsupported configuration file format. Use .json, .yaml, or .yml"));
    }

    auto contentResult = readFile(filePath);
    if (contentResult.isError()) {
        return Result<void, ConfigError>::error(contentResult.error());
    }

    log("Loading configuration from " + filePath);
    if (*format == ConfigFormat::JSON) {
        return loadFromJsonString(contentResult.value());
    }
    return loadFromYamlString(contentResult.value());
}

Result<void, ConfigError> ConfigManager::loadFromJsonString(const std::string& jsonContent) {
    auto result = parseJson(jsonContent);
    if (result.isSuccess()) {
        logEffectiveConfig();
    }
    return result;
}

Result<void, ConfigError> ConfigManager::loadFromYamlString(const std::string& yamlContent) {
    auto result = parseYaml(yamlContent);
    if (result.isSuccess()) {
        logEffectiveConfig();
    }
    return result;
}

Result<void, ConfigError> ConfigManager::loadDefaults() {
    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = Configuration{};
    }
    log("Configuration loaded with default values");
    logEffectiveConfig();
    return Result<void, ConfigError>::success();
}

void ConfigManager::applyEnvironmentOverrides() {
    std::unique_lock<std::shared_mutex> lock(configMutex_);

    auto overridePort = [this](const char* name, uint16_t& target) {
        if (auto val = getEnvVar(name)) {
            auto number = parseUnsigned(*val);
            if (number && *number > 0 && *number <= 65535) {
                target = static_cast<uint16_t>(*number);
                log(std::string("Environment override: ") + name + "=" + *val);
            } else {
                log(std::string("Warning: Invalid ") + name + " value: " + *val);
            }
        }
    };

    auto overrideBool = [this](const char* name, bool& target) {
        if (auto val = getEnvVar(name)) {
            if (auto parsed = parseBoolText(*val)) {
                target = *parsed;
                log(std::string("Environment override: ") + name + "=" + *val);
            } else {
                log(std::string("Warning: Invalid ") + name + " value: " + *val);
            }
        }
    };

    if (auto val = getEnvVar("STREAMPROV_DB_PATH")) {
        config_.database.path = *val;
        log("Environment override: STREAMPROV_DB_PATH=" + *val);
    }

    overridePort("STREAMPROV_PORT_RANGE_START", config_.pool.rangeStart);
    overridePort("STREAMPROV_PORT_RANGE_END", config_.pool.rangeEnd);

    if (auto val = getEnvVar("STREAMPROV_SERVER_HOST")) {
        config_.streamingServer.hostname = *val;
        log("Environment override: STREAMPROV_SERVER_HOST=" + *val);
    }

    overridePort("STREAMPROV_SERVER_ADMIN_PORT", config_.streamingServer.adminPort);

    if (auto val = getEnvVar("STREAMPROV_SERVER_ADMIN_PASSWORD")) {
        config_.streamingServer.adminPassword = *val;
        log("Environment override: STREAMPROV_SERVER_ADMIN_PASSWORD=********");
    }

    if (auto val = getEnvVar("STREAMPROV_SERVER_PUBLIC_HOST")) {
        config_.streamingServer.publicHost = *val;
        log("Environment override: STREAMPROV_SERVER_PUBLIC_HOST=" + *val);
    }

    if (auto val = getEnvVar("STREAMPROV_LOG_LEVEL")) {
        if (auto level = parseLogLevel(*val)) {
            config_.logging.level = *level;
            log("Environment override: STREAMPROV_LOG_LEVEL=" + *val);
        } else {
            log("Warning: Invalid STREAMPROV_LOG_LEVEL value: " + *val);
        }
    }

    overrideBool("STREAMPROV_LOG_JSON", config_.logging.enableJson);

    if (auto val = getEnvVar("STREAMPROV_MONITOR_INTERVAL_MS")) {
        auto number = parseUnsigned(*val);
        if (number && *number <= std::numeric_limits<uint32_t>::max()) {
            config_.monitoring.sampleIntervalMs = static_cast<uint32_t>(*number);
            log("Environment override: STREAMPROV_MONITOR_INTERVAL_MS=" + *val);
        } else {
            log("Warning: Invalid STREAMPROV_MONITOR_INTERVAL_MS value: " + *val);
        }
    }

    overrideBool("STREAMPROV_KICK_SOURCE_ON_SUSPEND", config_.provisioning.kickSourceOnSuspend);
}

Result<void, ConfigError> ConfigManager::validate() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    const auto& pool = config_.pool;
    if (pool.rangeStart < 1024 || pool.rangeEnd < 1024) {
        return Result<void, ConfigError>::error(
            validationError("pool.rangeStart", "and pool.rangeEnd must be >= 1024"));
    }
    if (pool.rangeStart > pool.rangeEnd) {
        return Result<void, ConfigError>::error(
            validationError("pool.rangeStart", "must be <= pool.rangeEnd"));
    }

    const auto& server = config_.streamingServer;
    if (server.hostname.empty()) {
        return Result<void, ConfigError>::error(
            validationError("streamingServer.hostname", "is required"));
    }
    if (server.adminPort == 0) {
        return Result<void, ConfigError>::error(
            validationError("streamingServer.adminPort", "must be between 1 and 65535"));
    }
    if (server.adminPassword.empty()) {
        return Result<void, ConfigError>::error(
            validationError("streamingServer.adminPassword", "is required"));
    }
    if (server.requestTimeoutMs < 100 || server.requestTimeoutMs > 60000) {
        return Result<void, ConfigError>::error(
            validationError("streamingServer.requestTimeoutMs", "must be between 100 and 60000"));
    }
    if (server.circuitBreakerThreshold == 0) {
        return Result<void, ConfigError>::error(
            validationError("streamingServer.circuitBreakerThreshold", "must be greater than 0"));
    }

    if (config_.defaults.maxListeners == 0 || config_.defaults.bitrate == 0) {
        return Result<void, ConfigError>::error(
            validationError("defaults", "bitrate and maxListeners must be greater than 0"));
    }

    if (config_.database.path.empty()) {
        return Result<void, ConfigError>::error(
            validationError("database.path", "is required"));
    }

    if (config_.logging.enableFile && config_.logging.filePath.empty()) {
        return Result<void, ConfigError>::error(
            validationError("logging.filePath", "is required when file logging is enabled"));
    }

    if (config_.monitoring.sampleIntervalMs < 100) {
        return Result<void, ConfigError>::error(
            validationError("monitoring.sampleIntervalMs", "must be >= 100"));
    }

    if (config_.provisioning.verificationMaxAttempts == 0) {
        return Result<void, ConfigError>::error(
            validationError("provisioning.verificationMaxAttempts", "must be greater than 0"));
    }
    if (config_.provisioning.workerThreads == 0) {
        return Result<void, ConfigError>::error(
            validationError("provisioning.workerThreads", "must be greater than 0"));
    }

    return Result<void, ConfigError>::success();
}

Configuration ConfigManager::getConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return config_;
}

std::string ConfigManager::dumpConfig(ConfigFormat format) const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    const auto& c = config_;
    std::ostringstream ss;

    if (format == ConfigFormat::JSON) {
        ss << "{\n";
        ss << "  \"pool\": {\n";
        ss << "    \"rangeStart\": " << c.pool.rangeStart << ",\n";
        ss << "    \"rangeEnd\": " << c.pool.rangeEnd << "\n";
        ss << "  },\n";
        ss << "  \"defaults\": {\n";
        ss << "    \"bitrate\": " << c.defaults.bitrate << ",\n";
        ss << "    \"maxListeners\": " << c.defaults.maxListeners << ",\n";
        ss << "    \"sampleRate\": " << c.defaults.sampleRate << ",\n";
        ss << "    \"genre\": \"" << c.defaults.genre << "\",\n";
        ss << "    \"publicServer\": " << boolText(c.defaults.publicServer) << "\n";
        ss << "  },\n";
        ss << "  \"streamingServer\": {\n";
        ss << "    \"name\": \"" << c.streamingServer.name << "\",\n";
        ss << "    \"hostname\": \"" << c.streamingServer.hostname << "\",\n";
        ss << "    \"adminPort\": " << c.streamingServer.adminPort << ",\n";
        ss << "    \"adminPassword\": \"" << mask(c.streamingServer.adminPassword) << "\",\n";
        ss << "    \"publicHost\": \"" << c.streamingServer.effectivePublicHost() << "\",\n";
        ss << "    \"maxStreams\": " << c.streamingServer.maxStreams << ",\n";
        ss << "    \"configFilePath\": \"" << c.streamingServer.configFilePath << "\",\n";
        ss << "    \"requestTimeoutMs\": " << c.streamingServer.requestTimeoutMs << "\n";
        ss << "  },\n";
        ss << "  \"database\": {\n";
        ss << "    \"path\": \"" << c.database.path << "\"\n";
        ss << "  },\n";
        ss << "  \"logging\": {\n";
        ss << "    \"level\": \"" << logLevelToString(c.logging.level) << "\",\n";
        ss << "    \"enableConsole\": " << boolText(c.logging.enableConsole) << ",\n";
        ss << "    \"enableFile\": " << boolText(c.logging.enableFile) << ",\n";
        ss << "    \"enableJson\": " << boolText(c.logging.enableJson) << "\n";
        ss << "  },\n";
        ss << "  \"monitoring\": {\n";
        ss << "    \"enabled\": " << boolText(c.monitoring.enabled) << ",\n";
        ss << "    \"sampleIntervalMs\": " << c.monitoring.sampleIntervalMs << "\n";
        ss << "  },\n";
        ss << "  \"provisioning\": {\n";
        ss << "    \"kickSourceOnSuspend\": " << boolText(c.provisioning.kickSourceOnSuspend) << ",\n";
        ss << "    \"verifyAfterProvision\": " << boolText(c.provisioning.verifyAfterProvision) << "\n";
        ss << "  }\n";
        ss << "}\n";
    } else {
        ss << "pool:\n";
        ss << "  rangeStart: " << c.pool.rangeStart << "\n";
        ss << "  rangeEnd: " << c.pool.rangeEnd << "\n";
        ss << "defaults:\n";
        ss << "  bitrate: " << c.defaults.bitrate << "\n";
        ss << "  maxListeners: " << c.defaults.maxListeners << "\n";
        ss << "  sampleRate: " << c.defaults.sampleRate << "\n";
        ss << "  genre: \"" << c.defaults.genre << "\"\n";
        ss << "  publicServer: " << boolText(c.defaults.publicServer) << "\n";
        ss << "streamingServer:\n";
        ss << "  name: \"" << c.streamingServer.name << "\"\n";
        ss << "  hostname: \"" << c.streamingServer.hostname << "\"\n";
        ss << "  adminPort: " << c.streamingServer.adminPort << "\n";
        ss << "  adminPassword: \"" << mask(c.streamingServer.adminPassword) << "\"\n";
        ss << "  publicHost: \"" << c.streamingServer.effectivePublicHost() << "\"\n";
        ss << "  maxStreams: " << c.streamingServer.maxStreams << "\n";
        ss << "  configFilePath: \"" << c.streamingServer.configFilePath << "\"\n";
        ss << "  requestTimeoutMs: " << c.streamingServer.requestTimeoutMs << "\n";
        ss << "database:\n";
        ss << "  path: \"" << c.database.path << "\"\n";
        ss << "logging:\n";
        ss << "  level: " << logLevelToString(c.logging.level) << "\n";
        ss << "  enableConsole: " << boolText(c.logging.enableConsole) << "\n";
        ss << "  enableFile: " << boolText(c.logging.enableFile) << "\n";
        ss << "  enableJson: " << boolText(c.logging.enableJson) << "\n";
        ss << "monitoring:\n";
        ss << "  enabled: " << boolText(c.monitoring.enabled) << "\n";
        ss << "  sampleIntervalMs: " << c.monitoring.sampleIntervalMs << "\n";
        ss << "provisioning:\n";
        ss << "  kickSourceOnSuspend: " << boolText(c.provisioning.kickSourceOnSuspend) << "\n";
        ss << "  verifyAfterProvision: " << boolText(c.provisioning.verifyAfterProvision) << "\n";
    }

    return ss.str();
}

void ConfigManager::setLogCallback(ConfigLogCallback callback) {
    std::lock_guard<std::mutex> lock(logMutex_);
    logCallback_ = std::move(callback);
}

// =============================================================================
// Private Implementation
// =============================================================================

Result<void, ConfigError> ConfigManager::parseJson(const std::string& content) {
    JsonParser parser(content);
    auto result = parser.parse();
    if (result.isError()) {
        return Result<void, ConfigError>::error(result.error());
    }

    Configuration parsed;
    auto applied = applyTree(result.value(), parsed);
    if (applied.isError()) {
        return applied;
    }

    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = std::move(parsed);
    }
    return Result<void, ConfigError>::success();
}

Result<void, ConfigError> ConfigManager::parseYaml(const std::string& content) {
    YamlParser parser(content);
    auto result = parser.parse();
    if (result.isError()) {
        return Result<void, ConfigError>::error(result.error());
    }

    Configuration parsed;
    auto applied = applyTree(result.value(), parsed);
    if (applied.isError()) {
        return applied;
    }

    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = std::move(parsed);
    }
    return Result<void, ConfigError>::success();
}

std::optional<ConfigFormat> ConfigManager::detectFormat(const std::string& filePath) const {
    auto dot = filePath.find_last_of('.');
    if (dot == std::string::npos) {
        return std::nullopt;
    }

    std::string ext = filePath.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "json") {
        return ConfigFormat::JSON;
    }
    if (ext == "yaml" || ext == "yml") {
        return ConfigFormat::YAML;
    }
    return std::nullopt;
}

Result<std::string, ConfigError> ConfigManager::readFile(const std::string& filePath) const {
    std::ifstream file(filePath, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::FileNotFound,
                        "Configuration file not found: " + filePath));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Result<std::string, ConfigError>::error(
            ConfigError(ConfigError::Code::IOError,
                        "Failed to read configuration file: " + filePath));
    }
    return Result<std::string, ConfigError>::success(ss.str());
}

std::optional<std::string> ConfigManager::getEnvVar(const char* name) const {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

void ConfigManager::log(const std::string& message) const {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logCallback_) {
        logCallback_(message);
    }
}

void ConfigManager::logEffectiveConfig() const {
    Configuration snapshot = getConfig();
    std::ostringstream ss;
    ss << "Effective configuration: pool=" << snapshot.pool.rangeStart << "-" << snapshot.pool.rangeEnd
       << " server=" << snapshot.streamingServer.hostname << ":" << snapshot.streamingServer.adminPort
       << " database=" << snapshot.database.path
       << " log_level=" << logLevelToString(snapshot.logging.level)
       << " monitoring=" << boolText(snapshot.monitoring.enabled)
       << " interval_ms=" << snapshot.monitoring.sampleIntervalMs;
    log(ss.str());
}

} // namespace core
} // namespace streamprov
