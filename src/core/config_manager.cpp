// BatchCollapse - Coalescing retention timer
// Configuration Manager Implementation

#include "batchcollapse/core/config_manager.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace batchcollapse {
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
        int line = 1 + static_cast<int>(std::count(input_.begin(), input_.begin() + static_cast<std::ptrdiff_t>(pos_), '\n'));
        return Result<JsonValue, ConfigError>::error(
            ConfigError(ConfigError::Code::ParseError, message, "", line));
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

    bool matchLiteral(const char* literal) {
        std::string word(literal);
        if (input_.compare(pos_, word.size(), word) == 0) {
            pos_ += word.size();
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
        try {
            JsonValue value;
            value.type = JsonType::Number;
            value.numberValue = std::stod(numStr);
            return Result<JsonValue, ConfigError>::success(std::move(value));
        } catch (const std::exception&) {
            return fail("Invalid number: " + numStr);
        }
    }

    Result<JsonValue, ConfigError> parseBool() {
        JsonValue value;
        value.type = JsonType::Boolean;
        if (matchLiteral("true")) {
            value.boolValue = true;
            return Result<JsonValue, ConfigError>::success(std::move(value));
        }
        if (matchLiteral("false")) {
            value.boolValue = false;
            return Result<JsonValue, ConfigError>::success(std::move(value));
        }
        return fail("Expected 'true' or 'false'");
    }

    Result<JsonValue, ConfigError> parseNull() {
        if (matchLiteral("null")) {
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
            if (peek() != '"') {
                return fail("Expected string key in object");
            }
            auto keyResult = parseString();
            if (keyResult.isError()) {
                return keyResult;
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
// Field Readers
// =============================================================================

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

/**
 * Reads section[key] as a non-negative integer no larger than maxValue.
 * Leaves target unchanged when the key is absent.
 */
template<typename T>
std::optional<ConfigError> readUnsigned(
    const JsonValue& section,
    const std::string& sectionName,
    const std::string& key,
    T& target
) {
    if (!section.contains(key)) {
        return std::nullopt;
    }

    std::string field = sectionName + "." + key;
    const JsonValue& node = section[key];
    double maxValue = static_cast<double>(std::numeric_limits<T>::max());

    if (!node.isNumber() || node.numberValue < 0 || node.numberValue > maxValue ||
        std::floor(node.numberValue) != node.numberValue) {
        return ConfigError(ConfigError::Code::ValidationError,
                           field + " must be a non-negative integer", field);
    }

    target = static_cast<T>(node.numberValue);
    return std::nullopt;
}

std::optional<ConfigError> readBool(
    const JsonValue& section,
    const std::string& sectionName,
    const std::string& key,
    bool& target
) {
    if (!section.contains(key)) {
        return std::nullopt;
    }

    std::string field = sectionName + "." + key;
    const JsonValue& node = section[key];
    if (!node.isBool()) {
        return ConfigError(ConfigError::Code::ValidationError,
                           field + " must be true or false", field);
    }

    target = node.boolValue;
    return std::nullopt;
}

bool isUnsignedInteger(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // anonymous namespace

std::optional<pal::LogLevel> parseLogLevel(const std::string& name) {
    std::string lower = toLower(name);
    if (lower == "trace") return pal::LogLevel::Trace;
    if (lower == "debug") return pal::LogLevel::Debug;
    if (lower == "info") return pal::LogLevel::Info;
    if (lower == "warning" || lower == "warn") return pal::LogLevel::Warning;
    if (lower == "error") return pal::LogLevel::Error;
    if (lower == "critical") return pal::LogLevel::Critical;
    if (lower == "off") return pal::LogLevel::Off;
    return std::nullopt;
}

// =============================================================================
// ConfigManager Implementation
// =============================================================================

ConfigManager::ConfigManager() {
    config_ = Configuration{};
}

ConfigManager::~ConfigManager() = default;

Result<void, ConfigError> ConfigManager::loadFromFile(const std::string& filePath) {
    auto contentResult = readFile(filePath);
    if (contentResult.isError()) {
        return Result<void, ConfigError>::error(contentResult.error());
    }

    return loadFromJsonString(contentResult.value());
}

Result<void, ConfigError> ConfigManager::loadFromJsonString(const std::string& jsonContent) {
    auto result = parseJson(jsonContent);
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

template<typename T>
void ConfigManager::overrideUnsigned(const char* name, T& target) {
    auto val = getEnvVar(name);
    if (!val) {
        return;
    }

    if (isUnsignedInteger(*val)) {
        try {
            unsigned long long parsed = std::stoull(*val);
            if (parsed <= static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
                target = static_cast<T>(parsed);
                log(std::string("Environment override: ") + name + "=" + *val);
                return;
            }
        } catch (const std::out_of_range&) {
            // Reported below
        }
    }

    log(std::string("Warning: Invalid ") + name + " value: " + *val);
}

void ConfigManager::applyEnvironmentOverrides() {
    std::unique_lock<std::shared_mutex> lock(configMutex_);

    overrideUnsigned("BATCHCOLLAPSE_RETENTION_MS", config_.collapse.retentionMs);
    overrideUnsigned("BATCHCOLLAPSE_MAX_DURATION_MS", config_.collapse.maxDurationMs);
    overrideUnsigned("BATCHCOLLAPSE_POLL_INTERVAL_MS", config_.collapse.pollIntervalMs);
    overrideUnsigned("BATCHCOLLAPSE_MAX_PENDING_KEYS", config_.collapse.maxPendingKeys);

    if (auto val = getEnvVar("BATCHCOLLAPSE_LOG_LEVEL")) {
        if (auto level = parseLogLevel(*val)) {
            config_.logging.level = *level;
            log("Environment override: BATCHCOLLAPSE_LOG_LEVEL=" + *val);
        } else {
            log("Warning: Invalid BATCHCOLLAPSE_LOG_LEVEL value: " + *val);
        }
    }
}

Result<void, ConfigError> ConfigManager::validate() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);

    if (config_.collapse.pollIntervalMs == 0) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ValidationError,
                       "collapse.pollIntervalMs must be greater than 0",
                       "collapse.pollIntervalMs"));
    }

    if (config_.collapse.maxDurationMs < config_.collapse.retentionMs) {
        log("Warning: collapse.maxDurationMs (" + std::to_string(config_.collapse.maxDurationMs) +
            ") is below collapse.retentionMs (" + std::to_string(config_.collapse.retentionMs) +
            "); the ceiling caps the retention window");
    }

    return Result<void, ConfigError>::success();
}

Configuration ConfigManager::getConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    return config_;
}

std::string ConfigManager::dumpConfig() const {
    std::shared_lock<std::shared_mutex> lock(configMutex_);
    std::ostringstream ss;

    ss << "{\n";
    ss << "  \"collapse\": {\n";
    ss << "    \"retentionMs\": " << config_.collapse.retentionMs << ",\n";
    ss << "    \"maxDurationMs\": " << config_.collapse.maxDurationMs << ",\n";
    ss << "    \"pollIntervalMs\": " << config_.collapse.pollIntervalMs << ",\n";
    ss << "    \"maxPendingKeys\": " << config_.collapse.maxPendingKeys << "\n";
    ss << "  },\n";
    ss << "  \"logging\": {\n";
    ss << "    \"level\": \"" << pal::logLevelToString(config_.logging.level) << "\",\n";
    ss << "    \"syslog\": " << (config_.logging.syslog ? "true" : "false") << ",\n";
    ss << "    \"stderr\": " << (config_.logging.stderrOutput ? "true" : "false") << "\n";
    ss << "  },\n";
    ss << "  \"shutdown\": {\n";
    ss << "    \"handleSigterm\": " << (config_.shutdown.handleSigterm ? "true" : "false") << ",\n";
    ss << "    \"handleSigint\": " << (config_.shutdown.handleSigint ? "true" : "false") << "\n";
    ss << "  }\n";
    ss << "}\n";

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

    const JsonValue& root = result.value();
    if (!root.isObject()) {
        return Result<void, ConfigError>::error(
            ConfigError(ConfigError::Code::ParseError,
                       "Configuration root must be an object"));
    }

    // Applied to a copy; a failing file leaves the current configuration intact
    Configuration updated = getConfig();
    std::optional<ConfigError> fieldError;

    if (root.contains("collapse")) {
        const JsonValue& section = root["collapse"];
        if (!fieldError) fieldError = readUnsigned(section, "collapse", "retentionMs", updated.collapse.retentionMs);
        if (!fieldError) fieldError = readUnsigned(section, "collapse", "maxDurationMs", updated.collapse.maxDurationMs);
        if (!fieldError) fieldError = readUnsigned(section, "collapse", "pollIntervalMs", updated.collapse.pollIntervalMs);
        if (!fieldError) fieldError = readUnsigned(section, "collapse", "maxPendingKeys", updated.collapse.maxPendingKeys);
    }

    if (!fieldError && root.contains("logging")) {
        const JsonValue& section = root["logging"];
        if (section.contains("level")) {
            const JsonValue& levelNode = section["level"];
            auto level = levelNode.isString() ? parseLogLevel(levelNode.stringValue) : std::nullopt;
            if (!level) {
                fieldError = ConfigError(ConfigError::Code::ValidationError,
                    "Invalid logging.level. Valid values: trace, debug, info, warning, error, critical, off",
                    "logging.level");
            } else {
                updated.logging.level = *level;
            }
        }
        if (!fieldError) fieldError = readBool(section, "logging", "syslog", updated.logging.syslog);
        if (!fieldError) fieldError = readBool(section, "logging", "stderr", updated.logging.stderrOutput);
    }

    if (!fieldError && root.contains("shutdown")) {
        const JsonValue& section = root["shutdown"];
        if (!fieldError) fieldError = readBool(section, "shutdown", "handleSigterm", updated.shutdown.handleSigterm);
        if (!fieldError) fieldError = readBool(section, "shutdown", "handleSigint", updated.shutdown.handleSigint);
    }

    if (fieldError) {
        return Result<void, ConfigError>::error(*fieldError);
    }

    {
        std::unique_lock<std::shared_mutex> lock(configMutex_);
        config_ = updated;
    }
    return Result<void, ConfigError>::success();
}

Result<std::string, ConfigError> ConfigManager::readFile(const std::string& filePath) const {
    std::ifstream file(filePath);
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
                       "Error reading configuration file: " + filePath));
    }

    return Result<std::string, ConfigError>::success(ss.str());
}

std::optional<std::string> ConfigManager::getEnvVar(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

void ConfigManager::log(const std::string& message) const {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (logCallback_) {
        logCallback_(message);
    }
}

void ConfigManager::logEffectiveConfig() const {
    Configuration snapshot = getConfig();

    log("Effective configuration:");
    log("  collapse.retentionMs: " + std::to_string(snapshot.collapse.retentionMs));
    log("  collapse.maxDurationMs: " + std::to_string(snapshot.collapse.maxDurationMs));
    log("  collapse.pollIntervalMs: " + std::to_string(snapshot.collapse.pollIntervalMs));
    log("  collapse.maxPendingKeys: " + std::to_string(snapshot.collapse.maxPendingKeys));
    log("  logging.level: " + std::string(pal::logLevelToString(snapshot.logging.level)));
    log("  logging.syslog: " + std::string(snapshot.logging.syslog ? "true" : "false"));
    log("  logging.stderr: " + std::string(snapshot.logging.stderrOutput ? "true" : "false"));
    log("  shutdown.handleSigterm: " + std::string(snapshot.shutdown.handleSigterm ? "true" : "false"));
    log("  shutdown.handleSigint: " + std::string(snapshot.shutdown.handleSigint ? "true" : "false"));
}

} // namespace core
} // namespace batchcollapse
