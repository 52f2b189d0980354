// BatchCollapse - Coalescing retention timer
// Configuration Manager - Loads and validates engine settings
//
// Responsibilities:
// - Parse JSON configuration files
// - Support environment variable overrides for containerized deployments
// - Validate settings before an engine is built from them
// - Apply the built-in defaults when no configuration file is present
// - Report the effective configuration through a log callback

#ifndef BATCHCOLLAPSE_CORE_CONFIG_MANAGER_HPP
#define BATCHCOLLAPSE_CORE_CONFIG_MANAGER_HPP

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

#include "batchcollapse/core/result.hpp"
#include "batchcollapse/core/types.hpp"
#include "batchcollapse/pal/pal_types.hpp"

namespace batchcollapse {
namespace core {

// =============================================================================
// Configuration Structures
// =============================================================================

/**
 * @brief Engine timing and capacity section ("collapse").
 */
struct CollapseSettings {
    uint32_t retentionMs = collapse::DEFAULT_RETENTION_MS;        ///< Retention window
    uint32_t maxDurationMs = collapse::DEFAULT_MAX_DURATION_MS;   ///< Flush ceiling
    uint32_t pollIntervalMs = collapse::DEFAULT_POLL_INTERVAL_MS; ///< Driver wake-up period
    uint64_t maxPendingKeys = collapse::UNLIMITED_PENDING_KEYS;   ///< 0 = unlimited
};

/**
 * @brief Logging section ("logging").
 */
struct LoggingSettings {
    pal::LogLevel level = pal::LogLevel::Info;  ///< Minimum level
    bool syslog = true;                         ///< Write to syslog
    bool stderrOutput = true;                   ///< Write to stderr
};

/**
 * @brief Shutdown signal section ("shutdown").
 */
struct ShutdownSettings {
    bool handleSigterm = true;   ///< Cancel (and drain) on SIGTERM
    bool handleSigint = false;   ///< Cancel (and drain) on SIGINT
};

/**
 * @brief Complete configuration.
 */
struct Configuration {
    CollapseSettings collapse;
    LoggingSettings logging;
    ShutdownSettings shutdown;
};

// =============================================================================
// Configuration Error
// =============================================================================

/**
 * @brief Configuration error with detailed information.
 */
struct ConfigError {
    enum class Code {
        None,
        FileNotFound,
        ParseError,
        ValidationError,
        IOError
    };

    Code code = Code::None;
    std::string message;
    std::string field;        ///< Field that caused the error (if applicable)
    int line = -1;            ///< Line number in config file (if applicable)

    ConfigError() = default;
    ConfigError(Code c, std::string msg) : code(c), message(std::move(msg)) {}
    ConfigError(Code c, std::string msg, std::string f)
        : code(c), message(std::move(msg)), field(std::move(f)) {}
    ConfigError(Code c, std::string msg, std::string f, int l)
        : code(c), message(std::move(msg)), field(std::move(f)), line(l) {}
};

/**
 * @brief Log callback type for configuration logging.
 */
using ConfigLogCallback = std::function<void(const std::string&)>;

/**
 * @brief Parse a level name (trace|debug|info|warning|error|critical|off).
 *
 * Case-insensitive; "warn" is accepted for warning.
 */
std::optional<pal::LogLevel> parseLogLevel(const std::string& name);

// =============================================================================
// Configuration Manager
// =============================================================================

/**
 * @brief Loads engine configuration.
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - Uses shared_mutex for read/write locking
 *
 * Usage example:
 * @code
 * ConfigManager manager;
 * manager.setLogCallback([](const std::string& msg) {
 *     std::cout << msg << std::endl;
 * });
 *
 * auto result = manager.loadFromFile("collapse.json");
 * if (result.isError()) {
 *     manager.loadDefaults();
 * }
 * manager.applyEnvironmentOverrides();
 *
 * auto validateResult = manager.validate();
 * if (validateResult.isError()) {
 *     std::cerr << "Config error: " << validateResult.error().message;
 *     return 1;
 * }
 *
 * auto config = manager.getConfig();
 * @endcode
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    // -------------------------------------------------------------------------
    // Configuration Loading
    // -------------------------------------------------------------------------

    /**
     * @brief Load configuration from a JSON file.
     *
     * Keys absent from the file keep their current values.
     *
     * @return FileNotFound, IOError, ParseError or ValidationError on failure
     */
    Result<void, ConfigError> loadFromFile(const std::string& filePath);

    /**
     * @brief Load configuration from a JSON string.
     */
    Result<void, ConfigError> loadFromJsonString(const std::string& jsonContent);

    /**
     * @brief Reset every setting to its default.
     */
    Result<void, ConfigError> loadDefaults();

    // -------------------------------------------------------------------------
    // Environment Variable Overrides
    // -------------------------------------------------------------------------

    /**
     * @brief Apply environment variable overrides.
     *
     * Supported environment variables:
     * - BATCHCOLLAPSE_RETENTION_MS
     * - BATCHCOLLAPSE_MAX_DURATION_MS
     * - BATCHCOLLAPSE_POLL_INTERVAL_MS
     * - BATCHCOLLAPSE_MAX_PENDING_KEYS
     * - BATCHCOLLAPSE_LOG_LEVEL (trace|debug|info|warning|error|critical|off)
     *
     * Invalid values are reported through the log callback and ignored.
     */
    void applyEnvironmentOverrides();

    // -------------------------------------------------------------------------
    // Validation
    // -------------------------------------------------------------------------

    /**
     * @brief Validate the current configuration.
     *
     * pollIntervalMs must be positive. maxDurationMs below retentionMs is
     * reported through the log callback but accepted; the ceiling then
     * caps the retention window.
     */
    Result<void, ConfigError> validate() const;

    // -------------------------------------------------------------------------
    // Configuration Access
    // -------------------------------------------------------------------------

    /**
     * @brief Snapshot of the current configuration.
     */
    Configuration getConfig() const;

    /**
     * @brief Effective configuration rendered as JSON.
     */
    std::string dumpConfig() const;

    /**
     * @brief Set the configuration log callback.
     *
     * Invoked for environment overrides, validation warnings and the
     * effective configuration after every successful load.
     */
    void setLogCallback(ConfigLogCallback callback);

private:
    Result<void, ConfigError> parseJson(const std::string& content);

    Result<std::string, ConfigError> readFile(const std::string& filePath) const;

    std::optional<std::string> getEnvVar(const std::string& name) const;

    template<typename T>
    void overrideUnsigned(const char* name, T& target);

    void log(const std::string& message) const;

    void logEffectiveConfig() const;

    mutable std::shared_mutex configMutex_;
    Configuration config_;

    mutable std::mutex logMutex_;
    ConfigLogCallback logCallback_;
};

} // namespace core
} // namespace batchcollapse

#endif // BATCHCOLLAPSE_CORE_CONFIG_MANAGER_HPP
