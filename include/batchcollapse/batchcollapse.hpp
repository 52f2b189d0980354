// BatchCollapse - Coalescing retention timer
// Main header file

#ifndef BATCHCOLLAPSE_BATCHCOLLAPSE_HPP
#define BATCHCOLLAPSE_BATCHCOLLAPSE_HPP

/**
 * @file batchcollapse.hpp
 * @brief Main header file for the BatchCollapse library
 *
 * BatchCollapse coalesces a rapid sequence of values into a single delayed
 * callback per key. Each arrival re-arms a retention window; a maximum
 * duration bounds how long a pending value can wait under continuous
 * arrivals.
 */

// Version information
#define BATCHCOLLAPSE_VERSION_MAJOR 0
#define BATCHCOLLAPSE_VERSION_MINOR 1
#define BATCHCOLLAPSE_VERSION_PATCH 0
#define BATCHCOLLAPSE_VERSION_STRING "0.1.0"

#include "batchcollapse/core/batch_collapse.hpp"
#include "batchcollapse/core/config_manager.hpp"
#include "batchcollapse/core/error_codes.hpp"
#include "batchcollapse/core/result.hpp"
#include "batchcollapse/core/types.hpp"

#include <utility>

namespace batchcollapse {

/**
 * @brief Get the library version as a string.
 * @return Version string in format "major.minor.patch"
 */
inline const char* version() {
    return BATCHCOLLAPSE_VERSION_STRING;
}

/**
 * @brief Build an engine configuration from loaded settings.
 *
 * Timer and logger are left empty (platform timer, no logging).
 */
template<typename Value>
core::CollapseConfig<Value> makeCollapseConfig(
    const core::CollapseSettings& settings,
    core::ExecuteFunction<Value> executeFunc
) {
    core::CollapseConfig<Value> config;
    config.retentionDuration = std::chrono::milliseconds{settings.retentionMs};
    config.maxDuration = std::chrono::milliseconds{settings.maxDurationMs};
    config.pollInterval = std::chrono::milliseconds{settings.pollIntervalMs};
    config.maxPendingKeys = static_cast<std::size_t>(settings.maxPendingKeys);
    config.executeFunc = std::move(executeFunc);
    return config;
}

} // namespace batchcollapse

#endif // BATCHCOLLAPSE_BATCHCOLLAPSE_HPP
