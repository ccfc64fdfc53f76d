/**
 * @file config.hpp
 * @brief Immutable registry configuration and its layered loader.
 *
 * ## Layers (lowest to highest priority)
 *
 *   1. Built-in defaults.
 *   2. JSON config file: explicit path, else `SIMPATHS_CONFIG_FILE`.
 *   3. Environment: `SIMPATHS_PATHS_DIR`, `SIMPATHS_SIMS_DIR`,
 *      `SIMPATHS_LOCK_TIMEOUT_MS`, `SIMPATHS_LOG_LEVEL`.
 *
 * ## File format
 * @code
 * {
 *   "registry": {
 *     "paths_dir": "paths",          // relative to the config file
 *     "sims_dir": "/data/sims",
 *     "lock_timeout_ms": 5000,
 *     "fetch_endpoint": "/fetch"
 *   },
 *   "logging": { "level": "info", "file": "simpaths.log" }
 * }
 * @endcode
 *
 * The resulting value is passed into each registry component at construction
 * and is never modified afterwards.
 */
#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "simpaths/platform.hpp"
#include "simpaths/registry/outcome.hpp"

namespace simpaths::registry
{

struct SIMPATHS_EXPORT RegistryConfig
{
    std::filesystem::path registry_dir;           ///< Per-user registries and pending records.
    std::filesystem::path artifact_dir;           ///< Root of the artifacts served by fetch.
    std::chrono::milliseconds lock_timeout{5000}; ///< Bound on every user-lock wait.
    std::string fetch_endpoint{"/fetch"};         ///< Prefix of retrieval locators.
    std::string log_level{"info"};
    std::filesystem::path log_file;               ///< Empty: log to stderr.

    /// Both directories set, timeout non-negative, endpoint non-empty, log level known.
    [[nodiscard]] Status validate() const;

    /**
     * @brief Applies a config document on top of this value.
     * @param config_dir Base for relative paths in the document.
     */
    [[nodiscard]] Status apply_json(const nlohmann::json &j, const std::filesystem::path &config_dir);

    /// Applies the SIMPATHS_* environment overrides.
    [[nodiscard]] Status apply_environment();

    /**
     * @brief Full layered load followed by validate().
     * @param config_file Explicit config file; empty means `SIMPATHS_CONFIG_FILE` or none.
     */
    [[nodiscard]] static Outcome<RegistryConfig> load(const std::filesystem::path &config_file = {});
};

} // namespace simpaths::registry
