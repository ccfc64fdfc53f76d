/**
 * @file entry.hpp
 * @brief One path registration and the per-user registry mapping.
 */
#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "simpaths/platform.hpp"

namespace simpaths::registry
{

/**
 * @brief Metadata for one registered artifact.
 *
 * `holding` is the retention in seconds; +infinity means never expire. It is
 * stored on disk as a number, or as the string "inf" for infinity.
 */
struct Entry
{
    std::string path;          ///< Logical key, unique within one user's registry.
    std::string file;          ///< Absolute location of the backing artifact.
    std::string user;
    nlohmann::json jobid;      ///< Provenance; number or string, null when unknown.
    double created = 0.0;      ///< Artifact creation time, seconds since the epoch.
    double holding = 0.0;

    bool operator==(const Entry &) const = default;
};

/// path -> Entry. Iteration order is ascending by path.
using Registry = std::map<std::string, Entry>;

/**
 * @brief Coerces a stored `holding` value to seconds.
 *
 * Accepts a JSON number, or a string holding a decimal number, "inf",
 * "infinity" or "+inf" (case-insensitive). Negative values and NaN are
 * rejected.
 */
SIMPATHS_EXPORT std::optional<double> normalize_holding(const nlohmann::json &value) noexcept;

/// Serialized form of @p holding: "inf" for infinity, a number otherwise.
SIMPATHS_EXPORT nlohmann::json holding_to_json(double holding);

SIMPATHS_EXPORT nlohmann::json entry_to_json(const Entry &entry);

/**
 * @brief Parses one stored entry.
 *
 * `path` and `file` must be strings, `holding` must pass normalize_holding().
 * `created`, `user` and `jobid` are optional.
 * @return std::nullopt and a reason in @p why on malformed input.
 */
SIMPATHS_EXPORT std::optional<Entry> entry_from_json(const nlohmann::json &j, std::string *why = nullptr);

SIMPATHS_EXPORT nlohmann::json registry_to_json(const Registry &registry);

/**
 * @brief Parses a whole registry document (an object keyed by path).
 *
 * Unlike a pending record, every registry entry must carry `created`.
 * @return std::nullopt and a reason in @p why if the document or any entry is malformed.
 */
SIMPATHS_EXPORT std::optional<Registry> registry_from_json(const nlohmann::json &j,
                                                           std::string *why = nullptr);

} // namespace simpaths::registry
