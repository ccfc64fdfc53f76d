/**
 * @file pending_store.hpp
 * @brief Pending records: `<registry_dir>/<user>-<TOKEN>-pending[.json]`.
 *
 * A pending record is a single not-yet-merged entry dropped by an
 * out-of-band writer (a finished job). TOKEN is any non-empty string without
 * '-'; `submit` uses 16 hex digits and the `.json` suffix. File names are
 * parsed from the right, so a user name that contains '-' still maps to
 * exactly one owner.
 */
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "simpaths/platform.hpp"
#include "simpaths/registry/config.hpp"
#include "simpaths/registry/entry.hpp"
#include "simpaths/registry/outcome.hpp"

namespace simpaths::registry
{

class SIMPATHS_EXPORT PendingStore
{
  public:
    explicit PendingStore(RegistryConfig config);

    /// Owner of a pending-record file name, or nullopt if @p filename is not one.
    static std::optional<std::string> owner_of(std::string_view filename);

    /// True for `<user>-<TOKEN>-pending` with or without `.json`.
    static bool is_pending_file(std::string_view filename) { return owner_of(filename).has_value(); }

    /// Pending-record files of @p user, sorted by name.
    std::vector<std::filesystem::path> enumerate(std::string_view user) const;

    /**
     * @brief Reads one pending record into an Entry.
     *
     * Normalizes `holding` and stamps `created` from the artifact's on-disk
     * change time. Fails (leaving the file alone) when the record does not
     * parse, lacks `path`/`file`, has a bad `holding`, or its artifact does
     * not exist.
     */
    std::optional<Entry> read(const std::filesystem::path &pending_file, std::string *why = nullptr) const;

    /**
     * @brief Writes a new pending record atomically.
     * @param holding Seconds as a number, or "inf".
     */
    [[nodiscard]] Status submit(std::string_view user, const std::string &path, const std::filesystem::path &file,
                                const nlohmann::json &holding, const nlohmann::json &jobid = nullptr) const;

    /// Removes a consumed record. A record already gone is not an error.
    bool remove(const std::filesystem::path &pending_file, std::error_code *ec = nullptr) const noexcept;

  private:
    RegistryConfig m_config;
};

/// Artifact change time (st_ctime) in seconds since the epoch.
SIMPATHS_EXPORT std::optional<double> artifact_ctime(const std::filesystem::path &file, std::error_code *ec = nullptr);

} // namespace simpaths::registry
