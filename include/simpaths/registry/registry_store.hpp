/**
 * @file registry_store.hpp
 * @brief Durable per-user registry files: `<registry_dir>/<user>.json`.
 *
 * `load`/`dump` take the user's lock themselves. The `_locked` variants run
 * inside a critical section the caller already holds, so several steps
 * (load, merge, dump) can share one acquisition. A `_locked` call with a
 * handle that is not acquired short-circuits to a failure.
 */
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "simpaths/platform.hpp"
#include "simpaths/registry/config.hpp"
#include "simpaths/registry/entry.hpp"
#include "simpaths/registry/outcome.hpp"
#include "simpaths/registry/user_lock.hpp"

namespace simpaths::registry
{

/**
 * @brief Rejects names that cannot map to exactly one registry file.
 *
 * Valid: non-empty, no '/' or NUL, no leading '.', not ending in "-pending".
 */
SIMPATHS_EXPORT Status validate_user(std::string_view user);

class SIMPATHS_EXPORT RegistryStore
{
  public:
    explicit RegistryStore(RegistryConfig config);

    const RegistryConfig &config() const noexcept { return m_config; }

    std::filesystem::path registry_file(std::string_view user) const;

    /// Acquires the user's lock with the configured timeout.
    [[nodiscard]] UserLock lock(std::string_view user, bool soft_fail = true) const;

    /**
     * @brief Loads the registry under the user's lock.
     *
     * An absent file is an empty registry (ok). Failing to obtain the lock and
     * an unparseable file are failures with distinct messages.
     */
    [[nodiscard]] Outcome<Registry> load(std::string_view user) const;
    [[nodiscard]] Outcome<Registry> load_locked(const UserLock &lock, std::string_view user) const;

    /// Atomically replaces the registry file under the user's lock.
    [[nodiscard]] Status dump(std::string_view user, const Registry &registry) const;
    [[nodiscard]] Status dump_locked(const UserLock &lock, std::string_view user, const Registry &registry) const;

    /**
     * @brief Loads a registry file by path; used by the sweeper, which
     *        discovers files rather than users. Caller holds the lock.
     */
    [[nodiscard]] Outcome<Registry> load_file_locked(const UserLock &lock, const std::filesystem::path &file) const;
    [[nodiscard]] Status dump_file_locked(const UserLock &lock, const std::filesystem::path &file,
                                          const Registry &registry) const;

  private:
    RegistryConfig m_config;
};

} // namespace simpaths::registry
