/**
 * @file user_lock.hpp
 * @brief Scoped, bounded-wait exclusive lock on one registry resource.
 *
 * A thin policy layer over `utils::FileLock`: adds the soft-fail contract
 * (return a "not acquired" handle instead of failing hard) used by every
 * registry operation.
 *
 * @code
 * auto lock = UserLock::acquire(store.registry_file("alice"), cfg.lock_timeout, true);
 * if (!lock)
 *     return Outcome<Registry>::failure(lock.failure_message());
 * // ... critical section; released at scope exit
 * @endcode
 */
#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

#include "simpaths/platform.hpp"
#include "simpaths/utils/FileLock.hpp"

namespace simpaths::registry
{

/// Thrown by UserLock::acquire when soft_fail is false and the lock is not obtained.
class SIMPATHS_EXPORT LockUnavailableError : public std::runtime_error
{
  public:
    LockUnavailableError(const std::filesystem::path &resource, std::error_code ec);

    const std::filesystem::path &resource() const noexcept { return m_resource; }
    std::error_code code() const noexcept { return m_ec; }

  private:
    std::filesystem::path m_resource;
    std::error_code m_ec;
};

class SIMPATHS_EXPORT UserLock
{
  public:
    /**
     * @brief Acquires the lock guarding @p resource within @p timeout.
     *
     * @param soft_fail If true, a failed acquisition returns a handle whose
     *        acquired() is false. If false, it throws LockUnavailableError.
     */
    [[nodiscard]] static UserLock acquire(const std::filesystem::path &resource,
                                          std::chrono::milliseconds timeout, bool soft_fail = true);

    UserLock(UserLock &&) noexcept = default;
    UserLock &operator=(UserLock &&) noexcept = default;
    UserLock(const UserLock &) = delete;
    UserLock &operator=(const UserLock &) = delete;
    ~UserLock() = default;

    bool acquired() const noexcept { return m_lock && m_lock->valid(); }
    explicit operator bool() const noexcept { return acquired(); }

    const std::filesystem::path &resource() const noexcept { return m_resource; }
    std::error_code error_code() const noexcept { return m_ec; }

    /// "could not acquire lock for <resource>: <cause>"
    std::string failure_message() const;

    /// Releases early. Idempotent.
    void release() noexcept { m_lock.reset(); }

  private:
    UserLock(std::filesystem::path resource, utils::FileLock lock);

    std::filesystem::path m_resource;
    std::optional<utils::FileLock> m_lock;
    std::error_code m_ec;
};

} // namespace simpaths::registry
