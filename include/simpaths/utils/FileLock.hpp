/*******************************************************************************
 * @file include/simpaths/utils/FileLock.hpp
 * @brief Advisory file lock RAII wrapper.
 *
 * @see tests/test_filelock.cpp
 ******************************************************************************/
#pragma once

// Usage:
//   FileLock lock(path, std::chrono::milliseconds(5000));
//   if (!lock.valid()) { handle error: lock.error_code() }
//
// Behavior:
//  - Implements an *advisory* lock. All cooperating processes and threads
//    must use the same protocol; it does not stop anyone else from touching
//    the target file.
//  - Uses a separate lock file next to the target (`/dir/alice.json` is
//    guarded by `/dir/alice.json.lock`) so the target itself can be replaced
//    by rename() while the lock is held.
//  - Uses flock() for inter-process exclusion plus a process-local registry
//    so two threads of one process also exclude each other.
//  - Movable but non-copyable. Released in the destructor on every exit path.

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <system_error>

#include "simpaths/platform.hpp"

namespace simpaths::utils
{

/**
 * @brief Behavior when the lock is already held.
 */
enum class LockMode
{
    Blocking,    ///< Wait indefinitely until the lock is acquired.
    NonBlocking, ///< Return immediately if the lock cannot be acquired.
};

struct FileLockImpl;

/**
 * @class FileLock
 * @brief RAII-style advisory file lock.
 *
 * The lock is acquired in the constructor and released in the destructor.
 *
 * @warning flock() may be unreliable on network filesystems like NFS.
 */
class SIMPATHS_EXPORT FileLock
{
  public:
    /**
     * @brief Canonical path of the lock file guarding @p path.
     *
     * Resolves symlinks when the target exists and falls back to the
     * lexically normal absolute path otherwise, so different spellings of
     * the same resource contend for the same lock.
     * @return empty path on failure.
     */
    static std::filesystem::path get_expected_lock_fullname_for(const std::filesystem::path &path) noexcept;

    explicit FileLock(const std::filesystem::path &path, LockMode mode = LockMode::Blocking) noexcept;

    /**
     * @brief Acquire within @p timeout. A zero timeout makes a single attempt.
     */
    FileLock(const std::filesystem::path &path, std::chrono::milliseconds timeout) noexcept;

    FileLock(FileLock &&other) noexcept;
    FileLock &operator=(FileLock &&other) noexcept;

    FileLock(const FileLock &) = delete;
    FileLock &operator=(const FileLock &) = delete;

    ~FileLock();

    /// True if the lock is held.
    bool valid() const noexcept;

    /**
     * @brief Error from the failed acquisition (`timed_out`,
     *        `resource_unavailable_try_again`, or an OS error). Empty when valid().
     */
    std::error_code error_code() const noexcept;

    /// Path of the held lock file, or nullopt when not valid().
    std::optional<std::filesystem::path> get_canonical_lock_file_path() const noexcept;

  private:
    struct FileLockImplDeleter
    {
        void operator()(FileLockImpl *p);
    };

    std::unique_ptr<FileLockImpl, FileLockImplDeleter> pImpl;
};

} // namespace simpaths::utils
