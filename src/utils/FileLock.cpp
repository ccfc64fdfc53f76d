/*******************************************************************************
 * @file FileLock.cpp
 * @brief Implementation of the RAII-style advisory file lock.
 *
 * @see include/simpaths/utils/FileLock.hpp
 *
 * **Implementation Details**
 *
 * 1.  **Pimpl and RAII**: `FileLockImpl` holds the descriptor of the `.lock`
 *     file and the state flags. The custom deleter `FileLockImplDeleter`
 *     releases the OS lock and the process-local lock, so release happens on
 *     every exit path, including stack unwinding.
 *
 * 2.  **Path canonicalization**: `get_expected_lock_fullname_for` is the single
 *     source of truth for mapping a resource to its lock file. It uses
 *     `weakly_canonical`, which resolves symlinks in the existing prefix and
 *     therefore yields the same answer before and after the target is created.
 *
 * 3.  **Two-layer locking (`open_and_lock`)**:
 *     - Layer 1, process-local (`acquire_process_local_lock`): a registry maps
 *       the lock key to an owner count and a condition variable. flock() locks
 *       are per open file description, so without this layer two threads of
 *       one process opening the lock file separately would still exclude each
 *       other, but waiting would be a busy poll; the registry lets them sleep.
 *     - Layer 2, OS-level (`run_os_lock_loop`): flock() on the lock file,
 *       polled with LOCK_NB when a timeout applies.
 *     If layer 2 fails, layer 1 is rolled back.
 *
 * 4.  **Single deadline**: a timed acquisition computes one deadline and both
 *     layers wait against it, so the total wait never exceeds the timeout.
 ******************************************************************************/
#include "simpaths/utils/FileLock.hpp"

#include <cerrno>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include "simpaths/utils/Logger.hpp"

namespace simpaths::utils
{

// Polling interval for the OS-level timed lock loop.
static constexpr std::chrono::milliseconds LOCK_POLLING_INTERVAL = std::chrono::milliseconds(10);

using Clock = std::chrono::steady_clock;

// --- Process-local lock registry ---

static std::mutex g_proc_registry_mtx;
struct ProcLockState
{
    int owners = 0;  // FileLock instances in this process holding the lock (0 or 1).
    int waiters = 0; // Threads in this process waiting for the lock.
    std::condition_variable cv;
};
// Map: canonical lock file path -> shared state for that lock.
static std::unordered_map<std::string, std::shared_ptr<ProcLockState>> g_proc_locks;

struct FileLockImpl
{
    std::filesystem::path path;                     // Resource path as given by the caller.
    std::filesystem::path canonical_lock_file_path; // Absolute path of the .lock file.
    bool valid = false;
    std::error_code ec;
    std::string lock_key;
    std::shared_ptr<ProcLockState> proc_state;
    int fd = -1;
};

// Drops one process-local ownership and wakes waiters. Caller holds g_proc_registry_mtx.
static void release_proc_state_locked(FileLockImpl *p)
{
    if (!p->proc_state)
        return;
    if (--p->proc_state->owners == 0)
    {
        p->proc_state->cv.notify_all();
        if (p->proc_state->waiters == 0)
        {
            g_proc_locks.erase(p->lock_key);
        }
    }
    p->proc_state.reset();
}

void FileLock::FileLockImplDeleter::operator()(FileLockImpl *p)
{
    if (!p)
        return;

    if (p->valid)
    {
        LOGGER_TRACE("FileLock: releasing lock for '{}'", p->path.string());
        ::flock(p->fd, LOCK_UN);
        ::close(p->fd);
        p->fd = -1;
        p->valid = false;
    }

    if (p->proc_state)
    {
        std::lock_guard<std::mutex> lg(g_proc_registry_mtx);
        release_proc_state_locked(p);
    }

    delete p;
}

static void open_and_lock(FileLockImpl *pImpl, LockMode mode, std::optional<Clock::time_point> deadline);
static bool acquire_process_local_lock(FileLockImpl *pImpl, LockMode mode,
                                       std::optional<Clock::time_point> deadline);
static std::error_code ensure_lock_directory(FileLockImpl *pImpl);
static bool run_os_lock_loop(FileLockImpl *pImpl, LockMode mode,
                             std::optional<Clock::time_point> deadline);

std::filesystem::path FileLock::get_expected_lock_fullname_for(const std::filesystem::path &target) noexcept
{
    try
    {
        std::error_code ec;
        auto canonical_target = std::filesystem::weakly_canonical(target, ec);
        if (ec)
        {
            canonical_target = std::filesystem::absolute(target).lexically_normal();
        }
        auto p = canonical_target;
        p += ".lock";
        return p;
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("FileLock::get_expected_lock_fullname_for failed for '{}': {}", target.string(),
                     e.what());
        return {};
    }
}

FileLock::FileLock(const std::filesystem::path &path, LockMode mode) noexcept : pImpl(nullptr)
{
    try
    {
        pImpl.reset(new FileLockImpl);
        pImpl->path = path;
        open_and_lock(pImpl.get(), mode, std::nullopt);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("FileLock: acquisition for '{}' threw: {}", path.string(), e.what());
        if (pImpl)
            pImpl->ec = std::make_error_code(std::errc::io_error);
    }
}

FileLock::FileLock(const std::filesystem::path &path, std::chrono::milliseconds timeout) noexcept
    : pImpl(nullptr)
{
    try
    {
        pImpl.reset(new FileLockImpl);
        pImpl->path = path;
        auto deadline = Clock::now() + (timeout.count() < 0 ? std::chrono::milliseconds(0) : timeout);
        open_and_lock(pImpl.get(), LockMode::Blocking, deadline);
    }
    catch (const std::exception &e)
    {
        LOGGER_ERROR("FileLock: timed acquisition for '{}' threw: {}", path.string(), e.what());
        if (pImpl)
            pImpl->ec = std::make_error_code(std::errc::io_error);
    }
}

FileLock::~FileLock() = default;
FileLock::FileLock(FileLock &&) noexcept = default;
FileLock &FileLock::operator=(FileLock &&) noexcept = default;

bool FileLock::valid() const noexcept
{
    return pImpl && pImpl->valid;
}

std::error_code FileLock::error_code() const noexcept
{
    if (!pImpl)
        return std::make_error_code(std::errc::not_enough_memory);
    return pImpl->ec;
}

std::optional<std::filesystem::path> FileLock::get_canonical_lock_file_path() const noexcept
{
    if (pImpl && pImpl->valid)
    {
        return pImpl->canonical_lock_file_path;
    }
    return std::nullopt;
}

// Main orchestration logic for acquiring a lock.
static void open_and_lock(FileLockImpl *pImpl, LockMode mode, std::optional<Clock::time_point> deadline)
{
    pImpl->valid = false;
    pImpl->ec.clear();
    LOGGER_TRACE("FileLock: attempting {} lock on '{}'",
                 deadline ? "timed" : (mode == LockMode::Blocking ? "blocking" : "non-blocking"),
                 pImpl->path.string());

    auto lockpath = FileLock::get_expected_lock_fullname_for(pImpl->path);
    if (lockpath.empty())
    {
        pImpl->ec = std::make_error_code(std::errc::invalid_argument);
        return;
    }
    pImpl->canonical_lock_file_path = lockpath;
    pImpl->lock_key = lockpath.generic_string();

    if (!acquire_process_local_lock(pImpl, mode, deadline))
        return;

    if (auto ec = ensure_lock_directory(pImpl); ec)
    {
        pImpl->ec = ec;
        std::lock_guard<std::mutex> lg(g_proc_registry_mtx);
        release_proc_state_locked(pImpl);
        return;
    }

    if (!run_os_lock_loop(pImpl, mode, deadline))
    {
        std::lock_guard<std::mutex> lg(g_proc_registry_mtx);
        release_proc_state_locked(pImpl);
        return;
    }

    pImpl->valid = true;
}

static bool acquire_process_local_lock(FileLockImpl *pImpl, LockMode mode,
                                       std::optional<Clock::time_point> deadline)
{
    std::unique_lock<std::mutex> regl(g_proc_registry_mtx);
    auto &state_ref = g_proc_locks[pImpl->lock_key];
    if (!state_ref)
    {
        state_ref = std::make_shared<ProcLockState>();
    }
    auto state = state_ref;

    if (state->owners > 0)
    {
        if (mode == LockMode::NonBlocking)
        {
            pImpl->ec = std::make_error_code(std::errc::resource_unavailable_try_again);
            LOGGER_DEBUG("FileLock: non-blocking lock on '{}' failed: held in-process.",
                         pImpl->path.string());
            return false;
        }

        LOGGER_TRACE("FileLock: lock on '{}' waiting for in-process release.", pImpl->path.string());
        state->waiters++;
        bool acquired = true;
        if (deadline)
        {
            acquired = state->cv.wait_until(regl, *deadline, [&] { return state->owners == 0; });
        }
        else
        {
            state->cv.wait(regl, [&] { return state->owners == 0; });
        }
        state->waiters--;

        if (!acquired)
        {
            pImpl->ec = std::make_error_code(std::errc::timed_out);
            LOGGER_DEBUG("FileLock: timed out waiting for in-process lock on '{}'", pImpl->path.string());
            if (state->owners == 0 && state->waiters == 0)
            {
                g_proc_locks.erase(pImpl->lock_key);
            }
            return false;
        }
    }

    state->owners++;
    pImpl->proc_state = state;
    return true;
}

static std::error_code ensure_lock_directory(FileLockImpl *pImpl)
{
    auto parent_dir = pImpl->canonical_lock_file_path.parent_path();
    if (parent_dir.empty())
        return {};
    std::error_code create_ec;
    std::filesystem::create_directories(parent_dir, create_ec);
    if (create_ec)
    {
        LOGGER_WARN("FileLock: create_directories failed for {}: {}", parent_dir.string(),
                    create_ec.message());
    }
    return create_ec;
}

static bool run_os_lock_loop(FileLockImpl *pImpl, LockMode mode, std::optional<Clock::time_point> deadline)
{
    const auto &lockpath = pImpl->canonical_lock_file_path;

    int open_flags = O_CREAT | O_RDWR;
#ifdef O_CLOEXEC
    open_flags |= O_CLOEXEC;
#endif
    int fd = ::open(lockpath.c_str(), open_flags, 0666);
    if (fd == -1)
    {
        pImpl->ec = std::error_code(errno, std::generic_category());
        LOGGER_WARN("FileLock: open failed for '{}': {}", lockpath.string(), pImpl->ec.message());
        return false;
    }

    int flock_op = LOCK_EX;
    if (mode == LockMode::NonBlocking || deadline)
    {
        flock_op |= LOCK_NB;
    }

    while (true)
    {
        if (::flock(fd, flock_op) == 0)
        {
            pImpl->fd = fd;
            return true;
        }

        int errnum = errno;
        if (errnum == EINTR)
            continue;
        if (errnum != EWOULDBLOCK && errnum != EAGAIN)
        {
            ::close(fd);
            pImpl->ec = std::error_code(errnum, std::generic_category());
            LOGGER_WARN("FileLock: flock failed for '{}': {}", lockpath.string(), pImpl->ec.message());
            return false;
        }

        if (mode == LockMode::NonBlocking)
        {
            ::close(fd);
            pImpl->ec = std::make_error_code(std::errc::resource_unavailable_try_again);
            return false;
        }

        if (deadline && Clock::now() >= *deadline)
        {
            ::close(fd);
            pImpl->ec = std::make_error_code(std::errc::timed_out);
            LOGGER_DEBUG("FileLock: timed out waiting for '{}' held by another process",
                         lockpath.string());
            return false;
        }
        std::this_thread::sleep_for(LOCK_POLLING_INTERVAL);
    }
}

} // namespace simpaths::utils
