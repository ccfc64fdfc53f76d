#include "simpaths/registry/user_lock.hpp"

#include <fmt/format.h>

#include "simpaths/utils/Logger.hpp"

namespace simpaths::registry
{

namespace
{

std::string describe(std::error_code ec)
{
    if (ec == std::errc::timed_out || ec == std::errc::resource_unavailable_try_again)
        return "registry busy (lock timeout)";
    return ec.message();
}

} // namespace

LockUnavailableError::LockUnavailableError(const std::filesystem::path &resource, std::error_code ec)
    : std::runtime_error(fmt::format("could not acquire lock for {}: {}", resource.string(), describe(ec))),
      m_resource(resource), m_ec(ec)
{
}

UserLock::UserLock(std::filesystem::path resource, utils::FileLock lock)
    : m_resource(std::move(resource)), m_lock(std::move(lock))
{
    m_ec = m_lock->error_code();
}

UserLock UserLock::acquire(const std::filesystem::path &resource, std::chrono::milliseconds timeout,
                           bool soft_fail)
{
    UserLock handle(resource, utils::FileLock(resource, timeout));
    if (handle.acquired())
    {
        LOGGER_TRACE("UserLock: acquired '{}'", resource.string());
        return handle;
    }

    LOGGER_DEBUG("UserLock: could not acquire '{}' within {} ms: {}", resource.string(), timeout.count(),
                 handle.m_ec.message());
    if (!soft_fail)
        throw LockUnavailableError(resource, handle.m_ec);
    handle.m_lock.reset();
    return handle;
}

std::string UserLock::failure_message() const
{
    return fmt::format("could not acquire lock for {}: {}", m_resource.string(), describe(m_ec));
}

} // namespace simpaths::registry
