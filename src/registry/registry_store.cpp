#include "simpaths/registry/registry_store.hpp"

#include <fmt/format.h>

#include "simpaths/utils/JsonFile.hpp"
#include "simpaths/utils/Logger.hpp"

namespace simpaths::registry
{

namespace fs = std::filesystem;

namespace
{

constexpr std::string_view kPendingSuffix = "-pending";

Status not_held(const UserLock &lock)
{
    return Status::failure(lock.failure_message());
}

} // namespace

Status validate_user(std::string_view user)
{
    if (user.empty())
        return Status::failure("Invalid user name: empty");
    if (user.find('/') != std::string_view::npos || user.find('\0') != std::string_view::npos)
        return Status::failure(fmt::format("Invalid user name '{}': contains '/' or NUL", user));
    if (user.front() == '.')
        return Status::failure(fmt::format("Invalid user name '{}': starts with '.'", user));
    if (user.size() >= kPendingSuffix.size() &&
        user.substr(user.size() - kPendingSuffix.size()) == kPendingSuffix)
        return Status::failure(fmt::format("Invalid user name '{}': ends with '-pending'", user));
    return Status::success();
}

RegistryStore::RegistryStore(RegistryConfig config) : m_config(std::move(config)) {}

fs::path RegistryStore::registry_file(std::string_view user) const
{
    return m_config.registry_dir / (std::string(user) + ".json");
}

UserLock RegistryStore::lock(std::string_view user, bool soft_fail) const
{
    return UserLock::acquire(registry_file(user), m_config.lock_timeout, soft_fail);
}

Outcome<Registry> RegistryStore::load(std::string_view user) const
{
    if (auto st = validate_user(user); !st.ok)
        return Outcome<Registry>::failure(st.message);
    auto held = lock(user);
    return load_locked(held, user);
}

Outcome<Registry> RegistryStore::load_locked(const UserLock &lock, std::string_view user) const
{
    return load_file_locked(lock, registry_file(user));
}

Outcome<Registry> RegistryStore::load_file_locked(const UserLock &lock, const fs::path &file) const
{
    if (!lock)
        return Outcome<Registry>::failure(lock.failure_message());

    std::error_code ec;
    std::string detail;
    auto doc = utils::read_json_file(file, &ec, &detail);
    if (!doc)
    {
        if (ec == std::errc::no_such_file_or_directory)
        {
            LOGGER_TRACE("RegistryStore: '{}' does not exist yet, empty registry", file.string());
            return Outcome<Registry>::success(Registry{});
        }
        if (ec == std::errc::illegal_byte_sequence)
        {
            LOGGER_ERROR("RegistryStore: '{}' could not be parsed: {}", file.string(), detail);
            return Outcome<Registry>::failure(
                fmt::format("registry file {} could not be parsed: {}", file.string(), detail));
        }
        LOGGER_ERROR("RegistryStore: '{}' could not be read: {}", file.string(), ec.message());
        return Outcome<Registry>::failure(
            fmt::format("registry file {} could not be read: {}", file.string(), ec.message()));
    }

    std::string why;
    auto reg = registry_from_json(*doc, &why);
    if (!reg)
    {
        LOGGER_ERROR("RegistryStore: '{}' is malformed: {}", file.string(), why);
        return Outcome<Registry>::failure(
            fmt::format("registry file {} could not be parsed: {}", file.string(), why));
    }
    return Outcome<Registry>::success(std::move(*reg));
}

Status RegistryStore::dump(std::string_view user, const Registry &registry) const
{
    if (auto st = validate_user(user); !st.ok)
        return st;
    auto held = lock(user);
    return dump_locked(held, user, registry);
}

Status RegistryStore::dump_locked(const UserLock &lock, std::string_view user, const Registry &registry) const
{
    return dump_file_locked(lock, registry_file(user), registry);
}

Status RegistryStore::dump_file_locked(const UserLock &lock, const fs::path &file, const Registry &registry) const
{
    if (!lock)
        return not_held(lock);

    std::error_code ec;
    if (!utils::atomic_write_json(file, registry_to_json(registry), &ec, 1))
    {
        return Status::failure(fmt::format("could not write registry file {}: {}", file.string(), ec.message()));
    }
    LOGGER_DEBUG("RegistryStore: wrote {} entr{} to '{}'", registry.size(), registry.size() == 1 ? "y" : "ies",
                 file.string());
    return Status::success();
}

} // namespace simpaths::registry
