#include "simpaths/registry/path_registry.hpp"

#include <cerrno>
#include <cstring>
#include <type_traits>

#include <unistd.h>

#include <fmt/format.h>

#include "simpaths/utils/Logger.hpp"

namespace simpaths::registry
{

namespace fs = std::filesystem;

namespace
{

template <typename T> Outcome<T> bad_user(std::string_view user)
{
    return Outcome<T>::failure(validate_user(user).message);
}

} // namespace

PathRegistry::PathRegistry(RegistryConfig config, std::vector<std::shared_ptr<const TableReader>> readers)
    : m_config(std::move(config)), m_store(m_config), m_pending(m_config), m_reconciler(m_store, m_pending),
      m_locator(m_config), m_readers(std::move(readers))
{
}

Outcome<std::vector<std::string>> PathRegistry::list_paths(std::string_view user,
                                                           const std::optional<std::string> &pattern) const
{
    using Result = Outcome<std::vector<std::string>>;
    if (!validate_user(user).ok)
        return bad_user<std::vector<std::string>>(user);

    std::optional<GlobMatcher> matcher;
    if (pattern)
    {
        auto compiled = GlobMatcher::compile(*pattern);
        if (!compiled.ok)
            return Result::failure(compiled.message);
        matcher.emplace(std::move(compiled).content());
    }

    auto reg = m_reconciler.reconcile(user);
    if (!reg.ok)
        return Result::propagate(reg);

    std::vector<std::string> paths;
    paths.reserve(reg.content().size());
    for (const auto &[key, entry] : reg.content())
    {
        if (!matcher || matcher->matches(key))
            paths.push_back(key);
    }
    return Result::success(std::move(paths), "Paths listed");
}

Outcome<std::vector<Entry>> PathRegistry::get_info(std::string_view user, std::optional<std::vector<std::string>> paths,
                                                   std::optional<std::string> pattern) const
{
    auto selector = make_selector(std::move(paths), std::move(pattern));
    if (!selector.ok)
        return Outcome<std::vector<Entry>>::propagate(selector);
    return get_info(user, selector.content());
}

Outcome<std::vector<Entry>> PathRegistry::get_info(std::string_view user, const Selector &selector) const
{
    using Result = Outcome<std::vector<Entry>>;
    if (!validate_user(user).ok)
        return bad_user<std::vector<Entry>>(user);

    std::optional<GlobMatcher> matcher;
    if (const auto *by_pattern = std::get_if<SelectPattern>(&selector))
    {
        auto compiled = GlobMatcher::compile(by_pattern->glob);
        if (!compiled.ok)
            return Result::failure(compiled.message);
        matcher.emplace(std::move(compiled).content());
    }

    auto reg = m_reconciler.reconcile(user);
    if (!reg.ok)
        return Result::propagate(reg);
    const Registry &registry = reg.content();

    std::vector<Entry> infos;
    std::visit(
        [&](const auto &sel)
        {
            using S = std::decay_t<decltype(sel)>;
            if constexpr (std::is_same_v<S, SelectPaths>)
            {
                for (const auto &p : sel.paths)
                {
                    if (auto it = registry.find(p); it != registry.end())
                        infos.push_back(it->second);
                }
            }
            else
            {
                for (const auto &[key, entry] : registry)
                {
                    if (!matcher || matcher->matches(key))
                        infos.push_back(entry);
                }
            }
        },
        selector);
    return Result::success(std::move(infos), "Info found");
}

Outcome<Entry> PathRegistry::resolve(const Registry &registry, std::string_view user, const std::string &path) const
{
    auto it = registry.find(path);
    if (it == registry.end())
        return Outcome<Entry>::failure(fmt::format("Path {} not found for user {}", path, user));
    const Entry &entry = it->second;
    if (entry.file.empty())
        return Outcome<Entry>::failure(fmt::format("Path {} has no file associated with it", path));
    std::error_code ec;
    if (!fs::is_regular_file(entry.file, ec))
        return Outcome<Entry>::failure(fmt::format("File not found: {} (path {})", entry.file, path));
    return Outcome<Entry>::success(entry);
}

Outcome<std::string> PathRegistry::fetch(std::string_view user, const std::string &path, bool as_reference) const
{
    using Result = Outcome<std::string>;
    if (!validate_user(user).ok)
        return bad_user<std::string>(user);

    auto reg = m_reconciler.reconcile(user);
    if (!reg.ok)
        return Result::propagate(reg);
    auto entry = resolve(reg.content(), user, path);
    if (!entry.ok)
        return Result::propagate(entry);

    if (as_reference)
    {
        auto locator = m_locator.make_locator(entry.content().file);
        if (!locator.ok)
            return locator;
        return Result::success(std::move(locator).content(), "File fetched");
    }

    auto bytes = ArtifactLocator::read_all(entry.content().file);
    if (!bytes.ok)
    {
        LOGGER_WARN("PathRegistry: fetch of '{}' for '{}' failed: {}", path, user, bytes.message);
        return bytes;
    }
    return Result::success(std::move(bytes).content(), "File fetched");
}

Status PathRegistry::remove(std::string_view user, const std::string &path) const
{
    if (auto st = validate_user(user); !st.ok)
        return st;

    auto held = m_store.lock(user);
    if (!held)
        return Status::failure(held.failure_message());

    auto reg = m_reconciler.reconcile_locked(held, user);
    if (!reg.ok)
        return reg.status();
    Registry registry = std::move(reg).content();

    auto entry = resolve(registry, user, path);
    if (!entry.ok)
        return entry.status();
    const std::string file = entry.content().file;

    if (::unlink(file.c_str()) != 0)
    {
        const int errnum = errno;
        LOGGER_WARN("PathRegistry: could not delete artifact '{}': {}", file, std::strerror(errnum));
        return Status::failure(fmt::format("could not delete artifact {} for path {}: {}", file, path,
                                           std::strerror(errnum)));
    }

    registry.erase(path);
    if (auto st = m_store.dump_locked(held, user, registry); !st.ok)
    {
        LOGGER_ERROR("PathRegistry: artifact '{}' deleted but registry of '{}' not updated: {}", file, user,
                     st.message);
        return Status::failure(fmt::format("system is in an inconsistent state: artifact {} was deleted but "
                                           "path {} is still registered: {}",
                                           file, path, st.message));
    }

    LOGGER_INFO("PathRegistry: deleted path '{}' of user '{}'", path, user);
    return Status::success(fmt::format("Path {} deleted", path));
}

Outcome<TableResult> PathRegistry::table(std::string_view user, const std::string &path,
                                         const TableRequest &request) const
{
    using Result = Outcome<TableResult>;
    if (!validate_user(user).ok)
        return bad_user<TableResult>(user);

    auto reg = m_reconciler.reconcile(user);
    if (!reg.ok)
        return Result::propagate(reg);
    auto entry = resolve(reg.content(), user, path);
    if (!entry.ok)
        return Result::propagate(entry);
    const fs::path artifact = entry.content().file;

    const TableReader *reader = nullptr;
    for (const auto &r : m_readers)
    {
        if (r && r->supports(artifact))
        {
            reader = r.get();
            break;
        }
    }
    if (reader == nullptr)
        return Result::failure(
            fmt::format("File extension {} of {} is not supported for tables", artifact.extension().string(),
                        artifact.string()));

    auto data = reader->read(artifact, request.table, request.conds);
    if (!data.ok)
        return Result::propagate(data);

    try
    {
        nlohmann::json doc = to_oriented_json(data.content(), request.orient);
        if (request.format == TableFormat::JsonDict)
            return Result::success(TableResult(std::in_place_type<nlohmann::json>, std::move(doc)), "Table found");
        return Result::success(TableResult(std::in_place_type<std::string>, doc.dump()), "Table found");
    }
    catch (const nlohmann::json::exception &ex)
    {
        LOGGER_WARN("PathRegistry: table '{}' of '{}' could not be serialized: {}", request.table, path, ex.what());
        return Result::failure(fmt::format("could not serialize table {} of {}: {}", request.table, path, ex.what()));
    }
}

} // namespace simpaths::registry
