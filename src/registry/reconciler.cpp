#include "simpaths/registry/reconciler.hpp"

#include <utility>
#include <vector>

#include <fmt/format.h>

#include "simpaths/utils/Logger.hpp"

namespace simpaths::registry
{

namespace fs = std::filesystem;

Outcome<Registry> Reconciler::reconcile(std::string_view user) const
{
    if (auto st = validate_user(user); !st.ok)
        return Outcome<Registry>::failure(st.message);
    auto held = m_store.lock(user);
    if (!held)
    {
        LOGGER_WARN("Reconciler: {}", held.failure_message());
        return Outcome<Registry>::failure(held.failure_message());
    }
    return reconcile_locked(held, user);
}

Outcome<Registry> Reconciler::reconcile_locked(const UserLock &lock, std::string_view user) const
{
    if (!lock)
        return Outcome<Registry>::failure(lock.failure_message());

    const auto files = m_pending.enumerate(user);
    if (files.empty())
        return m_store.load_locked(lock, user);

    // Read every pending record first; unreadable ones stay on disk for a later round.
    std::vector<std::pair<fs::path, Entry>> incoming;
    incoming.reserve(files.size());
    for (const auto &f : files)
    {
        if (auto entry = m_pending.read(f))
            incoming.emplace_back(f, std::move(*entry));
    }
    if (incoming.empty())
        return m_store.load_locked(lock, user);

    auto loaded = m_store.load_locked(lock, user);
    if (!loaded.ok)
    {
        LOGGER_ERROR("Reconciler: not merging {} pending record(s) for '{}': {}", incoming.size(), user,
                     loaded.message);
        return loaded;
    }
    Registry merged = std::move(loaded).content();

    // Pending values win on key collision.
    for (const auto &[file, entry] : incoming)
        merged.insert_or_assign(entry.path, entry);

    if (auto st = m_store.dump_locked(lock, user, merged); !st.ok)
    {
        LOGGER_ERROR("Reconciler: keeping pending records for '{}': {}", user, st.message);
        return Outcome<Registry>::failure(st.message);
    }

    for (const auto &[file, entry] : incoming)
    {
        std::error_code ec;
        if (!m_pending.remove(file, &ec))
        {
            // Merged already; a leftover record re-merges to the same value next time.
            LOGGER_WARN("Reconciler: could not remove consumed record '{}': {}", file.string(), ec.message());
        }
    }

    LOGGER_INFO("Reconciler: merged {} pending record(s) into registry of '{}'", incoming.size(), user);
    return Outcome<Registry>::success(std::move(merged));
}

} // namespace simpaths::registry
