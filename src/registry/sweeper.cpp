#include "simpaths/registry/sweeper.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

#include <unistd.h>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "simpaths/format_tools.hpp"
#include "simpaths/registry/pending_store.hpp"
#include "simpaths/utils/Logger.hpp"

namespace simpaths::registry
{

namespace fs = std::filesystem;

std::vector<fs::path> Sweeper::registry_files() const
{
    std::vector<fs::path> out;
    const fs::path &dir = m_store.config().registry_dir;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec)
    {
        if (ec != std::errc::no_such_file_or_directory)
            LOGGER_WARN("Sweeper: cannot list '{}': {}", dir.string(), ec.message());
        return out;
    }
    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
            break;
        const fs::path &p = it->path();
        if (p.extension() != ".json")
            continue;
        const std::string name = p.filename().string();
        if (PendingStore::is_pending_file(name))
            continue;
        if (!validate_user(p.stem().string()).ok)
            continue;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec))
            continue;
        out.push_back(p);
    }
    std::sort(out.begin(), out.end());
    return out;
}

Status Sweeper::gc(std::chrono::system_clock::time_point now) const
{
    const double now_s = format_tools::to_epoch_seconds(now);
    std::vector<std::string> messages;
    std::size_t removed_total = 0;

    for (const auto &file : registry_files())
    {
        auto held = UserLock::acquire(file, m_store.config().lock_timeout, /*soft_fail=*/true);
        if (!held)
        {
            LOGGER_WARN("Sweeper: skipping {}", held.failure_message());
            messages.push_back(held.failure_message());
            continue;
        }

        auto loaded = m_store.load_file_locked(held, file);
        if (!loaded.ok)
        {
            messages.push_back(loaded.message);
            continue;
        }
        Registry registry = std::move(loaded).content();

        std::size_t removed = 0;
        for (auto it = registry.begin(); it != registry.end();)
        {
            const Entry &entry = it->second;
            const double age = now_s - entry.created;
            // holding == inf never expires: age >= inf is false for every finite age.
            if (!(age >= entry.holding))
            {
                ++it;
                continue;
            }

            std::error_code ec;
            if (entry.file.empty() || !fs::exists(entry.file, ec))
            {
                LOGGER_WARN("Sweeper: expired path '{}' in {} has no artifact on disk; entry kept", it->first,
                            file.string());
                ++it;
                continue;
            }

            if (::unlink(entry.file.c_str()) != 0)
            {
                const int errnum = errno;
                messages.push_back(fmt::format("could not delete artifact {} for path {} in {}: {}", entry.file,
                                               it->first, file.string(), std::strerror(errnum)));
                LOGGER_WARN("Sweeper: {}", messages.back());
                ++it;
                continue;
            }

            LOGGER_INFO("Sweeper: expired path '{}' (age {:.0f}s >= holding {}s), deleted {}", it->first, age,
                        entry.holding, entry.file);
            it = registry.erase(it);
            ++removed;
        }

        if (removed > 0)
        {
            if (auto st = m_store.dump_file_locked(held, file, registry); !st.ok)
            {
                messages.push_back(fmt::format("system is in an inconsistent state: {} artifact(s) deleted but {} "
                                               "not updated: {}",
                                               removed, file.string(), st.message));
                LOGGER_ERROR("Sweeper: {}", messages.back());
                continue;
            }
            removed_total += removed;
        }
    }

    if (messages.empty())
    {
        LOGGER_DEBUG("Sweeper: sweep complete, {} entr{} removed", removed_total, removed_total == 1 ? "y" : "ies");
        return Status::success(fmt::format("Garbage collection removed {} path(s)", removed_total));
    }
    return Status::failure(fmt::format("{}", fmt::join(messages, "\n")));
}

} // namespace simpaths::registry
