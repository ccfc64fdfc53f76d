#include "simpaths/registry/pending_store.hpp"

#include <algorithm>
#include <cerrno>

#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>

#include "simpaths/registry/registry_store.hpp"
#include "simpaths/utils/JsonFile.hpp"
#include "simpaths/utils/Logger.hpp"
#include "simpaths/utils/uid_utils.hpp"

namespace simpaths::registry
{

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace
{

constexpr std::string_view kPendingMark = "-pending";
constexpr std::string_view kJsonExt = ".json";
constexpr std::string_view kPendingTail = "-pending.json";

} // namespace

std::optional<double> artifact_ctime(const fs::path &file, std::error_code *ec)
{
    struct stat st;
    if (::stat(file.c_str(), &st) != 0)
    {
        if (ec != nullptr)
            *ec = std::error_code(errno, std::generic_category());
        return std::nullopt;
    }
#if defined(SIMPATHS_PLATFORM_APPLE)
    const auto &ts = st.st_ctimespec;
#else
    const auto &ts = st.st_ctim;
#endif
    if (ec != nullptr)
        ec->clear();
    return static_cast<double>(ts.tv_sec) + static_cast<double>(ts.tv_nsec) * 1e-9;
}

PendingStore::PendingStore(RegistryConfig config) : m_config(std::move(config)) {}

std::optional<std::string> PendingStore::owner_of(std::string_view filename)
{
    // <user> '-' <token> "-pending" [".json"]; the token carries no '-'.
    if (filename.size() > kJsonExt.size() && filename.substr(filename.size() - kJsonExt.size()) == kJsonExt)
        filename.remove_suffix(kJsonExt.size());
    if (filename.size() <= kPendingMark.size() ||
        filename.substr(filename.size() - kPendingMark.size()) != kPendingMark)
        return std::nullopt;
    filename.remove_suffix(kPendingMark.size());

    const std::size_t dash = filename.rfind('-');
    if (dash == std::string_view::npos || dash == 0 || dash + 1 == filename.size())
        return std::nullopt;
    std::string user(filename.substr(0, dash));
    if (!validate_user(user).ok)
        return std::nullopt;
    return user;
}

std::vector<fs::path> PendingStore::enumerate(std::string_view user) const
{
    std::vector<fs::path> out;
    std::error_code ec;
    fs::directory_iterator it(m_config.registry_dir, ec);
    if (ec)
    {
        if (ec != std::errc::no_such_file_or_directory)
            LOGGER_WARN("PendingStore: cannot list '{}': {}", m_config.registry_dir.string(), ec.message());
        return out;
    }
    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
        {
            LOGGER_WARN("PendingStore: listing '{}' stopped: {}", m_config.registry_dir.string(), ec.message());
            break;
        }
        auto owner = owner_of(it->path().filename().string());
        if (owner && *owner == user)
            out.push_back(it->path());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<Entry> PendingStore::read(const fs::path &pending_file, std::string *why) const
{
    auto fail = [&](std::string reason) -> std::optional<Entry>
    {
        LOGGER_WARN("PendingStore: skipping '{}': {}", pending_file.string(), reason);
        if (why != nullptr)
            *why = std::move(reason);
        return std::nullopt;
    };

    std::error_code ec;
    std::string detail;
    auto doc = utils::read_json_file(pending_file, &ec, &detail);
    if (!doc)
        return fail(ec == std::errc::illegal_byte_sequence ? fmt::format("not valid JSON: {}", detail)
                                                           : ec.message());

    std::string reason;
    auto entry = entry_from_json(*doc, &reason);
    if (!entry)
        return fail(reason);

    auto created = artifact_ctime(entry->file, &ec);
    if (!created)
        return fail(fmt::format("artifact {} is not available: {}", entry->file, ec.message()));
    entry->created = *created;
    return entry;
}

Status PendingStore::submit(std::string_view user, const std::string &path, const fs::path &file,
                            const json &holding, const json &jobid) const
{
    if (auto st = validate_user(user); !st.ok)
        return st;
    if (path.empty())
        return Status::failure("path must not be empty");
    if (!normalize_holding(holding))
        return Status::failure(fmt::format("holding {} is not a non-negative number or \"inf\"", holding.dump()));

    std::error_code ec;
    const fs::path artifact = fs::absolute(file, ec).lexically_normal();
    if (ec)
        return Status::failure(fmt::format("cannot resolve artifact {}: {}", file.string(), ec.message()));
    if (!fs::is_regular_file(artifact, ec))
        return Status::failure(fmt::format("artifact {} is not a regular file", artifact.string()));

    json record{
        {"user", std::string(user)},
        {"path", path},
        {"file", artifact.string()},
        {"holding", holding.is_string() ? holding : holding_to_json(*normalize_holding(holding))},
        {"jobid", jobid},
    };

    const fs::path target =
        m_config.registry_dir / fmt::format("{}-{}{}", user, uid::generate_pending_token(), kPendingTail);
    if (!utils::atomic_write_json(target, record, &ec, 1))
        return Status::failure(fmt::format("could not write pending record {}: {}", target.string(), ec.message()));

    LOGGER_INFO("PendingStore: queued '{}' for user '{}' as {}", path, user, target.filename().string());
    return Status::success(fmt::format("Path {} submitted", path));
}

bool PendingStore::remove(const fs::path &pending_file, std::error_code *ec) const noexcept
{
    if (::unlink(pending_file.c_str()) == 0 || errno == ENOENT)
    {
        if (ec != nullptr)
            ec->clear();
        return true;
    }
    const int errnum = errno;
    if (ec != nullptr)
        *ec = std::error_code(errnum, std::generic_category());
    return false;
}

} // namespace simpaths::registry
