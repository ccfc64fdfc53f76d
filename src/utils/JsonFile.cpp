// JsonFile.cpp
// Atomic JSON replacement (mkstemp + fsync + rename + fsync(dir)) and JSON reading.
#include "simpaths/utils/JsonFile.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "simpaths/scope_guard.hpp"
#include "simpaths/utils/Logger.hpp"

namespace simpaths::utils
{

namespace fs = std::filesystem;

namespace
{

constexpr int kRenameRetries = 5;
constexpr int kRenameDelayMs = 10;

void set_errno_code(std::error_code *ec, int errnum)
{
    if (ec != nullptr)
    {
        *ec = std::error_code(errnum, std::generic_category());
    }
}

bool ensure_parent_dir(const fs::path &target, std::error_code *ec)
{
    const fs::path parent = target.parent_path();
    if (parent.empty())
        return true;
    std::error_code create_ec;
    fs::create_directories(parent, create_ec);
    if (create_ec)
    {
        if (ec != nullptr)
            *ec = create_ec;
        LOGGER_ERROR("atomic_write_json: cannot create parent '{}': {}", parent.string(),
                     create_ec.message());
        return false;
    }
    return true;
}

bool reject_if_symlink(const fs::path &target, std::error_code *ec)
{
    struct stat lstat_buf;
    if (::lstat(target.c_str(), &lstat_buf) != 0 || !S_ISLNK(lstat_buf.st_mode))
    {
        return true;
    }
    if (ec != nullptr)
    {
        *ec = std::make_error_code(std::errc::operation_not_permitted);
    }
    LOGGER_ERROR("atomic_write_json: target '{}' is a symbolic link, refusing to write", target.string());
    return false;
}

bool write_all(int fd, const std::string &out, const std::string &tmp_path, std::error_code *ec)
{
    const char *buf = out.data();
    std::size_t remaining = out.size();
    while (remaining > 0)
    {
        const ssize_t n = ::write(fd, buf, remaining);
        if (n < 0)
        {
            const int errnum = errno;
            if (errnum == EINTR)
                continue;
            set_errno_code(ec, errnum);
            LOGGER_ERROR("atomic_write_json: write failed for '{}'. Error: {}", tmp_path,
                         std::strerror(errnum));
            return false;
        }
        buf += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return true;
}

bool rename_with_retry(const std::string &tmp_path, const fs::path &target, std::error_code *ec)
{
    int last_errnum = 0;
    for (int i = 0; i < kRenameRetries; ++i)
    {
        if (std::rename(tmp_path.c_str(), target.c_str()) == 0)
        {
            return true;
        }
        last_errnum = errno;
        if (last_errnum != EBUSY && last_errnum != ETXTBSY && last_errnum != EINTR)
        {
            break;
        }
        LOGGER_WARN("atomic_write_json: rename hit transient error {} for '{}', retrying",
                    std::strerror(last_errnum), target.string());
        std::this_thread::sleep_for(std::chrono::milliseconds(kRenameDelayMs));
    }
    set_errno_code(ec, last_errnum);
    LOGGER_ERROR("atomic_write_json: rename failed for '{}'. Error: {}", target.string(),
                 std::strerror(last_errnum));
    return false;
}

bool fsync_parent(const fs::path &target, std::error_code *ec)
{
    const std::string dir = target.parent_path().empty() ? std::string(".") : target.parent_path().string();
    const int dfd = ::open(dir.c_str(), O_DIRECTORY | O_RDONLY);
    if (dfd < 0)
    {
        const int errnum = errno;
        set_errno_code(ec, errnum);
        LOGGER_ERROR("atomic_write_json: open(dir) failed for '{}'. Error: {}", dir, std::strerror(errnum));
        return false;
    }
    bool success = true;
    if (::fsync(dfd) != 0)
    {
        const int errnum = errno;
        set_errno_code(ec, errnum);
        LOGGER_ERROR("atomic_write_json: fsync(dir) failed for '{}'. Error: {}", dir, std::strerror(errnum));
        success = false;
    }
    ::close(dfd);
    return success;
}

} // namespace

bool atomic_write_json(const fs::path &target, const nlohmann::json &j, std::error_code *ec,
                       int indent) noexcept
{
    try
    {
        // Serialize first: a dump() failure (invalid UTF-8) must not leave a temp file behind.
        const std::string out = j.dump(indent);

        if (!ensure_parent_dir(target, ec) || !reject_if_symlink(target, ec))
        {
            return false;
        }

        const std::string dir = target.parent_path().empty() ? std::string(".") : target.parent_path().string();
        const std::string tmpl = dir + "/" + target.filename().string() + ".tmp.XXXXXX";
        std::vector<char> tmpl_buf(tmpl.begin(), tmpl.end());
        tmpl_buf.push_back('\0');

        int fd = ::mkstemp(tmpl_buf.data());
        if (fd == -1)
        {
            const int errnum = errno;
            set_errno_code(ec, errnum);
            LOGGER_ERROR("atomic_write_json: mkstemp failed for '{}'. Error: {}", tmpl_buf.data(),
                         std::strerror(errnum));
            return false;
        }
        const std::string tmp_path(tmpl_buf.data());

        auto rollback = basics::make_scope_guard(
            [&]
            {
                if (fd != -1)
                    ::close(fd);
                ::unlink(tmp_path.c_str());
            });

        if (!write_all(fd, out, tmp_path, ec))
        {
            return false;
        }
        if (::fsync(fd) != 0)
        {
            const int errnum = errno;
            set_errno_code(ec, errnum);
            LOGGER_ERROR("atomic_write_json: fsync failed for '{}'. Error: {}", tmp_path, std::strerror(errnum));
            return false;
        }

        struct stat stat_buf;
        if (::stat(target.c_str(), &stat_buf) == 0 && ::fchmod(fd, stat_buf.st_mode) != 0)
        {
            const int errnum = errno;
            set_errno_code(ec, errnum);
            LOGGER_ERROR("atomic_write_json: fchmod failed for '{}'. Error: {}", tmp_path, std::strerror(errnum));
            return false;
        }

        const int close_rc = ::close(fd);
        fd = -1;
        if (close_rc != 0)
        {
            const int errnum = errno;
            set_errno_code(ec, errnum);
            LOGGER_ERROR("atomic_write_json: close failed for '{}'. Error: {}", tmp_path, std::strerror(errnum));
            return false;
        }

        if (!rename_with_retry(tmp_path, target, ec))
        {
            return false;
        }
        rollback.dismiss();

        if (!fsync_parent(target, ec))
        {
            return false;
        }
        if (ec != nullptr)
        {
            ec->clear();
        }
        return true;
    }
    catch (const std::exception &ex)
    {
        if (ec != nullptr)
        {
            *ec = std::make_error_code(std::errc::io_error);
        }
        LOGGER_ERROR("atomic_write_json: exception for '{}': {}", target.string(), ex.what());
        return false;
    }
}

std::optional<nlohmann::json> read_json_file(const fs::path &path, std::error_code *ec,
                                             std::string *detail) noexcept
{
    try
    {
        std::error_code stat_ec;
        if (!fs::exists(path, stat_ec))
        {
            set_errno_code(ec, stat_ec ? stat_ec.value() : ENOENT);
            return std::nullopt;
        }
        std::ifstream f(path, std::ios::binary);
        if (!f.is_open())
        {
            set_errno_code(ec, EACCES);
            return std::nullopt;
        }
        std::ostringstream ss;
        ss << f.rdbuf();
        if (f.bad())
        {
            set_errno_code(ec, EIO);
            return std::nullopt;
        }
        auto j = nlohmann::json::parse(ss.str(), nullptr, /*allow_exceptions=*/true);
        if (ec != nullptr)
        {
            ec->clear();
        }
        return j;
    }
    catch (const nlohmann::json::parse_error &ex)
    {
        if (ec != nullptr)
            *ec = std::make_error_code(std::errc::illegal_byte_sequence);
        if (detail != nullptr)
            *detail = ex.what();
        LOGGER_DEBUG("read_json_file: '{}' is not valid JSON: {}", path.string(), ex.what());
        return std::nullopt;
    }
    catch (const std::exception &ex)
    {
        if (ec != nullptr)
            *ec = std::make_error_code(std::errc::io_error);
        if (detail != nullptr)
            *detail = ex.what();
        LOGGER_ERROR("read_json_file: exception for '{}': {}", path.string(), ex.what());
        return std::nullopt;
    }
}

} // namespace simpaths::utils
