#include "simpaths/registry/config.hpp"

#include <cerrno>
#include <cstdlib>

#include <fmt/format.h>

#include "simpaths/utils/JsonFile.hpp"
#include "simpaths/utils/Logger.hpp"

namespace simpaths::registry
{

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace
{

fs::path resolve_path(const fs::path &config_dir, const std::string &raw)
{
    if (raw.empty())
        return {};
    fs::path p(raw);
    std::error_code ec;
    fs::path resolved = p.is_absolute() || config_dir.empty() ? p : config_dir / p;
    fs::path canonical = fs::weakly_canonical(resolved, ec);
    return ec ? resolved.lexically_normal() : canonical;
}

const char *env_or_null(const char *name)
{
    const char *v = std::getenv(name);
    return (v != nullptr && *v != '\0') ? v : nullptr;
}

bool parse_timeout_ms(const std::string &text, std::chrono::milliseconds &out)
{
    errno = 0;
    char *end = nullptr;
    const long long v = std::strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0' || errno == ERANGE || v < 0)
        return false;
    out = std::chrono::milliseconds(v);
    return true;
}

} // namespace

Status RegistryConfig::validate() const
{
    if (registry_dir.empty())
        return Status::failure("registry directory is not configured (registry.paths_dir or SIMPATHS_PATHS_DIR)");
    if (artifact_dir.empty())
        return Status::failure("artifact directory is not configured (registry.sims_dir or SIMPATHS_SIMS_DIR)");
    if (lock_timeout.count() < 0)
        return Status::failure("lock timeout must be non-negative");
    if (fetch_endpoint.empty())
        return Status::failure("fetch endpoint must not be empty");
    if (!utils::Logger::parse_level(log_level))
        return Status::failure(fmt::format("unknown log level '{}'", log_level));
    return Status::success();
}

Status RegistryConfig::apply_json(const json &j, const fs::path &config_dir)
{
    try
    {
        if (!j.is_object())
            return Status::failure("config document is not an object");

        if (auto reg = j.find("registry"); reg != j.end())
        {
            if (!reg->is_object())
                return Status::failure("'registry' section is not an object");
            if (reg->contains("paths_dir"))
                registry_dir = resolve_path(config_dir, reg->at("paths_dir").get<std::string>());
            if (reg->contains("sims_dir"))
                artifact_dir = resolve_path(config_dir, reg->at("sims_dir").get<std::string>());
            if (reg->contains("lock_timeout_ms"))
            {
                const auto ms = reg->at("lock_timeout_ms").get<long long>();
                if (ms < 0)
                    return Status::failure("registry.lock_timeout_ms must be non-negative");
                lock_timeout = std::chrono::milliseconds(ms);
            }
            if (reg->contains("fetch_endpoint"))
                fetch_endpoint = reg->at("fetch_endpoint").get<std::string>();
        }

        if (auto log = j.find("logging"); log != j.end())
        {
            if (!log->is_object())
                return Status::failure("'logging' section is not an object");
            if (log->contains("level"))
                log_level = log->at("level").get<std::string>();
            if (log->contains("file"))
                log_file = resolve_path(config_dir, log->at("file").get<std::string>());
        }
        return Status::success();
    }
    catch (const json::exception &ex)
    {
        return Status::failure(fmt::format("invalid config value: {}", ex.what()));
    }
}

Status RegistryConfig::apply_environment()
{
    if (const char *v = env_or_null("SIMPATHS_PATHS_DIR"))
        registry_dir = resolve_path(fs::current_path(), v);
    if (const char *v = env_or_null("SIMPATHS_SIMS_DIR"))
        artifact_dir = resolve_path(fs::current_path(), v);
    if (const char *v = env_or_null("SIMPATHS_LOCK_TIMEOUT_MS"))
    {
        if (!parse_timeout_ms(v, lock_timeout))
            return Status::failure(fmt::format("SIMPATHS_LOCK_TIMEOUT_MS='{}' is not a non-negative integer", v));
    }
    if (const char *v = env_or_null("SIMPATHS_LOG_LEVEL"))
        log_level = v;
    return Status::success();
}

Outcome<RegistryConfig> RegistryConfig::load(const fs::path &config_file)
{
    RegistryConfig cfg;

    fs::path file = config_file;
    if (file.empty())
    {
        if (const char *v = env_or_null("SIMPATHS_CONFIG_FILE"))
            file = v;
    }

    if (!file.empty())
    {
        std::error_code ec;
        std::string detail;
        auto j = utils::read_json_file(file, &ec, &detail);
        if (!j)
        {
            if (ec == std::errc::illegal_byte_sequence)
                return Outcome<RegistryConfig>::failure(
                    fmt::format("config file '{}' could not be parsed: {}", file.string(), detail));
            return Outcome<RegistryConfig>::failure(
                fmt::format("config file '{}' could not be read: {}", file.string(), ec.message()));
        }
        LOGGER_DEBUG("RegistryConfig: loading '{}'", file.string());
        const fs::path config_dir = fs::absolute(file).parent_path();
        if (auto st = cfg.apply_json(*j, config_dir); !st.ok)
            return Outcome<RegistryConfig>::failure(fmt::format("{}: {}", file.string(), st.message));
    }

    if (auto st = cfg.apply_environment(); !st.ok)
        return Outcome<RegistryConfig>::failure(st.message);

    if (auto st = cfg.validate(); !st.ok)
        return Outcome<RegistryConfig>::failure(st.message);

    return Outcome<RegistryConfig>::success(std::move(cfg), "Configuration loaded");
}

} // namespace simpaths::registry
