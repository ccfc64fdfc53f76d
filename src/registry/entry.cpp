#include "simpaths/registry/entry.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

#include <fmt/format.h>

namespace simpaths::registry
{

using json = nlohmann::json;

namespace
{

std::optional<double> parse_holding_string(const std::string &s) noexcept
{
    std::size_t b = s.find_first_not_of(" \t\r\n");
    std::size_t e = s.find_last_not_of(" \t\r\n");
    if (b == std::string::npos)
        return std::nullopt;
    const std::string trimmed = s.substr(b, e - b + 1);

    // strtod accepts "inf", "infinity" and "1e300" alike, case-insensitively.
    errno = 0;
    char *end = nullptr;
    const double v = std::strtod(trimmed.c_str(), &end);
    if (end != trimmed.c_str() + trimmed.size())
        return std::nullopt;
    if (errno == ERANGE && std::isfinite(v))
        return std::nullopt; // underflow
    return v;
}

} // namespace

std::optional<double> normalize_holding(const json &value) noexcept
{
    std::optional<double> v;
    if (value.is_number())
    {
        v = value.get<double>();
    }
    else if (value.is_string())
    {
        v = parse_holding_string(value.get_ref<const std::string &>());
    }
    if (!v || std::isnan(*v) || *v < 0.0)
        return std::nullopt;
    return v;
}

json holding_to_json(double holding)
{
    if (std::isinf(holding))
        return "inf";
    return holding;
}

json entry_to_json(const Entry &entry)
{
    return json{
        {"path", entry.path},
        {"file", entry.file},
        {"user", entry.user},
        {"jobid", entry.jobid},
        {"created", entry.created},
        {"holding", holding_to_json(entry.holding)},
    };
}

std::optional<Entry> entry_from_json(const json &j, std::string *why)
{
    auto fail = [why](std::string reason) -> std::optional<Entry>
    {
        if (why != nullptr)
            *why = std::move(reason);
        return std::nullopt;
    };

    if (!j.is_object())
        return fail("entry is not an object");

    Entry e;
    auto path_it = j.find("path");
    if (path_it == j.end() || !path_it->is_string())
        return fail("missing or non-string 'path'");
    e.path = path_it->get<std::string>();

    auto file_it = j.find("file");
    if (file_it == j.end() || !file_it->is_string())
        return fail(fmt::format("entry '{}': missing or non-string 'file'", e.path));
    e.file = file_it->get<std::string>();

    auto holding_it = j.find("holding");
    if (holding_it == j.end())
        return fail(fmt::format("entry '{}': missing 'holding'", e.path));
    auto holding = normalize_holding(*holding_it);
    if (!holding)
        return fail(fmt::format("entry '{}': 'holding' {} is not a non-negative number or \"inf\"", e.path,
                                holding_it->dump()));
    e.holding = *holding;

    if (auto it = j.find("user"); it != j.end() && it->is_string())
        e.user = it->get<std::string>();
    if (auto it = j.find("jobid"); it != j.end())
        e.jobid = *it;
    if (auto it = j.find("created"); it != j.end())
    {
        if (!it->is_number())
            return fail(fmt::format("entry '{}': 'created' is not a number", e.path));
        e.created = it->get<double>();
    }
    return e;
}

json registry_to_json(const Registry &registry)
{
    json out = json::object();
    for (const auto &[path, entry] : registry)
    {
        out[path] = entry_to_json(entry);
    }
    return out;
}

std::optional<Registry> registry_from_json(const json &j, std::string *why)
{
    if (!j.is_object())
    {
        if (why != nullptr)
            *why = "registry document is not an object";
        return std::nullopt;
    }
    Registry reg;
    for (auto it = j.begin(); it != j.end(); ++it)
    {
        std::string reason;
        auto entry = entry_from_json(it.value(), &reason);
        // Merged entries always carry 'created'; without it the entry's age is unknown.
        if (entry && !it.value().contains("created"))
        {
            entry.reset();
            reason = "missing 'created'";
        }
        if (!entry)
        {
            if (why != nullptr)
                *why = fmt::format("key '{}': {}", it.key(), reason);
            return std::nullopt;
        }
        // The key is authoritative; a stale inner 'path' is corrected on the next dump.
        entry->path = it.key();
        reg.emplace(it.key(), std::move(*entry));
    }
    return reg;
}

} // namespace simpaths::registry
