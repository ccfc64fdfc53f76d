#include "simpaths/registry/artifact_locator.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

#include <fmt/format.h>

#include "simpaths/format_tools.hpp"
#include "simpaths/utils/Logger.hpp"

namespace simpaths::registry
{

namespace fs = std::filesystem;

namespace
{

bool inside(const fs::path &root, const fs::path &candidate)
{
    const fs::path rel = candidate.lexically_relative(root);
    if (rel.empty() || rel == ".")
        return false;
    return *rel.begin() != "..";
}

fs::path canonical_or_normal(const fs::path &p)
{
    std::error_code ec;
    fs::path c = fs::weakly_canonical(p, ec);
    return ec ? fs::absolute(p).lexically_normal() : c;
}

/// Value of the `file` query parameter, or the whole input if it is not a query.
std::string_view extract_file_param(std::string_view locator, std::string_view endpoint)
{
    std::string_view query;
    if (locator.substr(0, endpoint.size()) == endpoint && locator.size() > endpoint.size() &&
        locator[endpoint.size()] == '?')
    {
        query = locator.substr(endpoint.size() + 1);
    }
    else if (!locator.empty() && locator.front() == '?')
    {
        query = locator.substr(1);
    }
    else
    {
        return locator;
    }

    while (!query.empty())
    {
        const std::size_t amp = query.find('&');
        std::string_view param = query.substr(0, amp);
        if (param.substr(0, 5) == "file=")
            return param.substr(5);
        if (amp == std::string_view::npos)
            break;
        query.remove_prefix(amp + 1);
    }
    return {};
}

} // namespace

ArtifactLocator::ArtifactLocator(RegistryConfig config) : m_config(std::move(config)) {}

fs::path ArtifactLocator::root() const
{
    return canonical_or_normal(m_config.artifact_dir);
}

Outcome<std::string> ArtifactLocator::make_locator(const fs::path &artifact) const
{
    const fs::path base = root();
    const fs::path target = canonical_or_normal(artifact);
    if (!inside(base, target))
        return Outcome<std::string>::failure(
            fmt::format("artifact {} is outside the artifact root {}", artifact.string(), base.string()));
    const std::string rel = target.lexically_relative(base).generic_string();
    return Outcome<std::string>::success(
        fmt::format("{}?file={}", m_config.fetch_endpoint, format_tools::percent_encode(rel)));
}

Outcome<fs::path> ArtifactLocator::resolve_locator(std::string_view locator) const
{
    const std::string_view raw = extract_file_param(locator, m_config.fetch_endpoint);
    if (raw.empty())
        return Outcome<fs::path>::failure("locator names no file");

    auto decoded = format_tools::percent_decode(raw);
    if (!decoded)
        return Outcome<fs::path>::failure(fmt::format("locator '{}' is not validly percent-encoded", raw));
    if (decoded->find('\0') != std::string::npos)
        return Outcome<fs::path>::failure("locator contains a NUL byte");

    const fs::path rel(*decoded);
    if (rel.is_absolute())
        return Outcome<fs::path>::failure(fmt::format("locator path '{}' must be relative", *decoded));
    for (const auto &part : rel)
    {
        if (part == "..")
            return Outcome<fs::path>::failure(fmt::format("locator path '{}' may not contain '..'", *decoded));
    }

    const fs::path base = root();
    const fs::path target = canonical_or_normal(base / rel);
    if (!inside(base, target))
    {
        LOGGER_WARN("ArtifactLocator: '{}' escapes the artifact root", *decoded);
        return Outcome<fs::path>::failure(fmt::format("locator path '{}' escapes the artifact root", *decoded));
    }

    std::error_code ec;
    if (!fs::is_regular_file(target, ec))
        return Outcome<fs::path>::failure(fmt::format("File not found: {}", *decoded));
    return Outcome<fs::path>::success(target);
}

Status ArtifactLocator::stream(std::string_view locator, const ChunkSink &sink, std::size_t chunk) const
{
    auto resolved = resolve_locator(locator);
    if (!resolved.ok)
        return resolved.status();
    return stream_file(resolved.content(), sink, chunk);
}

Status ArtifactLocator::stream_file(const fs::path &file, const ChunkSink &sink, std::size_t chunk)
{
    if (chunk == 0)
        chunk = kStreamChunk;
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open())
        return Status::failure(fmt::format("could not open {}: {}", file.string(), std::strerror(errno)));

    std::vector<char> buf(chunk);
    while (in)
    {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got > 0 && !sink(buf.data(), got))
            return Status::success("Stream stopped by receiver");
    }
    if (in.bad())
        return Status::failure(fmt::format("error reading {}", file.string()));
    return Status::success("File streamed");
}

Outcome<std::string> ArtifactLocator::read_all(const fs::path &file)
{
    std::string out;
    auto st = stream_file(file,
                          [&out](const char *data, std::size_t size)
                          {
                              out.append(data, size);
                              return true;
                          });
    if (!st.ok)
        return Outcome<std::string>::failure(st.message);
    return Outcome<std::string>::success(std::move(out));
}

} // namespace simpaths::registry
