/**
 * @file artifact_locator.hpp
 * @brief Retrieval locators for artifacts under the artifact root.
 *
 * A locator is `<fetch_endpoint>?file=<relative path>`, e.g.
 * `/fetch?file=runs/2.txt`. It is what `fetch(..., as_reference=true)`
 * returns and what the byte-streaming endpoint resolves. Resolution rejects
 * anything that would leave the artifact root.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

#include "simpaths/platform.hpp"
#include "simpaths/registry/config.hpp"
#include "simpaths/registry/outcome.hpp"

namespace simpaths::registry
{

class SIMPATHS_EXPORT ArtifactLocator
{
  public:
    static constexpr std::size_t kStreamChunk = 16384;

    /// Receives one chunk. Return false to stop streaming.
    using ChunkSink = std::function<bool(const char *data, std::size_t size)>;

    explicit ArtifactLocator(RegistryConfig config);

    /// Locator for @p artifact; fails if it is not inside the artifact root.
    [[nodiscard]] Outcome<std::string> make_locator(const std::filesystem::path &artifact) const;

    /**
     * @brief Maps a locator, or the bare `file` value, to an existing regular file.
     *
     * Rejects absolute paths, `..` components, bad percent-encoding, paths
     * that escape the artifact root after symlink resolution, and anything
     * that is not a regular file.
     */
    [[nodiscard]] Outcome<std::filesystem::path> resolve_locator(std::string_view locator) const;

    /// Streams the file behind @p locator to @p sink in chunks of @p chunk bytes.
    [[nodiscard]] Status stream(std::string_view locator, const ChunkSink &sink,
                                std::size_t chunk = kStreamChunk) const;

    /// Reads @p file completely. I/O failures are reported with their cause.
    [[nodiscard]] static Outcome<std::string> read_all(const std::filesystem::path &file);

    /// Streams @p file to @p sink.
    [[nodiscard]] static Status stream_file(const std::filesystem::path &file, const ChunkSink &sink,
                                            std::size_t chunk = kStreamChunk);

  private:
    std::filesystem::path root() const;

    RegistryConfig m_config;
};

} // namespace simpaths::registry
