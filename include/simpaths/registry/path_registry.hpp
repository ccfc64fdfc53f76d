/**
 * @file path_registry.hpp
 * @brief Query layer: list, info, fetch, delete and table over a reconciled registry.
 *
 * Every operation validates the user name, takes the user's lock (soft-fail,
 * bounded by the configured timeout) and reconciles pending records before
 * consulting the registry. A busy registry is reported as a failure
 * ("could not acquire lock for ..."), never thrown.
 *
 * Thread Safety: all methods are const and may be called concurrently;
 * operations on the same user are serialized by the user's lock.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "simpaths/platform.hpp"
#include "simpaths/registry/artifact_locator.hpp"
#include "simpaths/registry/config.hpp"
#include "simpaths/registry/entry.hpp"
#include "simpaths/registry/outcome.hpp"
#include "simpaths/registry/pending_store.hpp"
#include "simpaths/registry/reconciler.hpp"
#include "simpaths/registry/registry_store.hpp"
#include "simpaths/registry/selector.hpp"
#include "simpaths/registry/table_reader.hpp"

namespace simpaths::registry
{

class SIMPATHS_EXPORT PathRegistry
{
  public:
    explicit PathRegistry(RegistryConfig config,
                          std::vector<std::shared_ptr<const TableReader>> readers = default_table_readers());

    PathRegistry(const PathRegistry &) = delete;
    PathRegistry &operator=(const PathRegistry &) = delete;

    const RegistryConfig &config() const noexcept { return m_config; }
    const RegistryStore &store() const noexcept { return m_store; }
    const PendingStore &pending() const noexcept { return m_pending; }
    const Reconciler &reconciler() const noexcept { return m_reconciler; }
    const ArtifactLocator &locator() const noexcept { return m_locator; }

    /// Reconciled registry of @p user.
    [[nodiscard]] Outcome<Registry> reconcile(std::string_view user) const { return m_reconciler.reconcile(user); }

    /// All keys in ascending order, optionally filtered by a full-string shell glob.
    [[nodiscard]] Outcome<std::vector<std::string>> list_paths(std::string_view user,
                                                               const std::optional<std::string> &pattern = {}) const;

    /// Entries picked by @p selector; see Selector for ordering rules.
    [[nodiscard]] Outcome<std::vector<Entry>> get_info(std::string_view user, const Selector &selector) const;

    /// Boundary form: rejects @p paths and @p pattern together before touching storage.
    [[nodiscard]] Outcome<std::vector<Entry>> get_info(std::string_view user,
                                                       std::optional<std::vector<std::string>> paths,
                                                       std::optional<std::string> pattern) const;

    /**
     * @brief Contents of the artifact behind @p path, or its retrieval locator.
     * @param as_reference Return `<fetch_endpoint>?file=<rel>` instead of reading the file.
     */
    [[nodiscard]] Outcome<std::string> fetch(std::string_view user, const std::string &path,
                                             bool as_reference) const;

    /**
     * @brief Deletes the artifact, then the entry.
     *
     * If the artifact is removed but the registry cannot be rewritten, the
     * failure message starts with "system is in an inconsistent state".
     */
    [[nodiscard]] Status remove(std::string_view user, const std::string &path) const;

    /// Named table of the artifact behind @p path.
    [[nodiscard]] Outcome<TableResult> table(std::string_view user, const std::string &path,
                                             const TableRequest &request) const;

  private:
    /// Resolves @p path to an existing regular artifact in @p registry.
    Outcome<Entry> resolve(const Registry &registry, std::string_view user, const std::string &path) const;

    RegistryConfig m_config;
    RegistryStore m_store;
    PendingStore m_pending;
    Reconciler m_reconciler;
    ArtifactLocator m_locator;
    std::vector<std::shared_ptr<const TableReader>> m_readers;
};

} // namespace simpaths::registry
