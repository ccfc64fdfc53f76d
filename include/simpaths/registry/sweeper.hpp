/**
 * @file sweeper.hpp
 * @brief Time-to-live garbage collection across every user's registry.
 *
 * For each `<user>.json` under the registry directory (pending records and
 * temporaries excluded): take that user's lock, load the registry, and for
 * each entry with `now - created >= holding` whose artifact exists, delete the
 * artifact; only entries whose artifact was deleted leave the registry.
 *
 * The sweep is best-effort: a busy user is skipped and an artifact that
 * cannot be deleted keeps its entry; both add a line to the returned message
 * and make `ok` false, but every remaining user is still processed.
 */
#pragma once

#include <chrono>
#include <filesystem>
#include <vector>

#include "simpaths/platform.hpp"
#include "simpaths/registry/outcome.hpp"
#include "simpaths/registry/registry_store.hpp"

namespace simpaths::registry
{

class SIMPATHS_EXPORT Sweeper
{
  public:
    explicit Sweeper(const RegistryStore &store) : m_store(store) {}

    [[nodiscard]] Status gc() const { return gc(std::chrono::system_clock::now()); }

    /// Sweep with an explicit notion of "now".
    [[nodiscard]] Status gc(std::chrono::system_clock::time_point now) const;

    /// Registry files the sweep visits, sorted.
    std::vector<std::filesystem::path> registry_files() const;

  private:
    const RegistryStore &m_store;
};

} // namespace simpaths::registry
