/**
 * @file reconciler.hpp
 * @brief Merges a user's pending records into the user's registry.
 *
 * The pending records act as a write-ahead log and the registry file as the
 * compacted state. One reconciliation runs under one acquisition of the
 * user's lock: enumerate, read, load, merge, dump, then delete the consumed
 * records. A failure before the dump completes leaves every pending record in
 * place, so the next reconciliation retries them; re-merging a record that
 * survived a crash after the dump overwrites its own earlier value.
 */
#pragma once

#include <string_view>

#include "simpaths/platform.hpp"
#include "simpaths/registry/entry.hpp"
#include "simpaths/registry/outcome.hpp"
#include "simpaths/registry/pending_store.hpp"
#include "simpaths/registry/registry_store.hpp"
#include "simpaths/registry/user_lock.hpp"

namespace simpaths::registry
{

class SIMPATHS_EXPORT Reconciler
{
  public:
    Reconciler(const RegistryStore &store, const PendingStore &pending) : m_store(store), m_pending(pending) {}

    /// Takes the user's lock and reconciles. Fails if the lock is not obtained.
    [[nodiscard]] Outcome<Registry> reconcile(std::string_view user) const;

    /// Reconciles inside a critical section the caller already holds.
    [[nodiscard]] Outcome<Registry> reconcile_locked(const UserLock &lock, std::string_view user) const;

  private:
    const RegistryStore &m_store;
    const PendingStore &m_pending;
};

} // namespace simpaths::registry
