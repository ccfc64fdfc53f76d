#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace simpaths::basics
{

/**
 * @class ScopeGuard
 * @brief Runs a callable when the enclosing scope exits, on every exit path.
 *
 * Used for rollback of partially completed file operations (temporary files,
 * descriptors) where no dedicated RAII wrapper exists.
 *
 * @code
 *  int fd = ::open(tmp.c_str(), O_WRONLY);
 *  auto guard = simpaths::basics::make_scope_guard([&] { ::close(fd); ::unlink(tmp.c_str()); });
 *  ...
 *  guard.dismiss(); // commit: the file was installed
 * @endcode
 *
 * The destructor is noexcept; a throwing callable is swallowed there, so keep
 * cleanup logic non-throwing. Movable, not copyable. A moved-from guard is
 * inactive.
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            try
            {
                std::invoke(m_func);
            }
            catch (...)
            {
                // Destructor must not throw.
            }
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    /// Cancels the cleanup action.
    constexpr void dismiss() noexcept { m_active = false; }

  private:
    Callable m_func;
    bool m_active{true};
};

template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace simpaths::basics
