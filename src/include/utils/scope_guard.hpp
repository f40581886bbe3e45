#pragma once

#include <concepts>
#include <type_traits>
#include <utility>

namespace ljdaq::utils
{

/**
 * @class ScopeGuard
 * @brief Runs a cleanup callable when the enclosing scope exits.
 *
 * Used wherever a vendor resource has no RAII owner of its own: an LJM
 * interval that must be cleaned, a stream that must be stopped, the logger
 * that must be drained before the process exits.
 *
 * The guard is movable but not copyable. A moved-from guard is dismissed.
 *
 * @code
 *  driver.start_interval(id, period_us);
 *  auto cleanup = ljdaq::utils::make_scope_guard([&] { driver.clean_interval(id); });
 *  run_loop(); // clean_interval() runs even if run_loop() throws
 * @endcode
 *
 * The callable should not throw. If it does while the stack is unwinding,
 * the process terminates.
 */
template <typename Callable>
    requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    explicit ScopeGuard(Callable &&fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_fn(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&rhs) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_fn(std::move(rhs.m_fn)), m_active(std::exchange(rhs.m_active, false))
    {
    }

    ~ScopeGuard()
    {
        if (m_active)
            m_fn();
    }

    /// Cancel the cleanup action.
    void dismiss() noexcept { m_active = false; }

    [[nodiscard]] bool active() const noexcept { return m_active; }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

  private:
    Callable m_fn;
    bool m_active{true};
};

template <typename Callable>
[[nodiscard]] ScopeGuard<std::decay_t<Callable>> make_scope_guard(Callable &&fn)
{
    return ScopeGuard<std::decay_t<Callable>>(std::decay_t<Callable>(std::forward<Callable>(fn)));
}

} // namespace ljdaq::utils
