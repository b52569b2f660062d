#ifndef MODFETCH_CANCELLATION_HPP
#define MODFETCH_CANCELLATION_HPP

#include <atomic>
#include <memory>

#include <modfetch/export.hpp>

namespace modfetch
{
    // Shared, monotonic abort flag. Copies observe the same flag; once requested it stays set.
    class CancellationSignal
    {
    public:
        CancellationSignal()
            : m_flag(std::make_shared<std::atomic<bool>>(false))
        {
        }

        void request() noexcept
        {
            m_flag->store(true);
        }

        bool is_requested() const noexcept
        {
            return m_flag->load();
        }

        // Raw access for async-signal handlers, which may only touch lock-free atomics.
        std::atomic<bool>* flag() const noexcept
        {
            return m_flag.get();
        }

    private:
        std::shared_ptr<std::atomic<bool>> m_flag;
    };

    // Routes SIGINT and SIGTERM to `signal`. The flag is kept alive until the process exits.
    MODFETCH_API void install_signal_handlers(const CancellationSignal& signal);
}

#endif
