#include <csignal>
#include <mutex>
#include <vector>

#include <spdlog/spdlog.h>

#include <modfetch/cancellation.hpp>

static std::atomic<std::atomic<bool>*> signal_flag{ nullptr };

extern "C"
{
    static void modfetch_request_cancellation(int)
    {
        std::atomic<bool>* flag = signal_flag.load();
        if (flag)
            flag->store(true);
    }
}

namespace modfetch
{
    void install_signal_handlers(const CancellationSignal& signal)
    {
        // A handler may still be reading a previous flag, so none is ever released.
        static std::mutex mutex;
        static std::vector<CancellationSignal> installed;

        {
            std::lock_guard<std::mutex> lock(mutex);
            installed.push_back(signal);
        }
        signal_flag.store(signal.flag());

        std::signal(SIGINT, modfetch_request_cancellation);
        std::signal(SIGTERM, modfetch_request_cancellation);
        spdlog::debug("SIGINT and SIGTERM now request cancellation");
    }
}
