#include <modfetch/context.hpp>

#include <atomic>
#include <optional>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "./curl_internal.hpp"


namespace modfetch
{
    struct Context::Impl
    {
        std::optional<details::CURLSetup> curl_setup;
    };

    static std::atomic<bool> is_context_alive{ false };

    Context::Context()
        : impl(new Impl)
    {
        bool expected = false;
        if (!is_context_alive.compare_exchange_strong(expected, true))
            throw std::runtime_error(
                "modfetch::Context created more than once - instance must be unique");

        try
        {
            impl->curl_setup.emplace();
        }
        catch (...)
        {
            is_context_alive = false;
            throw;
        }
        set_verbosity(0);
    }

    Context::~Context()
    {
        is_context_alive = false;
    }

    void Context::set_verbosity(int v)
    {
        verbosity = v;
        if (v > 1)
        {
            spdlog::set_level(spdlog::level::trace);
        }
        else if (v > 0)
        {
            spdlog::set_level(spdlog::level::debug);
        }
        else
        {
            spdlog::set_level(spdlog::level::info);
        }
    }

    void Context::set_log_level(spdlog::level::level_enum log_level)
    {
        spdlog::set_level(log_level);
    }
}
