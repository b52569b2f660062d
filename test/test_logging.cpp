#include <doctest/doctest.h>

#include <spdlog/spdlog.h>

#include <modfetch/logging.hpp>
#include <modfetch/utils.hpp>

#include "fake_origin.hpp"

using namespace modfetch;
using namespace modfetch::testing;

TEST_SUITE("logging")
{
    TEST_CASE("debug records reach the log file")
    {
        TemporaryDirectory tmp;
        const auto log_file = tmp.path() / "modfetch.log";
        auto previous = spdlog::default_logger();

        setup_logging(log_file, false);
        spdlog::debug("Requesting mod.7z from offset 4096");
        spdlog::info("Found 1 mods to download");
        spdlog::default_logger()->flush();
        spdlog::set_default_logger(previous);
        spdlog::drop("modfetch");

        const std::string content = read_file(log_file);
        CHECK(contains(content, "modfetch - debug - Requesting mod.7z from offset 4096"));
        CHECK(contains(content, "modfetch - info - Found 1 mods to download"));
    }

    TEST_CASE("runs are separated")
    {
        TemporaryDirectory tmp;
        const auto log_file = tmp.path() / "modfetch.log";
        write_file(log_file, "previous run\n");
        auto previous = spdlog::default_logger();

        setup_logging(log_file, true);
        spdlog::warn("Second run");
        spdlog::default_logger()->flush();
        spdlog::set_default_logger(previous);
        spdlog::drop("modfetch");

        const std::string content = read_file(log_file);
        CHECK(starts_with(content, "previous run\n\n\n"));
        CHECK(contains(content, "Second run"));
    }
}
