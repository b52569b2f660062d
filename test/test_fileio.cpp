#include <doctest/doctest.h>

#include <modfetch/fileio.hpp>

#include "fake_origin.hpp"

using namespace modfetch;
using modfetch::testing::TemporaryDirectory;
using modfetch::testing::read_file;
using modfetch::testing::write_file;

TEST_SUITE("fileio")
{
    TEST_CASE("append creates a missing part file")
    {
        TemporaryDirectory tmp;
        const auto path = tmp.path() / "mod.7z.part";
        std::error_code ec;
        {
            FileIO f(path, FileIO::append_update_binary, ec);
            CHECK_FALSE(ec);
            CHECK(f.open());
            CHECK_EQ(f.write("test", 1, 4), 4);
            CHECK(f.flush());
            f.close(ec);
            CHECK_FALSE(ec);
            CHECK_FALSE(f.open());
        }
        CHECK_EQ(fs::file_size(path), 4);
    }

    TEST_CASE("open missing file for reading")
    {
        TemporaryDirectory tmp;
        std::error_code ec;
        FileIO f(tmp.path() / "missing.7z", FileIO::read_binary, ec);
        CHECK(ec);
        CHECK_FALSE(f.open());
    }

    TEST_CASE("append keeps the bytes of an interrupted run")
    {
        TemporaryDirectory tmp;
        const auto path = tmp.path() / "mod.7z.part";
        write_file(path, "Hello ");

        std::error_code ec;
        {
            FileIO f(path, FileIO::append_update_binary, ec);
            REQUIRE_FALSE(ec);
            CHECK_EQ(f.write("world", 1, 5), 5);
            CHECK(f.flush());
            CHECK_FALSE(f.error());
        }
        CHECK_EQ(read_file(path), "Hello world");
    }

    TEST_CASE("read back in pieces")
    {
        TemporaryDirectory tmp;
        const auto path = tmp.path() / "mod.7z";
        write_file(path, "0123456789");

        std::error_code ec;
        FileIO f(path, FileIO::read_binary, ec);
        REQUIRE_FALSE(ec);

        char buffer[4];
        std::string collected;
        std::size_t count = 0;
        while ((count = f.read(buffer, 1, sizeof(buffer))) > 0)
            collected.append(buffer, count);
        CHECK_FALSE(f.error());
        CHECK_EQ(collected, "0123456789");
    }
}
