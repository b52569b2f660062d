#include <doctest/doctest.h>

#include <modfetch/utils.hpp>

using namespace modfetch;

TEST_SUITE("utility")
{
    TEST_CASE("starts_with")
    {
        CHECK(starts_with("HTTP/1.1 200 OK", "HTTP/"));
        CHECK_FALSE(starts_with("HTT", "HTTP/"));
    }

    TEST_CASE("parse_header")
    {
        auto [key, value] = parse_header("Content-Length:   1000\r\n");
        CHECK_EQ(key, "content-length");
        CHECK_EQ(value, "1000");

        auto no_colon = parse_header("garbage\r\n");
        CHECK(no_colon.first.empty());
    }

    TEST_CASE("base64_encode")
    {
        const unsigned char abc[] = { 'a', 'b', 'c' };
        CHECK_EQ(base64_encode(abc, 3), "YWJj");
        CHECK_EQ(base64_encode(abc, 1), "YQ==");
        CHECK_EQ(base64_encode(abc, 0), "");
    }

    TEST_CASE("format_byte_size")
    {
        CHECK_EQ(format_byte_size(0), "0B");
        CHECK_EQ(format_byte_size(512), "512.00B");
        CHECK_EQ(format_byte_size(1024), "1.00KB");
        CHECK_EQ(format_byte_size(1.5 * 1024 * 1024), "1.50MB");
        CHECK_EQ(format_byte_size(3.0 * 1024 * 1024 * 1024), "3.00GB");
    }

    TEST_CASE("is_plain_file_name")
    {
        CHECK(is_plain_file_name("SkyUI_5_2_SE-12604-5-2SE.7z"));
        CHECK_FALSE(is_plain_file_name(""));
        CHECK_FALSE(is_plain_file_name(".."));
        CHECK_FALSE(is_plain_file_name("../escape.7z"));
        CHECK_FALSE(is_plain_file_name("sub\\dir.7z"));
    }

    TEST_CASE("get_env")
    {
        CHECK_EQ(get_env("MODFETCH_SURELY_UNSET_VARIABLE", "fallback"), "fallback");
    }
}
