#include <doctest/doctest.h>

#include <modfetch/manifest.hpp>
#include <modfetch/utils.hpp>

#include "fake_origin.hpp"

using namespace modfetch;
using namespace modfetch::testing;

namespace
{
    nlohmann::json valid_entry()
    {
        return nlohmann::json{ { "FileName", "SkyUI_5_2_SE.7z" },
                               { "Size", 2920000 },
                               { "Hash", "mQl3rfUsvEQ=" },
                               { "GameID", 1704 },
                               { "FileID", 35407 } };
    }

    std::string error_of(const nlohmann::json& document)
    {
        try
        {
            parse_manifest(document);
        }
        catch (const manifest_error& e)
        {
            return e.what();
        }
        return "";
    }
}

TEST_SUITE("manifest")
{
    TEST_CASE("parse")
    {
        auto entries = parse_manifest(nlohmann::json::array({ valid_entry() }));
        REQUIRE_EQ(entries.size(), 1);
        CHECK_EQ(entries[0].file_name, "SkyUI_5_2_SE.7z");
        CHECK_EQ(entries[0].total_size, 2920000);
        CHECK_EQ(entries[0].content_hash, "mQl3rfUsvEQ=");
        CHECK_EQ(entries[0].game_id, 1704);
        CHECK_EQ(entries[0].file_id, 35407);
    }

    TEST_CASE("missing and mistyped fields name the entry")
    {
        for (const char* field : { "FileName", "Size", "Hash", "GameID", "FileID" })
        {
            auto broken = valid_entry();
            broken.erase(field);
            auto message = error_of(nlohmann::json::array({ valid_entry(), broken }));
            CHECK(contains(message, "#1"));
            CHECK(contains(message, field));
        }

        auto mistyped = valid_entry();
        mistyped["Size"] = "2920000";
        CHECK(contains(error_of(nlohmann::json::array({ mistyped })), "Size"));
    }

    TEST_CASE("invalid values")
    {
        auto zero = valid_entry();
        zero["Size"] = 0;
        CHECK_FALSE(error_of(nlohmann::json::array({ zero })).empty());

        auto no_hash = valid_entry();
        no_hash["Hash"] = "";
        CHECK_FALSE(error_of(nlohmann::json::array({ no_hash })).empty());

        auto path = valid_entry();
        path["FileName"] = "../outside.7z";
        CHECK_FALSE(error_of(nlohmann::json::array({ path })).empty());

        CHECK_FALSE(error_of(valid_entry()).empty());
    }

    TEST_CASE("validate")
    {
        ManifestEntry entry;
        entry.file_name = "mod.7z";
        entry.total_size = 10;
        entry.content_hash = "menYUTfbRu8=";
        CHECK(validate(entry));

        entry.total_size = 0;
        auto result = validate(entry);
        REQUIRE_FALSE(result);
        CHECK_EQ(result.error().code, ErrorCode::MF_BADMANIFEST);
        CHECK(result.error().is_fatal());
    }

    TEST_CASE("load and save")
    {
        TemporaryDirectory tmp;
        std::vector<ManifestEntry> entries{ make_entry("a.7z", make_content(10), 1),
                                            make_entry("b.zip", make_content(20), 2) };
        save_manifest(tmp.path() / "manifest.json", entries);
        CHECK_EQ(load_manifest(tmp.path() / "manifest.json"), entries);

        auto document = nlohmann::json::parse(read_file(tmp.path() / "manifest.json"));
        CHECK_EQ(document[1]["FileName"], "b.zip");
        CHECK_EQ(document[1]["Size"], 20);
    }

    TEST_CASE("unreadable manifests")
    {
        TemporaryDirectory tmp;
        CHECK_THROWS_AS(load_manifest(tmp.path() / "missing.json"), manifest_error);

        write_file(tmp.path() / "broken.json", "[{\"FileName\": ");
        CHECK_THROWS_AS(load_manifest(tmp.path() / "broken.json"), manifest_error);
    }
}
