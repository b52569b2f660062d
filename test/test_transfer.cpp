#include <doctest/doctest.h>

#include <modfetch/transfer.hpp>
#include <modfetch/utils.hpp>

#include "fake_origin.hpp"

using namespace modfetch;
using namespace modfetch::testing;

namespace
{
    struct TransferFixture
    {
        TemporaryDirectory tmp;
        Context ctx;
        FakeOrigin origin{ ctx };
        CancellationSignal cancel;
        RecordingSink sink;

        fs::path part(const ManifestEntry& entry) const
        {
            return tmp.path() / (entry.file_name + ".part");
        }

        fs::path final_file(const ManifestEntry& entry) const
        {
            return tmp.path() / entry.file_name;
        }

        tl::expected<TransferStatus, DownloaderError> run(const ManifestEntry& entry)
        {
            ResumableTransfer transfer(ctx, origin, cancel, tmp.path());
            auto result = transfer.transfer(entry, origin.direct_urls.at(entry.file_id), sink);
            attempts = transfer.attempts();
            return result;
        }

        std::size_t attempts = 0;
    };
}

TEST_SUITE("transfer")
{
    TEST_CASE_FIXTURE(TransferFixture, "single small artifact")
    {
        const std::string content = make_content(1000);
        const auto entry = make_entry("mod.7z", content);
        origin.serve(entry.file_id, entry.file_name, content);

        auto result = run(entry);
        REQUIRE(result);
        CHECK_EQ(result.value(), TransferStatus::kSUCCESSFUL);

        CHECK_EQ(read_file(final_file(entry)), content);
        CHECK_FALSE(fs::exists(part(entry)));

        REQUIRE_EQ(origin.streams.size(), 1);
        CHECK_EQ(origin.streams[0].offset, 0);

        REQUIRE_EQ(sink.currents.size(), 1);
        CHECK_EQ(sink.currents[0].file_name, "mod.7z");
        CHECK_EQ(sink.currents[0].total_size, 1000);
        CHECK_EQ(sink.currents[0].already_downloaded, 0);
        CHECK_EQ(sink.progress, std::vector<std::uintmax_t>{ 1000 });
        CHECK_EQ(attempts, 0);
    }

    TEST_CASE_FIXTURE(TransferFixture, "progress is reported per chunk")
    {
        ctx.chunk_size = 4096;
        origin.delivery_size = 1000;

        const std::string content = make_content(10000);
        const auto entry = make_entry("mod.7z", content);
        origin.serve(entry.file_id, entry.file_name, content);

        auto result = run(entry);
        REQUIRE(result);
        CHECK_EQ(sink.progress, std::vector<std::uintmax_t>{ 4096, 8192, 10000 });
        CHECK_EQ(sink.rates.size(), 3);
    }

    TEST_CASE_FIXTURE(TransferFixture, "resume from an existing part file")
    {
        const std::string content = make_content(50000, 5);
        const auto entry = make_entry("mod.7z", content);
        origin.serve(entry.file_id, entry.file_name, content);
        write_file(part(entry), content.substr(0, 12345));

        auto result = run(entry);
        REQUIRE(result);
        CHECK_EQ(result.value(), TransferStatus::kSUCCESSFUL);

        REQUIRE_EQ(origin.streams.size(), 1);
        CHECK_EQ(origin.streams[0].offset, 12345);
        REQUIRE_EQ(sink.currents.size(), 1);
        CHECK_EQ(sink.currents[0].already_downloaded, 12345);
        CHECK_EQ(sink.progress.back(), 50000);

        CHECK_EQ(read_file(final_file(entry)), content);
        CHECK(compare_hash_from_path(final_file(entry), entry.content_hash));
    }

    TEST_CASE_FIXTURE(TransferFixture, "hash mismatch is retried from scratch")
    {
        const std::string content = make_content(3000);
        const auto entry = make_entry("mod.7z", content);
        origin.serve(entry.file_id, entry.file_name, content).corrupt_deliveries = 1;

        auto result = run(entry);
        REQUIRE(result);
        CHECK_EQ(result.value(), TransferStatus::kSUCCESSFUL);
        CHECK_EQ(attempts, 1);

        REQUIRE_EQ(origin.streams.size(), 2);
        CHECK_EQ(origin.streams[1].offset, 0);
        REQUIRE_EQ(sink.currents.size(), 2);
        CHECK_EQ(sink.currents[1].already_downloaded, 0);
        CHECK_EQ(read_file(final_file(entry)), content);
    }

    TEST_CASE_FIXTURE(TransferFixture, "bounded retry abandons the artifact")
    {
        const std::string content = make_content(3000);
        const auto entry = make_entry("mod.7z", content);
        origin.serve(entry.file_id, entry.file_name, content).corrupt_deliveries = -1;

        auto result = run(entry);
        REQUIRE_FALSE(result);
        CHECK_EQ(result.error().level, ErrorLevel::SERIOUS);
        CHECK_EQ(result.error().code, ErrorCode::MF_BADCHECKSUM);
        CHECK_EQ(attempts, 2);
        CHECK_EQ(origin.streams.size(), 2);

        CHECK_FALSE(fs::exists(part(entry)));
        CHECK_FALSE(fs::exists(final_file(entry)));
    }

    TEST_CASE_FIXTURE(TransferFixture, "announced length mismatch keeps the part file")
    {
        const std::string content = make_content(3000);
        const auto entry = make_entry("mod.7z", content);
        origin.serve(entry.file_id, entry.file_name, content).announced_length = 2999;
        write_file(part(entry), content.substr(0, 1000));

        auto result = run(entry);
        REQUIRE_FALSE(result);
        CHECK_EQ(result.error().level, ErrorLevel::SERIOUS);
        CHECK_EQ(result.error().code, ErrorCode::MF_BADSIZE);
        CHECK(contains(result.error().reason, "2999"));
        CHECK(contains(result.error().reason, "2000"));

        CHECK_EQ(origin.streams.size(), 1);
        CHECK(sink.progress.empty());
        CHECK_EQ(fs::file_size(part(entry)), 1000);
        CHECK_FALSE(fs::exists(final_file(entry)));
    }

    TEST_CASE_FIXTURE(TransferFixture, "missing content length is a mismatch")
    {
        const std::string content = make_content(3000);
        const auto entry = make_entry("mod.7z", content);
        origin.serve(entry.file_id, entry.file_name, content).omit_content_length = true;

        auto result = run(entry);
        REQUIRE_FALSE(result);
        CHECK_EQ(result.error().code, ErrorCode::MF_BADSIZE);
        CHECK_FALSE(fs::exists(final_file(entry)));
    }

    TEST_CASE_FIXTURE(TransferFixture, "error status is fatal")
    {
        const std::string content = make_content(3000);
        const auto entry = make_entry("mod.7z", content);
        origin.serve(entry.file_id, entry.file_name, content).status = 403;

        CHECK_THROWS_AS(run(entry), download_error);
        CHECK_FALSE(fs::exists(final_file(entry)));
    }

    TEST_CASE_FIXTURE(TransferFixture, "cancellation leaves a resumable part file")
    {
        ctx.chunk_size = 1000;
        origin.delivery_size = 1000;

        const std::string content = make_content(10000);
        const auto entry = make_entry("mod.7z", content);
        origin.serve(entry.file_id, entry.file_name, content);
        origin.on_delivered = [this](std::uintmax_t position)
        {
            if (position >= 3000)
                cancel.request();
        };

        auto result = run(entry);
        REQUIRE(result);
        CHECK_EQ(result.value(), TransferStatus::kCANCELLED);

        CHECK_FALSE(fs::exists(final_file(entry)));
        REQUIRE(fs::exists(part(entry)));
        const auto part_size = fs::file_size(part(entry));
        CHECK_LE(part_size, entry.total_size);
        CHECK_LT(part_size, entry.total_size);
        CHECK_EQ(part_size, sink.progress.back());
        CHECK_EQ(read_file(part(entry)), content.substr(0, part_size));
    }

    TEST_CASE_FIXTURE(TransferFixture, "oversized part is discarded before resuming")
    {
        const std::string content = make_content(2000);
        const auto entry = make_entry("mod.7z", content);
        origin.serve(entry.file_id, entry.file_name, content);
        write_file(part(entry), make_content(2500, 4));

        auto result = run(entry);
        REQUIRE(result);
        REQUIRE_EQ(origin.streams.size(), 1);
        CHECK_EQ(origin.streams[0].offset, 0);
        CHECK_EQ(read_file(final_file(entry)), content);
    }

    TEST_CASE_FIXTURE(TransferFixture, "complete part is verified without a request")
    {
        const std::string content = make_content(2000);
        const auto entry = make_entry("mod.7z", content);
        origin.serve(entry.file_id, entry.file_name, content);
        write_file(part(entry), content);

        auto result = run(entry);
        REQUIRE(result);
        CHECK_EQ(result.value(), TransferStatus::kSUCCESSFUL);
        CHECK(origin.streams.empty());
        CHECK(fs::exists(final_file(entry)));
    }

    TEST_CASE_FIXTURE(TransferFixture, "empty url")
    {
        const auto entry = make_entry("mod.7z", make_content(10));
        ResumableTransfer transfer(ctx, origin, cancel, tmp.path());
        auto result = transfer.transfer(entry, "", sink);
        REQUIRE_FALSE(result);
        CHECK_EQ(result.error().code, ErrorCode::MF_NOURL);
        CHECK(result.error().is_fatal());
    }
}
