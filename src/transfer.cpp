#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <modfetch/fileio.hpp>
#include <modfetch/transfer.hpp>
#include <modfetch/utils.hpp>

namespace modfetch
{
    namespace
    {
        // Missing or unparseable lengths count as 0.
        std::uintmax_t declared_length(const Response& response)
        {
            auto value = response.get_header("content-length");
            if (!value || value.value().empty())
            {
                return 0;
            }
            char* end = nullptr;
            const unsigned long long length = std::strtoull(value.value().c_str(), &end, 10);
            if (end == nullptr || *end != '\0')
            {
                return 0;
            }
            return static_cast<std::uintmax_t>(length);
        }

        // Receives the body of one GET, writes it to the part file in chunk_size pieces.
        // Callbacks run inside curl, so failures are recorded here and raised once the
        // request has returned.
        class PartFileWriter : public StreamHandler
        {
        public:
            PartFileWriter(const Context& ctx,
                           const ManifestEntry& entry,
                           TransferState& state,
                           FileIO& outfile,
                           ProgressSink& sink,
                           const CancellationSignal& cancel)
                : m_ctx(ctx)
                , m_entry(entry)
                , m_state(state)
                , m_outfile(outfile)
                , m_sink(sink)
                , m_cancel(cancel)
            {
                m_buffer.reserve(std::max<std::size_t>(m_ctx.chunk_size, 1));
            }

            bool on_response(const Response& response) override
            {
                try
                {
                    return check_response(response);
                }
                catch (...)
                {
                    m_exception = std::current_exception();
                    return false;
                }
            }

            bool on_data(const char* buffer, std::size_t size) override
            {
                try
                {
                    const std::size_t chunk_size = std::max<std::size_t>(m_ctx.chunk_size, 1);
                    while (size > 0)
                    {
                        const std::size_t take = std::min(size, chunk_size - m_buffer.size());
                        m_buffer.insert(m_buffer.end(), buffer, buffer + take);
                        buffer += take;
                        size -= take;
                        if (m_buffer.size() == chunk_size && !write_chunk())
                        {
                            return false;
                        }
                    }
                    return true;
                }
                catch (...)
                {
                    m_exception = std::current_exception();
                    return false;
                }
            }

            // Raises what happened inside the callbacks and writes the last, shorter chunk.
            void finish()
            {
                if (m_exception)
                {
                    std::rethrow_exception(m_exception);
                }
                if (!m_fatal.empty())
                {
                    throw download_error(m_fatal);
                }
                if (!m_cancelled && !m_abandon)
                {
                    write_chunk();
                }
            }

            bool cancelled() const noexcept
            {
                return m_cancelled;
            }

            const std::optional<DownloaderError>& abandon_reason() const noexcept
            {
                return m_abandon;
            }

        private:
            bool check_response(const Response& response)
            {
                if (!response.ok())
                {
                    m_fatal = fmt::format("{}: server answered HTTP {} for {}",
                                          m_entry.file_name,
                                          response.http_status,
                                          response.effective_url);
                    return false;
                }

                const std::uintmax_t expected = m_entry.total_size - m_state.already_downloaded;
                const std::uintmax_t declared = declared_length(response);
                if (declared != expected)
                {
                    m_abandon = DownloaderError{
                        ErrorLevel::SERIOUS,
                        ErrorCode::MF_BADSIZE,
                        fmt::format("{}: server announced {} bytes, expected {} (offset {} of {})",
                                    m_entry.file_name,
                                    declared,
                                    expected,
                                    m_state.already_downloaded,
                                    m_entry.total_size)
                    };
                    return false;
                }

                m_sink.set_current(m_entry.file_name, m_entry.total_size, m_state.already_downloaded);
                m_last_chunk = std::chrono::steady_clock::now();
                return true;
            }

            bool write_chunk()
            {
                if (m_buffer.empty())
                {
                    return true;
                }

                const std::size_t size = m_buffer.size();
                if (m_state.already_downloaded + size > m_entry.total_size)
                {
                    m_abandon = DownloaderError{
                        ErrorLevel::SERIOUS,
                        ErrorCode::MF_BADSIZE,
                        fmt::format("{}: server sent more than the expected {} bytes",
                                    m_entry.file_name,
                                    m_entry.total_size)
                    };
                    m_buffer.clear();
                    return false;
                }

                if (m_outfile.write(m_buffer.data(), 1, size) != size || !m_outfile.flush())
                {
                    throw download_error(
                        fmt::format("Could not write to {}", m_state.part_path.string()));
                }
                m_state.hasher.update(m_buffer.data(), size);
                m_state.already_downloaded += size;
                m_buffer.clear();

                const auto now = std::chrono::steady_clock::now();
                const std::chrono::duration<double> elapsed = now - m_last_chunk;
                m_last_chunk = now;
                std::optional<double> rate;
                if (elapsed.count() > 0)
                {
                    rate = static_cast<double>(size) / elapsed.count();
                }
                m_sink.update_progress(m_state.already_downloaded, rate);

                if (m_cancel.is_requested())
                {
                    m_cancelled = true;
                    return false;
                }
                return true;
            }

            const Context& m_ctx;
            const ManifestEntry& m_entry;
            TransferState& m_state;
            FileIO& m_outfile;
            ProgressSink& m_sink;
            const CancellationSignal& m_cancel;

            std::vector<char> m_buffer;
            std::chrono::steady_clock::time_point m_last_chunk;

            bool m_cancelled = false;
            std::optional<DownloaderError> m_abandon;
            std::string m_fatal;
            std::exception_ptr m_exception;
        };
    }

    ResumableTransfer::ResumableTransfer(const Context& ctx,
                                         Session& session,
                                         CancellationSignal cancel,
                                         const fs::path& destination)
        : m_ctx(ctx)
        , m_session(session)
        , m_cancel(std::move(cancel))
        , m_destination(destination)
    {
    }

    void ResumableTransfer::prepare_attempt(const ManifestEntry& entry, TransferState& state) const
    {
        std::error_code ec;
        if (fs::exists(state.part_path, ec) && fs::file_size(state.part_path) > entry.total_size)
        {
            spdlog::warn("{}: part file is larger than expected ({} > {}), removing",
                         entry.file_name,
                         fs::file_size(state.part_path),
                         entry.total_size);
            fs::remove(state.part_path);
        }

        state.hasher = IncrementalHasher::from_file(state.part_path, m_ctx.chunk_size);
        state.already_downloaded = state.hasher.bytes_hashed();
    }

    tl::expected<TransferStatus, DownloaderError> ResumableTransfer::transfer(
        const ManifestEntry& entry, const std::string& url, ProgressSink& sink)
    {
        m_attempts = 0;
        if (url.empty())
        {
            return tl::make_unexpected(
                DownloaderError{ ErrorLevel::FATAL,
                                 ErrorCode::MF_NOURL,
                                 fmt::format("{}: no download URL", entry.file_name) });
        }
        if (auto valid = validate(entry); !valid)
        {
            return tl::make_unexpected(valid.error());
        }

        TransferState state;
        state.destination = m_destination / entry.file_name;
        state.part_path = m_destination / (entry.file_name + PARTEXT);

        const std::size_t max_attempts = std::max<std::size_t>(m_ctx.max_attempts, 1);
        while (true)
        {
            prepare_attempt(entry, state);

            if (state.already_downloaded < entry.total_size)
            {
                std::error_code ec;
                FileIO outfile(state.part_path, FileIO::append_update_binary, ec);
                if (ec)
                {
                    throw std::system_error(ec,
                                            "Could not open part file " + state.part_path.string());
                }

                spdlog::info("Downloading {} ({} of {} bytes on disk)",
                             entry.file_name,
                             state.already_downloaded,
                             entry.total_size);

                PartFileWriter writer(m_ctx, entry, state, outfile, sink, m_cancel);
                m_session.stream(url, state.already_downloaded, writer);
                writer.finish();

                outfile.close(ec);
                if (ec)
                {
                    throw std::system_error(ec, "Could not close " + state.part_path.string());
                }

                if (writer.cancelled())
                {
                    spdlog::info("{}: cancelled at {} of {} bytes",
                                 entry.file_name,
                                 state.already_downloaded,
                                 entry.total_size);
                    return TransferStatus::kCANCELLED;
                }
                if (writer.abandon_reason())
                {
                    return tl::make_unexpected(writer.abandon_reason().value());
                }
            }

            if (compare_hash(state.hasher, entry.content_hash))
            {
                fs::rename(state.part_path, state.destination);
                spdlog::info("Finished downloading {}", entry.file_name);
                return TransferStatus::kSUCCESSFUL;
            }

            state.attempts++;
            m_attempts = state.attempts;
            spdlog::error("{}: hash mismatch (expected {}, got {}), attempt {} of {}",
                          entry.file_name,
                          entry.content_hash,
                          reference_hash(state.hasher.digest()),
                          state.attempts,
                          max_attempts);
            fs::remove(state.part_path);

            if (state.attempts >= max_attempts)
            {
                return tl::make_unexpected(DownloaderError{
                    ErrorLevel::SERIOUS,
                    ErrorCode::MF_BADCHECKSUM,
                    fmt::format("{}: giving up after {} hash mismatches",
                                entry.file_name,
                                state.attempts) });
            }
        }
    }
}
