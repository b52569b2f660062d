#ifndef MODFETCH_ORCHESTRATOR_HPP
#define MODFETCH_ORCHESTRATOR_HPP

#include <atomic>
#include <filesystem>
#include <future>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include <modfetch/export.hpp>
#include <modfetch/cancellation.hpp>
#include <modfetch/context.hpp>
#include <modfetch/enums.hpp>
#include <modfetch/errors.hpp>
#include <modfetch/manifest.hpp>
#include <modfetch/progress.hpp>
#include <modfetch/session.hpp>
#include <modfetch/transfer.hpp>

namespace modfetch
{
    namespace fs = std::filesystem;

    // Handle on the transfer running in the background.
    class MODFETCH_API TransferTask
    {
    public:
        using result_type = tl::expected<TransferStatus, DownloaderError>;

        TransferTask() = default;
        TransferTask(std::string file_name, std::future<result_type> future);

        bool valid() const noexcept;
        const std::string& file_name() const noexcept;

        // Blocks until the transfer is over. Rethrows whatever escaped the transfer.
        result_type wait();

    private:
        std::string m_file_name;
        std::future<result_type> m_future;
    };

    /**
     * Runs a download set: reconciles the manifest with the destination, then for each queued
     * artifact resolves a direct URL and hands it to a ResumableTransfer.
     *
     * Resolution of artifact N runs while transfer N-1 finishes; transfer N-1 is always joined
     * before transfer N starts, so at most one transfer writes to disk.
     */
    class MODFETCH_API DownloadOrchestrator
    {
    public:
        DownloadOrchestrator(const Context& ctx,
                             Session& session,
                             CancellationSignal cancel,
                             ProgressSink& sink);

        RunReport run(const fs::path& manifest_path, const fs::path& destination);
        RunReport run(const std::vector<ManifestEntry>& entries, const fs::path& destination);

        // POST (game_id, fid) to the API, then HEAD the returned URL.
        tl::expected<std::string, DownloaderError> resolve_direct_url(const ManifestEntry& entry);

        OrchestratorState state() const noexcept
        {
            return m_state.load();
        }

    private:
        TransferTask launch(ResumableTransfer& transfer,
                            const ManifestEntry& entry,
                            const std::string& url);
        void collect(TransferTask& task, RunReport& report);
        RunReport finish(RunReport& report, bool aborted);

        const Context& m_ctx;
        Session& m_session;
        CancellationSignal m_cancel;
        ProgressSink& m_sink;
        std::atomic<OrchestratorState> m_state{ OrchestratorState::kIDLE };
    };
}

#endif
