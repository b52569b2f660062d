#include <deque>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <modfetch/orchestrator.hpp>
#include <modfetch/reconciler.hpp>
#include <modfetch/utils.hpp>

namespace modfetch
{
    /****************
     * TransferTask *
     ****************/

    TransferTask::TransferTask(std::string file_name, std::future<result_type> future)
        : m_file_name(std::move(file_name))
        , m_future(std::move(future))
    {
    }

    bool TransferTask::valid() const noexcept
    {
        return m_future.valid();
    }

    const std::string& TransferTask::file_name() const noexcept
    {
        return m_file_name;
    }

    TransferTask::result_type TransferTask::wait()
    {
        return m_future.get();
    }

    /************************
     * DownloadOrchestrator *
     ************************/

    DownloadOrchestrator::DownloadOrchestrator(const Context& ctx,
                                               Session& session,
                                               CancellationSignal cancel,
                                               ProgressSink& sink)
        : m_ctx(ctx)
        , m_session(session)
        , m_cancel(std::move(cancel))
        , m_sink(sink)
    {
    }

    tl::expected<std::string, DownloaderError> DownloadOrchestrator::resolve_direct_url(
        const ManifestEntry& entry)
    {
        spdlog::debug("Resolving download URL of {} (game {}, file {})",
                      entry.file_name,
                      entry.game_id,
                      entry.file_id);

        Response response = m_session.post_form(m_ctx.api_url,
                                                { { "fid", std::to_string(entry.file_id) },
                                                  { "game_id", std::to_string(entry.game_id) } });
        if (!response.ok())
        {
            return tl::make_unexpected(
                DownloaderError{ ErrorLevel::FATAL,
                                 ErrorCode::MF_BADSTATUS,
                                 fmt::format("{}: URL request answered HTTP {}",
                                             entry.file_name,
                                             response.http_status) });
        }

        nlohmann::json document;
        try
        {
            document = response.json();
        }
        catch (const nlohmann::json::exception& e)
        {
            return tl::make_unexpected(
                DownloaderError{ ErrorLevel::FATAL,
                                 ErrorCode::MF_NOURL,
                                 fmt::format("{}: invalid URL response: {}", entry.file_name, e.what()) });
        }

        if (!document.is_object() || !document.contains("url") || !document["url"].is_string()
            || document["url"].get<std::string>().empty())
        {
            return tl::make_unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::MF_NOURL,
                fmt::format("{}: no download URL in response", entry.file_name) });
        }
        std::string url = document["url"].get<std::string>();

        Response head = m_session.head(url);
        if (!head.ok())
        {
            return tl::make_unexpected(
                DownloaderError{ ErrorLevel::FATAL,
                                 ErrorCode::MF_BADSTATUS,
                                 fmt::format("{}: download URL {} answered HTTP {}",
                                             entry.file_name,
                                             url,
                                             head.http_status) });
        }
        return url;
    }

    TransferTask DownloadOrchestrator::launch(ResumableTransfer& transfer,
                                              const ManifestEntry& entry,
                                              const std::string& url)
    {
        auto future = std::async(std::launch::async,
                                 [this, &transfer, entry, url]() -> TransferTask::result_type
                                 {
                                     try
                                     {
                                         return transfer.transfer(entry, url, m_sink);
                                     }
                                     catch (...)
                                     {
                                         // Stop the run before the orchestrator joins us
                                         m_cancel.request();
                                         throw;
                                     }
                                 });
        return TransferTask(entry.file_name, std::move(future));
    }

    void DownloadOrchestrator::collect(TransferTask& task, RunReport& report)
    {
        if (!task.valid())
        {
            return;
        }

        const std::string name = task.file_name();
        auto result = task.wait();
        if (!result)
        {
            if (result.error().is_fatal())
            {
                throw download_error(result.error().reason);
            }
            spdlog::error("Abandoning {}: {}", name, result.error().reason);
            report.abandoned.push_back(name);
        }
        else if (result.value() == TransferStatus::kSUCCESSFUL)
        {
            report.completed++;
        }
    }

    RunReport DownloadOrchestrator::finish(RunReport& report, bool aborted)
    {
        if (aborted)
        {
            report.state = RunState::kABORTED;
        }
        else if (m_cancel.is_requested())
        {
            report.state = RunState::kCANCELLED;
        }
        else
        {
            report.state = RunState::kCOMPLETED;
        }
        m_state = aborted ? OrchestratorState::kABORTED : OrchestratorState::kDONE;

        spdlog::info("Run finished: {} completed, {} abandoned, {} already downloaded",
                     report.completed,
                     report.abandoned.size(),
                     report.already_satisfied);
        m_sink.finished(report);
        return report;
    }

    RunReport DownloadOrchestrator::run(const fs::path& manifest_path, const fs::path& destination)
    {
        std::vector<ManifestEntry> entries;
        try
        {
            entries = load_manifest(manifest_path);
        }
        catch (const manifest_error& e)
        {
            spdlog::critical("{}", e.what());
            m_cancel.request();
            RunReport report;
            return finish(report, true);
        }
        return run(entries, destination);
    }

    RunReport DownloadOrchestrator::run(const std::vector<ManifestEntry>& entries,
                                        const fs::path& destination)
    {
        RunReport report;
        bool aborted = false;
        m_state = OrchestratorState::kIDLE;

        ResumableTransfer transfer(m_ctx, m_session, m_cancel, destination);
        TransferTask in_flight;

        try
        {
            for (std::size_t i = 0; i < entries.size(); ++i)
            {
                if (auto valid = validate(entries[i]); !valid)
                {
                    throw manifest_error(
                        fmt::format("manifest entry #{}: {}", i, valid.error().reason));
                }
            }

            ManifestReconciler reconciler(destination);
            ReconcileResult reconciled = reconciler.reconcile(entries);
            report.already_satisfied = reconciled.already_satisfied;
            report.queued = reconciled.queue.size();

            m_sink.set_total_count(reconciled.queue.size());
            m_sink.set_already_satisfied(reconciled.already_satisfied);

            std::deque<ManifestEntry> pending(reconciled.queue.begin(), reconciled.queue.end());
            while (!pending.empty() && !m_cancel.is_requested())
            {
                ManifestEntry entry = std::move(pending.front());
                pending.pop_front();

                m_state = OrchestratorState::kRESOLVING;
                auto url = resolve_direct_url(entry);
                if (!url)
                {
                    url.error().log();
                    m_cancel.request();
                    aborted = true;
                    break;
                }
                if (m_cancel.is_requested())
                {
                    break;
                }

                collect(in_flight, report);
                if (m_cancel.is_requested())
                {
                    break;
                }

                m_state = OrchestratorState::kTRANSFERRING;
                in_flight = launch(transfer, entry, url.value());
            }

            collect(in_flight, report);
        }
        catch (const std::exception& e)
        {
            spdlog::critical("Aborting downloads: {}", e.what());
            m_cancel.request();
            aborted = true;
        }

        // The transfer still running when resolution failed must not outlive this frame
        if (in_flight.valid())
        {
            try
            {
                collect(in_flight, report);
            }
            catch (const std::exception& e)
            {
                spdlog::critical("{}: {}", in_flight.file_name(), e.what());
            }
        }

        return finish(report, aborted);
    }
}
