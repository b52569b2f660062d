#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <modfetch/hasher.hpp>
#include <modfetch/reconciler.hpp>
#include <modfetch/utils.hpp>

namespace modfetch
{
    ManifestReconciler::ManifestReconciler(const fs::path& destination)
        : m_destination(destination)
    {
        std::error_code ec;
        if (!fs::is_directory(m_destination, ec))
        {
            throw download_error(
                fmt::format("Destination {} is not a directory", m_destination.string()));
        }
    }

    fs::path ManifestReconciler::file_path(const ManifestEntry& entry) const
    {
        return m_destination / entry.file_name;
    }

    fs::path ManifestReconciler::part_path(const ManifestEntry& entry) const
    {
        return m_destination / (entry.file_name + PARTEXT);
    }

    EntryState ManifestReconciler::classify(const ManifestEntry& entry) const
    {
        const fs::path final_path = file_path(entry);
        const fs::path partial_path = part_path(entry);

        if (fs::is_regular_file(final_path))
        {
            if (fs::exists(partial_path))
            {
                spdlog::debug("Removing stray part file {}", partial_path.string());
                fs::remove(partial_path);
            }
            return EntryState::kCOMPLETE;
        }

        if (!fs::is_regular_file(partial_path))
        {
            return EntryState::kFRESH;
        }

        const std::uintmax_t part_size = fs::file_size(partial_path);
        if (part_size < entry.total_size)
        {
            spdlog::debug("{}: resumable at {} of {} bytes",
                          entry.file_name,
                          part_size,
                          entry.total_size);
            return EntryState::kRESUMABLE;
        }

        if (part_size > entry.total_size)
        {
            spdlog::warn("{}: part file is larger than expected ({} > {}), removing",
                         entry.file_name,
                         part_size,
                         entry.total_size);
            fs::remove(partial_path);
            return EntryState::kFRESH;
        }

        const auto digest = IncrementalHasher::from_file(partial_path).digest();
        if (verify_digest(digest, entry.content_hash))
        {
            spdlog::info("{}: complete part file verified, finalizing", entry.file_name);
            fs::rename(partial_path, final_path);
            return EntryState::kCOMPLETE;
        }

        spdlog::warn("{}: part file hash mismatch (expected {}, got {}), removing",
                     entry.file_name,
                     entry.content_hash,
                     reference_hash(digest));
        fs::remove(partial_path);
        return EntryState::kFRESH;
    }

    ReconcileResult ManifestReconciler::reconcile(const std::vector<ManifestEntry>& entries) const
    {
        ReconcileResult result;
        for (const auto& entry : entries)
        {
            if (classify(entry) == EntryState::kCOMPLETE)
            {
                result.already_satisfied++;
            }
            else
            {
                result.queue.push_back(entry);
            }
        }
        spdlog::info("Found {} mods to download, {} already downloaded",
                     result.queue.size(),
                     result.already_satisfied);
        return result;
    }
}
