#ifndef MODFETCH_TRANSFER_HPP
#define MODFETCH_TRANSFER_HPP

#include <cstdint>
#include <filesystem>
#include <string>

#include <tl/expected.hpp>

#include <modfetch/export.hpp>
#include <modfetch/cancellation.hpp>
#include <modfetch/context.hpp>
#include <modfetch/enums.hpp>
#include <modfetch/errors.hpp>
#include <modfetch/hasher.hpp>
#include <modfetch/manifest.hpp>
#include <modfetch/progress.hpp>
#include <modfetch/session.hpp>

namespace modfetch
{
    namespace fs = std::filesystem;

    // Bookkeeping of one artifact while it is being transferred.
    struct TransferState
    {
        fs::path destination;
        fs::path part_path;
        std::uintmax_t already_downloaded = 0;
        IncrementalHasher hasher;
        std::size_t attempts = 0;
    };

    /**
     * Downloads one artifact into `<destination>/<name>.part`, resuming from the bytes already
     * on disk, and renames it to `<name>` once its hash matches the manifest.
     *
     * Returns kCANCELLED when the cancellation signal was seen, leaving the part file in place.
     * A length mismatch or repeated hash mismatches abandon the artifact (SERIOUS error).
     * Transport, HTTP status and filesystem failures are thrown.
     */
    class MODFETCH_API ResumableTransfer
    {
    public:
        ResumableTransfer(const Context& ctx,
                          Session& session,
                          CancellationSignal cancel,
                          const fs::path& destination);

        tl::expected<TransferStatus, DownloaderError> transfer(const ManifestEntry& entry,
                                                               const std::string& url,
                                                               ProgressSink& sink);

        // Hash mismatches seen during the last call to `transfer`.
        std::size_t attempts() const noexcept
        {
            return m_attempts;
        }

    private:
        void prepare_attempt(const ManifestEntry& entry, TransferState& state) const;

        const Context& m_ctx;
        Session& m_session;
        CancellationSignal m_cancel;
        fs::path m_destination;
        std::size_t m_attempts = 0;
    };
}

#endif
