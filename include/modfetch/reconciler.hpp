#ifndef MODFETCH_RECONCILER_HPP
#define MODFETCH_RECONCILER_HPP

#include <filesystem>
#include <vector>

#include <modfetch/export.hpp>
#include <modfetch/enums.hpp>
#include <modfetch/manifest.hpp>

namespace modfetch
{
    namespace fs = std::filesystem;

    struct ReconcileResult
    {
        // Entries that still need network work, in manifest order.
        std::vector<ManifestEntry> queue;
        std::size_t already_satisfied = 0;
    };

    /**
     * Compares manifest entries against the destination directory before any network activity.
     *
     * Classification has side effects on `.part` files: a stray part next to a final file is
     * removed, a full-size part whose hash matches is promoted to its final name, and a
     * full-size part with a wrong hash or an oversized part is deleted.
     */
    class MODFETCH_API ManifestReconciler
    {
    public:
        // Throws download_error if `destination` is not an existing directory.
        explicit ManifestReconciler(const fs::path& destination);

        EntryState classify(const ManifestEntry& entry) const;
        ReconcileResult reconcile(const std::vector<ManifestEntry>& entries) const;

        fs::path file_path(const ManifestEntry& entry) const;
        fs::path part_path(const ManifestEntry& entry) const;

        const fs::path& destination() const noexcept
        {
            return m_destination;
        }

    private:
        fs::path m_destination;
    };
}

#endif
