#ifndef MODFETCH_MANIFEST_HPP
#define MODFETCH_MANIFEST_HPP

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <modfetch/export.hpp>
#include <modfetch/errors.hpp>

namespace modfetch
{
    namespace fs = std::filesystem;

    // One artifact of a download set. Field names of the JSON form are fixed:
    // FileName, Size, Hash, GameID, FileID.
    struct ManifestEntry
    {
        std::string file_name;
        std::uintmax_t total_size = 0;
        std::string content_hash;
        std::int64_t game_id = 0;
        std::int64_t file_id = 0;
    };

    inline bool operator==(const ManifestEntry& lhs, const ManifestEntry& rhs)
    {
        return lhs.file_name == rhs.file_name && lhs.total_size == rhs.total_size
               && lhs.content_hash == rhs.content_hash && lhs.game_id == rhs.game_id
               && lhs.file_id == rhs.file_id;
    }

    inline bool operator!=(const ManifestEntry& lhs, const ManifestEntry& rhs)
    {
        return !(lhs == rhs);
    }

    class MODFETCH_API manifest_error : public std::runtime_error
    {
    public:
        explicit manifest_error(const std::string& what)
            : std::runtime_error(what)
        {
        }
    };

    MODFETCH_API void to_json(nlohmann::json& j, const ManifestEntry& entry);
    MODFETCH_API void from_json(const nlohmann::json& j, ManifestEntry& entry);

    MODFETCH_API tl::expected<void, DownloaderError> validate(const ManifestEntry& entry);

    // Reads a JSON array of entries. Throws manifest_error if the file cannot be read or any
    // entry is missing a field, has a wrongly typed field or fails `validate`.
    MODFETCH_API std::vector<ManifestEntry> load_manifest(const fs::path& path);
    MODFETCH_API std::vector<ManifestEntry> parse_manifest(const nlohmann::json& document);
    MODFETCH_API void save_manifest(const fs::path& path, const std::vector<ManifestEntry>& entries);
}

#endif
