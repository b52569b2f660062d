#include <fstream>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <modfetch/manifest.hpp>
#include <modfetch/utils.hpp>

namespace modfetch
{
    namespace
    {
        constexpr const char* kFileName = "FileName";
        constexpr const char* kSize = "Size";
        constexpr const char* kHash = "Hash";
        constexpr const char* kGameID = "GameID";
        constexpr const char* kFileID = "FileID";

        const nlohmann::json& require(const nlohmann::json& j, const char* field)
        {
            auto it = j.find(field);
            if (it == j.end())
            {
                throw manifest_error(fmt::format("missing field '{}'", field));
            }
            return *it;
        }

        std::int64_t require_integer(const nlohmann::json& j, const char* field)
        {
            const auto& value = require(j, field);
            if (!value.is_number_integer())
            {
                throw manifest_error(fmt::format("field '{}' must be an integer", field));
            }
            return value.get<std::int64_t>();
        }

        std::string require_string(const nlohmann::json& j, const char* field)
        {
            const auto& value = require(j, field);
            if (!value.is_string())
            {
                throw manifest_error(fmt::format("field '{}' must be a string", field));
            }
            return value.get<std::string>();
        }
    }

    void to_json(nlohmann::json& j, const ManifestEntry& entry)
    {
        j = nlohmann::json{ { kFileName, entry.file_name },
                            { kSize, entry.total_size },
                            { kHash, entry.content_hash },
                            { kGameID, entry.game_id },
                            { kFileID, entry.file_id } };
    }

    void from_json(const nlohmann::json& j, ManifestEntry& entry)
    {
        if (!j.is_object())
        {
            throw manifest_error("entry is not an object");
        }
        entry.file_name = require_string(j, kFileName);
        const auto size = require_integer(j, kSize);
        if (size <= 0)
        {
            throw manifest_error(fmt::format("field '{}' must be positive, got {}", kSize, size));
        }
        entry.total_size = static_cast<std::uintmax_t>(size);
        entry.content_hash = require_string(j, kHash);
        entry.game_id = require_integer(j, kGameID);
        entry.file_id = require_integer(j, kFileID);
    }

    tl::expected<void, DownloaderError> validate(const ManifestEntry& entry)
    {
        if (!is_plain_file_name(entry.file_name))
        {
            return tl::unexpected(DownloaderError{
                ErrorLevel::FATAL,
                ErrorCode::MF_BADMANIFEST,
                fmt::format("Invalid file name '{}'", entry.file_name) });
        }
        if (entry.total_size == 0)
        {
            return tl::unexpected(
                DownloaderError{ ErrorLevel::FATAL,
                                 ErrorCode::MF_BADMANIFEST,
                                 fmt::format("Size of {} must be positive", entry.file_name) });
        }
        if (entry.content_hash.empty())
        {
            return tl::unexpected(
                DownloaderError{ ErrorLevel::FATAL,
                                 ErrorCode::MF_BADMANIFEST,
                                 fmt::format("Hash of {} must not be empty", entry.file_name) });
        }
        return {};
    }

    std::vector<ManifestEntry> parse_manifest(const nlohmann::json& document)
    {
        if (!document.is_array())
        {
            throw manifest_error("manifest must be a JSON array of entries");
        }

        std::vector<ManifestEntry> entries;
        entries.reserve(document.size());
        for (std::size_t i = 0; i < document.size(); ++i)
        {
            ManifestEntry entry;
            try
            {
                from_json(document[i], entry);
            }
            catch (const manifest_error& e)
            {
                throw manifest_error(fmt::format("manifest entry #{}: {}", i, e.what()));
            }

            auto valid = validate(entry);
            if (!valid)
            {
                throw manifest_error(
                    fmt::format("manifest entry #{}: {}", i, valid.error().reason));
            }
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    std::vector<ManifestEntry> load_manifest(const fs::path& path)
    {
        spdlog::debug("Loading manifest {}", path.string());
        std::ifstream infile(path);
        if (!infile)
        {
            throw manifest_error(fmt::format("Could not open manifest {}", path.string()));
        }

        nlohmann::json document;
        try
        {
            infile >> document;
        }
        catch (const nlohmann::json::parse_error& e)
        {
            throw manifest_error(
                fmt::format("Could not parse manifest {}: {}", path.string(), e.what()));
        }

        auto entries = parse_manifest(document);
        spdlog::debug("Manifest {} lists {} artifacts", path.string(), entries.size());
        return entries;
    }

    void save_manifest(const fs::path& path, const std::vector<ManifestEntry>& entries)
    {
        std::ofstream outfile(path, std::ios::trunc);
        if (!outfile)
        {
            throw manifest_error(fmt::format("Could not write manifest {}", path.string()));
        }
        outfile << nlohmann::json(entries).dump(4);
        if (!outfile)
        {
            throw manifest_error(fmt::format("Could not write manifest {}", path.string()));
        }
    }
}
