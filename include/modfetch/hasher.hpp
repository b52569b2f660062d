#ifndef MODFETCH_HASHER_HPP
#define MODFETCH_HASHER_HPP

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <modfetch/export.hpp>

struct XXH64_state_s;

namespace modfetch
{
    namespace fs = std::filesystem;

    /**
     * Streaming XXH64 digest.
     *
     * `digest()` returns the canonical (big-endian) byte order. Manifests store the base64 of
     * the little-endian bytes of the same value, see `reference_hash()`.
     */
    class MODFETCH_API IncrementalHasher
    {
    public:
        using digest_type = std::array<unsigned char, 8>;

        IncrementalHasher();
        ~IncrementalHasher();

        IncrementalHasher(const IncrementalHasher&) = delete;
        IncrementalHasher& operator=(const IncrementalHasher&) = delete;
        IncrementalHasher(IncrementalHasher&& rhs) noexcept;
        IncrementalHasher& operator=(IncrementalHasher&& rhs) noexcept;

        // Hasher primed with the whole content of `path`, or an empty hasher if the file does
        // not exist. Throws std::system_error if the file exists but cannot be read.
        static IncrementalHasher from_file(const fs::path& path, std::size_t chunk_size = 256 * 1024);

        void update(const void* data, std::size_t size);
        void update(std::string_view data);
        void reset();

        std::uint64_t value() const;
        digest_type digest() const;

        std::uintmax_t bytes_hashed() const noexcept
        {
            return m_bytes_hashed;
        }

    private:
        XXH64_state_s* m_state = nullptr;
        std::uintmax_t m_bytes_hashed = 0;
    };

    // base64 of the byte-reversed digest, i.e. the form found in the `Hash` manifest field.
    MODFETCH_API std::string reference_hash(const IncrementalHasher::digest_type& digest);

    MODFETCH_API bool verify_digest(const IncrementalHasher::digest_type& digest,
                                    const std::string& hash_code);
    MODFETCH_API bool compare_hash(const IncrementalHasher& hasher, const std::string& hash_code);
    MODFETCH_API bool compare_hash_from_path(const fs::path& path, const std::string& hash_code);
}

#endif
