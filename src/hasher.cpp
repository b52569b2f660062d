#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

extern "C"
{
#include <xxhash.h>
}

#include <modfetch/hasher.hpp>
#include <modfetch/fileio.hpp>
#include <modfetch/utils.hpp>

namespace modfetch
{
    IncrementalHasher::IncrementalHasher()
        : m_state(XXH64_createState())
    {
        if (m_state == nullptr)
        {
            throw std::bad_alloc();
        }
        reset();
    }

    IncrementalHasher::~IncrementalHasher()
    {
        if (m_state)
        {
            XXH64_freeState(m_state);
        }
    }

    IncrementalHasher::IncrementalHasher(IncrementalHasher&& rhs) noexcept
        : m_state(std::exchange(rhs.m_state, nullptr))
        , m_bytes_hashed(std::exchange(rhs.m_bytes_hashed, 0))
    {
    }

    IncrementalHasher& IncrementalHasher::operator=(IncrementalHasher&& rhs) noexcept
    {
        using std::swap;
        swap(m_state, rhs.m_state);
        swap(m_bytes_hashed, rhs.m_bytes_hashed);
        return *this;
    }

    IncrementalHasher IncrementalHasher::from_file(const fs::path& path, std::size_t chunk_size)
    {
        IncrementalHasher hasher;
        std::error_code ec;
        if (!fs::is_regular_file(path, ec))
        {
            return hasher;
        }

        FileIO infile(path, FileIO::read_binary, ec);
        if (ec)
        {
            throw std::system_error(ec, "Could not open " + path.string() + " for hashing");
        }

        std::vector<char> buffer(std::max<std::size_t>(chunk_size, 1));
        std::size_t count;
        while ((count = infile.read(buffer.data(), 1, buffer.size())) > 0)
        {
            hasher.update(buffer.data(), count);
        }
        if (infile.error())
        {
            throw std::system_error(std::make_error_code(std::errc::io_error),
                                    "Could not read " + path.string());
        }
        spdlog::debug("Hashed {} existing bytes of {}", hasher.bytes_hashed(), path.string());
        return hasher;
    }

    void IncrementalHasher::update(const void* data, std::size_t size)
    {
        if (XXH64_update(m_state, data, size) == XXH_ERROR)
        {
            throw std::runtime_error("XXH64_update failed");
        }
        m_bytes_hashed += size;
    }

    void IncrementalHasher::update(std::string_view data)
    {
        update(data.data(), data.size());
    }

    void IncrementalHasher::reset()
    {
        if (XXH64_reset(m_state, 0) == XXH_ERROR)
        {
            throw std::runtime_error("XXH64_reset failed");
        }
        m_bytes_hashed = 0;
    }

    std::uint64_t IncrementalHasher::value() const
    {
        return XXH64_digest(m_state);
    }

    IncrementalHasher::digest_type IncrementalHasher::digest() const
    {
        XXH64_canonical_t canonical;
        XXH64_canonicalFromHash(&canonical, value());

        digest_type result;
        std::copy(std::begin(canonical.digest), std::end(canonical.digest), result.begin());
        return result;
    }

    std::string reference_hash(const IncrementalHasher::digest_type& digest)
    {
        IncrementalHasher::digest_type little_endian;
        std::reverse_copy(digest.begin(), digest.end(), little_endian.begin());
        return base64_encode(little_endian.data(), little_endian.size());
    }

    bool verify_digest(const IncrementalHasher::digest_type& digest, const std::string& hash_code)
    {
        return reference_hash(digest) == hash_code;
    }

    bool compare_hash(const IncrementalHasher& hasher, const std::string& hash_code)
    {
        return verify_digest(hasher.digest(), hash_code);
    }

    bool compare_hash_from_path(const fs::path& path, const std::string& hash_code)
    {
        return compare_hash(IncrementalHasher::from_file(path), hash_code);
    }
}
