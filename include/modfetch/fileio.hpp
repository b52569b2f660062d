#ifndef MODFETCH_FILEIO_HPP
#define MODFETCH_FILEIO_HPP

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

#ifdef _WIN32
#include <windows.h>
#endif


namespace modfetch
{
    namespace fs = std::filesystem;

    // Thin RAII wrapper over a C stream, used for part files and hashing reads.
    class FileIO
    {
    private:
        FILE* m_fs = nullptr;

    public:
#ifdef _WIN32
        constexpr static wchar_t append_update_binary[] = L"ab+";
        constexpr static wchar_t read_binary[] = L"rb";
#else
        constexpr static char append_update_binary[] = "ab+";
        constexpr static char read_binary[] = "rb";
#endif

        FileIO() = default;

        FileIO(const FileIO&) = delete;
        FileIO& operator=(const FileIO&) = delete;

#ifdef _WIN32
        inline explicit FileIO(const fs::path& file_path,
                               const wchar_t* mode,
                               std::error_code& ec) noexcept
        {
            m_fs = ::_wfsopen(file_path.wstring().c_str(), mode, _SH_DENYNO);
            if (!m_fs)
            {
                ec.assign(GetLastError(), std::generic_category());
                spdlog::error("Could not open file {}: {}", file_path.string(), ec.message());
            }
        }
#else
        inline explicit FileIO(const fs::path& file_path,
                               const char* mode,
                               std::error_code& ec) noexcept
        {
            m_fs = ::fopen(file_path.c_str(), mode);
            if (m_fs)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
                spdlog::error("Could not open file {}: {}", file_path.string(), ec.message());
            }
        }
#endif

        inline ~FileIO()
        {
            if (m_fs)
            {
                std::error_code ec;
                close(ec);
                if (ec)
                {
                    spdlog::error("Error: {}", ec.message());
                }
            }
        }

        inline bool open() const noexcept
        {
            return m_fs != nullptr;
        }

        inline std::size_t read(void* buffer,
                                std::size_t element_size,
                                std::size_t element_count) const noexcept
        {
            return ::fread(buffer, element_size, element_count, m_fs);
        }

        inline std::size_t write(const void* buffer,
                                 std::size_t element_size,
                                 std::size_t element_count) const noexcept
        {
            return ::fwrite(buffer, element_size, element_count, m_fs);
        }

        inline bool flush()
        {
            return ::fflush(m_fs) == 0;
        }

        void close(std::error_code& ec) noexcept
        {
            if (!m_fs)
            {
                ec.clear();
                return;
            }
            if (::fclose(m_fs) == 0)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
            }
            m_fs = nullptr;
        }

        inline int error() const
        {
            return ::ferror(m_fs);
        }
    };
}

#endif
