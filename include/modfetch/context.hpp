#ifndef MODFETCH_CONTEXT_HPP
#define MODFETCH_CONTEXT_HPP

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include <modfetch/export.hpp>
#include <modfetch/curl.hpp>

namespace modfetch
{
    namespace fs = std::filesystem;

    class MODFETCH_API Context
    {
    public:
        int verbosity = 0;

        // ssl options
        bool disable_ssl = false;
        fs::path ssl_ca_info;

        long connect_timeout = 30L;
        // A transfer slower than low_speed_limit bytes/s for low_speed_time seconds is aborted
        // by curl. 0 disables the check.
        long low_speed_time = 0L;
        long low_speed_limit = 0L;

        long transfer_buffersize = 256 * 1024;

        // Size of the pieces written to part files; one progress update per piece.
        std::size_t chunk_size = 256 * 1024;
        // Hash mismatches tolerated for one artifact before it is abandoned.
        std::size_t max_attempts = 2;

        std::string api_url
            = "https://www.nexusmods.com/Core/Libs/Common/Managers/Downloads?GenerateDownloadUrl";
        std::string user_agent = "modfetch";
        std::string proxy;

        std::vector<std::string> additional_httpheaders;

        void set_verbosity(int v);
        void set_log_level(spdlog::level::level_enum);

        // Throws if another instance already exists: there can only be one at any time!
        Context();
        ~Context();

        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl;  // Private implementation details
    };

}

#endif
