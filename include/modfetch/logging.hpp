#ifndef MODFETCH_LOGGING_HPP
#define MODFETCH_LOGGING_HPP

#include <filesystem>

#include <modfetch/export.hpp>

namespace modfetch
{
    namespace fs = std::filesystem;

    /**
     * Installs the default "modfetch" logger.
     *
     * The console shows info and above (debug with `verbose`). When `log_file` is set, a
     * rotating file (1 MiB, 5 backups) receives every record from debug up.
     */
    MODFETCH_API void setup_logging(const fs::path& log_file, bool verbose);
}

#endif
