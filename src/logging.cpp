#include <fstream>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <modfetch/logging.hpp>

namespace modfetch
{
    void setup_logging(const fs::path& log_file, bool verbose)
    {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);

        if (!log_file.empty())
        {
            {
                // Separates runs in the log file
                std::ofstream separator(log_file, std::ios::app);
                separator << "\n\n";
            }
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file.string(), 1024 * 1024, 5);
            file_sink->set_pattern("%Y-%m-%d %H:%M:%S - %n - %l - %v");
            file_sink->set_level(spdlog::level::debug);
            sinks.push_back(file_sink);
        }

        // Sinks filter; the logger itself lets debug through to the file
        auto logger = std::make_shared<spdlog::logger>("modfetch", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::debug);
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
    }
}
