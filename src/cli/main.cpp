#include <iostream>
#include <mutex>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <modfetch/modfetch.hpp>
#include <modfetch/cancellation.hpp>
#include <modfetch/context.hpp>
#include <modfetch/logging.hpp>
#include <modfetch/manifest.hpp>
#include <modfetch/orchestrator.hpp>
#include <modfetch/progress.hpp>
#include <modfetch/reconciler.hpp>
#include <modfetch/session.hpp>
#include <modfetch/utils.hpp>

using namespace modfetch;

static bool show_progress_bars = true;

class ConsoleProgressSink : public ProgressSink
{
public:
    void set_total_count(std::size_t count) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_total_count = count;
    }

    void set_already_satisfied(std::size_t count) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (count)
            std::cout << count << " mods already downloaded" << std::endl;
    }

    void set_current(const std::string& file_name,
                     std::uintmax_t total_size,
                     std::uintmax_t already_downloaded) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_current != file_name)
        {
            if (!m_current.empty() && show_progress_bars)
                std::cout << "\n";
            m_index++;
        }
        m_current = file_name;
        m_total_size = total_size;
        std::cout << fmt::format("[{}/{}] {}", m_index, m_total_count, file_name);
        if (already_downloaded)
            std::cout << fmt::format(" (resuming at {})", format_byte_size(already_downloaded));
        std::cout << std::endl;
    }

    void update_progress(std::uintmax_t bytes_downloaded, std::optional<double> rate) override
    {
        if (!show_progress_bars)
            return;

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_total_size == 0)
            return;

        const double done = static_cast<double>(bytes_downloaded) / m_total_size;
        const std::size_t bar_width = 40;
        const std::size_t pos = static_cast<std::size_t>(bar_width * done);

        std::cout << "\r[";
        for (std::size_t i = 0; i < bar_width; ++i)
        {
            if (i < pos)
                std::cout << "=";
            else if (i == pos)
                std::cout << ">";
            else
                std::cout << " ";
        }
        std::cout << fmt::format("] {:6.2f}% {}/{}",
                                 done * 100,
                                 format_byte_size(bytes_downloaded),
                                 format_byte_size(m_total_size));
        if (rate)
            std::cout << fmt::format(" {}/s", format_byte_size(rate.value()));
        std::cout << "   ";
        std::cout.flush();
    }

    void finished(const RunReport& report) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_current.empty() && show_progress_bars)
            std::cout << "\n";
        std::cout << fmt::format("Downloaded {} of {} mods", report.completed, report.queued);
        if (!report.abandoned.empty())
            std::cout << fmt::format(", {} failed", report.abandoned.size());
        std::cout << std::endl;
        for (const auto& name : report.abandoned)
            std::cout << "  failed: " << name << std::endl;
    }

private:
    std::mutex m_mutex;
    std::size_t m_total_count = 0;
    std::size_t m_index = 0;
    std::uintmax_t m_total_size = 0;
    std::string m_current;
};

struct RunOptions
{
    std::string manifest;
    std::string destination;
    std::string cookies = get_env("MODFETCH_COOKIES", "cookies.json");
    std::string log_file;
    std::string ca_info;
    bool verbose = false;
    bool disable_ssl = false;
};

void
apply_config(const std::string& config_file,
             CLI::App& app,
             Context& ctx,
             RunOptions& options)
{
    spdlog::info("Loading configuration {}", config_file);
    YAML::Node config = YAML::LoadFile(config_file);

    auto from_cli = [&app](const std::string& name)
    {
        for (auto* sub : app.get_subcommands())
        {
            const CLI::Option* opt = sub->get_option_no_throw(name);
            if (opt && opt->count())
                return true;
        }
        return false;
    };

    if (config["manifest"] && !from_cli("--manifest"))
        options.manifest = config["manifest"].as<std::string>();
    if (config["destination"] && !from_cli("--destination"))
        options.destination = config["destination"].as<std::string>();
    if (config["cookies"] && !from_cli("--cookies"))
        options.cookies = config["cookies"].as<std::string>();
    if (config["log_file"] && !from_cli("--log-file"))
        options.log_file = config["log_file"].as<std::string>();
    if (config["verbose"] && !from_cli("-v"))
        options.verbose = config["verbose"].as<bool>();
    if (config["disable_ssl"] && !from_cli("-k"))
        options.disable_ssl = config["disable_ssl"].as<bool>();

    if (config["api_url"])
        ctx.api_url = config["api_url"].as<std::string>();
    if (config["user_agent"])
        ctx.user_agent = config["user_agent"].as<std::string>();
    if (config["connect_timeout"])
        ctx.connect_timeout = config["connect_timeout"].as<long>();
    if (config["low_speed_time"])
        ctx.low_speed_time = config["low_speed_time"].as<long>();
    if (config["low_speed_limit"])
        ctx.low_speed_limit = config["low_speed_limit"].as<long>();
    if (config["chunk_size"])
        ctx.chunk_size = config["chunk_size"].as<std::size_t>();
    if (config["max_attempts"])
        ctx.max_attempts = config["max_attempts"].as<std::size_t>();
}

int
exit_code(const RunReport& report)
{
    switch (report.state)
    {
        case RunState::kCANCELLED:
            return 130;
        case RunState::kABORTED:
            return 2;
        default:
            return report.abandoned.empty() ? 0 : 1;
    }
}

int
handle_download(Context& ctx, const RunOptions& options)
{
    if (options.manifest.empty() || options.destination.empty())
    {
        spdlog::error("A manifest and a destination directory are required");
        return 2;
    }
    if (!cookies_file_present(options.cookies))
    {
        spdlog::error("Not logged in: no cookies file at {}", options.cookies);
        return 2;
    }

    Session session(ctx);
    session.load_cookies(options.cookies);

    CancellationSignal cancel;
    install_signal_handlers(cancel);

    ConsoleProgressSink sink;
    DownloadOrchestrator orchestrator(ctx, session, cancel, sink);
    RunReport report = orchestrator.run(options.manifest, options.destination);
    return exit_code(report);
}

int
handle_check(const RunOptions& options)
{
    if (options.manifest.empty() || options.destination.empty())
    {
        spdlog::error("A manifest and a destination directory are required");
        return 2;
    }

    ManifestReconciler reconciler(options.destination);
    ReconcileResult result = reconciler.reconcile(load_manifest(options.manifest));
    for (const auto& entry : result.queue)
    {
        std::cout << fmt::format("{} ({})", entry.file_name, format_byte_size(entry.total_size))
                  << std::endl;
    }
    std::cout << fmt::format("{} to download, {} already downloaded",
                             result.queue.size(),
                             result.already_satisfied)
              << std::endl;
    return 0;
}

int
main(int argc, char** argv)
{
    CLI::App app{ "Resumable, hash verified mod downloader" };
    app.set_version_flag("--version", MODFETCH_VERSION_STRING);
    app.require_subcommand(1);

    RunOptions options;
    std::string config_file;
    app.add_option("-c,--config", config_file, "YAML configuration file");

    CLI::App* s_dl = app.add_subcommand("download", "Download the mods of a manifest");
    CLI::App* s_check
        = app.add_subcommand("check", "Reconcile a manifest with the destination, no network");
    CLI::App* s_login = app.add_subcommand("login-status", "Tell whether a cookies file exists");

    for (auto* sub : { s_dl, s_check })
    {
        sub->add_option("-m,--manifest", options.manifest, "Manifest (JSON) to download");
        sub->add_option("-d,--destination", options.destination, "Destination directory");
        sub->add_option("--log-file", options.log_file, "Rotating log file");
        sub->add_flag("-v", options.verbose, "Enable verbose output");
    }
    s_dl->add_option("--cookies", options.cookies, "Cookies file written by the login flow");
    s_dl->add_flag("-k", options.disable_ssl, "Disable SSL verification");
    s_dl->add_option("--cacert", options.ca_info, "CA bundle used to verify the server");
    s_login->add_option("--cookies", options.cookies, "Cookies file written by the login flow");

    CLI11_PARSE(app, argc, argv);

    try
    {
        modfetch::Context ctx;

        if (!config_file.empty())
        {
            apply_config(config_file, app, ctx, options);
        }

        setup_logging(options.log_file, options.verbose);
        if (options.verbose)
        {
            show_progress_bars = false;
            ctx.set_verbosity(1);
        }
        ctx.disable_ssl = options.disable_ssl;
        if (!options.ca_info.empty())
            ctx.ssl_ca_info = options.ca_info;

        if (app.got_subcommand("download"))
        {
            return handle_download(ctx, options);
        }
        if (app.got_subcommand("check"))
        {
            return handle_check(options);
        }
        if (app.got_subcommand("login-status"))
        {
            bool logged_in = cookies_file_present(options.cookies);
            std::cout << (logged_in ? "logged in" : "not logged in") << std::endl;
            return logged_in ? 0 : 1;
        }
    }
    catch (const YAML::Exception& e)
    {
        spdlog::critical("Could not read configuration: {}", e.what());
        return 2;
    }
    catch (const std::exception& e)
    {
        spdlog::critical("{}", e.what());
        return 2;
    }

    return 0;
}
