#include <cctype>
#include <fstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <modfetch/enums.hpp>
#include <modfetch/session.hpp>
#include <modfetch/utils.hpp>

#include "curl_internal.hpp"

namespace modfetch
{
    long parse_status_line(std::string_view line)
    {
        const auto first_space = line.find(' ');
        if (first_space == std::string_view::npos)
            return 0;
        long code = 0;
        for (std::size_t i = first_space + 1;
             i < line.size() && std::isdigit(static_cast<unsigned char>(line[i]));
             ++i)
        {
            code = code * 10 + (line[i] - '0');
        }
        return code;
    }

    /************************
     * ResponseHeaderReader *
     ************************/

    ResponseHeaderReader::ResponseHeaderReader(StreamHandler& handler)
        : m_handler(handler)
    {
    }

    bool ResponseHeaderReader::feed(std::string_view line)
    {
        if (m_state == HeaderCbState::kDONE)
        {
            // Trailers, nothing to do
            return true;
        }

        if (starts_with(line, "HTTP/"))
        {
            // Every hop of a redirect chain starts a fresh set of headers
            m_response.headers.clear();
            m_response.http_status = parse_status_line(line);
            m_proxy_connect = contains(to_lower(line), "connection established");
            m_state = m_response.ok() ? HeaderCbState::kHTTP_STATE_OK
                                      : HeaderCbState::kHTTP_STATE_FAILED;
            spdlog::debug("Header state {}: {}",
                          m_response.ok() ? "OK" : "not OK",
                          std::string(line.substr(0, line.find('\r'))));
            return true;
        }

        if (line == "\r\n" || line == "\n")
        {
            const long status = m_response.http_status;
            if (m_proxy_connect)
            {
                // Tunnel is up, the origin's response follows
                m_proxy_connect = false;
                return true;
            }
            if (status / 100 == 1)
            {
                // Interim response, the real one follows
                return true;
            }
            if (status / 100 == 3 && m_response.headers.count("location"))
            {
                // curl follows the redirect
                return true;
            }

            m_state = HeaderCbState::kDONE;
            return m_handler.on_response(m_response);
        }

        auto kv = parse_header(line);
        if (!kv.first.empty())
        {
            m_response.headers[kv.first] = kv.second;
        }
        return true;
    }

    bool ResponseHeaderReader::done() const noexcept
    {
        return m_state == HeaderCbState::kDONE;
    }

    Response& ResponseHeaderReader::response() noexcept
    {
        return m_response;
    }

    namespace
    {
        struct StreamState
        {
            StreamState(StreamHandler& h)
                : handler(h)
                , reader(h)
            {
            }

            StreamHandler& handler;
            ResponseHeaderReader reader;
            bool aborted_by_handler = false;
        };

        std::size_t stream_header_callback(char* buffer,
                                           std::size_t size,
                                           std::size_t nitems,
                                           StreamState* self)
        {
            const std::size_t ret = size * nitems;
            if (!self->reader.feed(std::string_view(buffer, ret)))
            {
                self->aborted_by_handler = true;
                return 0;
            }
            return ret;
        }

        std::size_t stream_write_callback(char* buffer,
                                          std::size_t size,
                                          std::size_t nitems,
                                          StreamState* self)
        {
            const std::size_t all = size * nitems;
            if (!self->reader.done())
            {
                // Body of an intermediate response
                return all;
            }

            if (!self->handler.on_data(buffer, all))
            {
                self->aborted_by_handler = true;
                return 0;
            }
            return all;
        }
    }

    Session::Session(const Context& ctx)
        : m_ctx(ctx)
    {
    }

    Session::~Session() = default;

    void Session::load_cookies(const fs::path& path)
    {
        std::ifstream infile(path);
        if (!infile)
        {
            throw download_error(fmt::format("Could not open cookies file {}", path.string()));
        }

        nlohmann::json document;
        try
        {
            infile >> document;
        }
        catch (const nlohmann::json::parse_error& e)
        {
            throw download_error(
                fmt::format("Could not parse cookies file {}: {}", path.string(), e.what()));
        }

        if (!document.is_object())
        {
            throw download_error(
                fmt::format("Cookies file {} must hold a JSON object", path.string()));
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [name, value] : document.items())
        {
            m_cookies[name] = value.is_string() ? value.get<std::string>() : value.dump();
        }
        spdlog::debug("Loaded {} cookies from {}", m_cookies.size(), path.string());
    }

    void Session::set_cookie(const std::string& name, const std::string& value)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cookies[name] = value;
    }

    Session::cookie_jar Session::cookies() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_cookies;
    }

    bool Session::is_authenticated() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return !m_cookies.empty();
    }

    std::string Session::cookie_header() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::string result;
        for (const auto& [name, value] : m_cookies)
        {
            if (!result.empty())
                result += "; ";
            result += name + "=" + value;
        }
        return result;
    }

    void Session::prepare_handle(CURLHandle& handle) const
    {
        const std::string cookies = cookie_header();
        if (!cookies.empty())
        {
            handle.setopt(CURLOPT_COOKIE, cookies);
        }
        handle.user_agent(m_ctx.user_agent);
        handle.add_headers(m_ctx.additional_httpheaders);
    }

    Response Session::post_form(const std::string& url,
                                const std::map<std::string, std::string>& fields)
    {
        CURLHandle h(m_ctx, url);
        prepare_handle(h);
        h.post_fields(fields);
        return h.perform();
    }

    Response Session::head(const std::string& url)
    {
        CURLHandle h(m_ctx, url);
        prepare_handle(h);
        h.setopt(CURLOPT_NOBODY, 1L);
        return h.perform();
    }

    Response Session::stream(const std::string& url, std::uintmax_t offset, StreamHandler& handler)
    {
        CURLHandle h(m_ctx, url);
        prepare_handle(h);

        if (offset > 0)
        {
            spdlog::debug("Requesting {} from offset {}", url, offset);
            h.setopt(CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset));
        }

        StreamState state(handler);

        h.setopt(CURLOPT_HEADERFUNCTION, &stream_header_callback);
        h.setopt(CURLOPT_HEADERDATA, &state);
        h.setopt(CURLOPT_WRITEFUNCTION, &stream_write_callback);
        h.setopt(CURLOPT_WRITEDATA, &state);

        const CURLcode result = curl_easy_perform(h.handle());
        Response& response = state.reader.response();
        response.effective_url = h.getinfo<std::string>(CURLINFO_EFFECTIVE_URL).value_or(url);

        if (state.aborted_by_handler)
        {
            return response;
        }

        if (result != CURLE_OK)
        {
            throw curl_error(fmt::format("CURL error ({}): {} for {} [{}]",
                                         static_cast<int>(result),
                                         curl_easy_strerror(result),
                                         url,
                                         h.errorbuffer()));
        }

        if (!state.reader.done())
        {
            throw curl_error(fmt::format("No HTTP response headers received for {}", url));
        }
        return response;
    }

    bool cookies_file_present(const fs::path& path)
    {
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    }
}
