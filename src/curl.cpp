#include <atomic>
#include <utility>
#include <spdlog/spdlog.h>

#include <modfetch/curl.hpp>
#include <modfetch/utils.hpp>
#include <modfetch/context.hpp>

#include "curl_internal.hpp"

namespace modfetch
{
    /**************
     * curl_error *
     **************/

    curl_error::curl_error(const std::string& what)
        : std::runtime_error(what)
    {
    }


    /**************
     * CURLHandle *
     **************/

    CURLHandle::CURLHandle(const Context& ctx)
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        init_handle(ctx);
        // Set error buffer
        m_errorbuffer[0] = '\0';
        setopt(CURLOPT_ERRORBUFFER, m_errorbuffer);
    }

    void CURLHandle::init_handle(const Context& ctx)
    {
        setopt(CURLOPT_FOLLOWLOCATION, 1L);
        setopt(CURLOPT_MAXREDIRS, 6L);
        setopt(CURLOPT_CONNECTTIMEOUT, ctx.connect_timeout);
        setopt(CURLOPT_LOW_SPEED_TIME, ctx.low_speed_time);
        setopt(CURLOPT_LOW_SPEED_LIMIT, ctx.low_speed_limit);
        setopt(CURLOPT_BUFFERSIZE, ctx.transfer_buffersize);
        // worker threads must not receive SIGALRM from the resolver
        setopt(CURLOPT_NOSIGNAL, 1L);
        // the proxy's CONNECT reply must not reach the header callbacks
        setopt(CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);

        if (ctx.disable_ssl)
        {
            spdlog::warn("SSL verification is disabled");
            setopt(CURLOPT_SSL_VERIFYHOST, 0L);
            setopt(CURLOPT_SSL_VERIFYPEER, 0L);

            // also disable proxy SSL verification
            setopt(CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
            setopt(CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
        }
        else
        {
            setopt(CURLOPT_SSL_VERIFYHOST, 2L);
            setopt(CURLOPT_SSL_VERIFYPEER, 1L);

            if (!ctx.ssl_ca_info.empty())
            {
                setopt(CURLOPT_CAINFO, ctx.ssl_ca_info.string());
            }
        }

        if (!ctx.proxy.empty())
        {
            setopt(CURLOPT_PROXY, ctx.proxy);
        }

        if (ctx.verbosity > 1)
            setopt(CURLOPT_VERBOSE, 1L);
    }

    CURLHandle::CURLHandle(const Context& ctx, const std::string& url)
        : CURLHandle(ctx)
    {
        this->url(url);
    }

    CURLHandle::~CURLHandle()
    {
        if (m_handle)
        {
            curl_easy_cleanup(m_handle);
        }
        if (p_headers)
        {
            curl_slist_free_all(p_headers);
        }
    }

    CURLHandle& CURLHandle::url(const std::string& url)
    {
        setopt(CURLOPT_URL, url.c_str());
        return *this;
    }

    CURLHandle& CURLHandle::user_agent(const std::string& user_agent)
    {
        add_header(fmt::format("User-Agent: {} {}", user_agent, curl_version()));
        return *this;
    }

    CURLHandle& CURLHandle::post_fields(const std::map<std::string, std::string>& fields)
    {
        m_post_body.clear();
        for (const auto& [key, value] : fields)
        {
            char* escaped_key = curl_easy_escape(m_handle, key.c_str(), static_cast<int>(key.size()));
            char* escaped_value
                = curl_easy_escape(m_handle, value.c_str(), static_cast<int>(value.size()));
            if (!escaped_key || !escaped_value)
            {
                curl_free(escaped_key);
                curl_free(escaped_value);
                throw curl_error("Could not url-encode form field " + key);
            }
            if (!m_post_body.empty())
                m_post_body += '&';
            m_post_body += fmt::format("{}={}", escaped_key, escaped_value);
            curl_free(escaped_key);
            curl_free(escaped_value);
        }
        setopt(CURLOPT_POST, 1L);
        setopt(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(m_post_body.size()));
        setopt(CURLOPT_POSTFIELDS, m_post_body.c_str());
        return *this;
    }

    Response CURLHandle::perform()
    {
        set_default_callbacks();
        CURLcode curl_result = curl_easy_perform(handle());
        if (curl_result != CURLE_OK)
        {
            throw curl_error(fmt::format("{} [{}]", curl_easy_strerror(curl_result), m_errorbuffer));
        }
        finalize_transfer(*response);
        Response result = std::move(*response);
        response.reset();
        return result;
    }

    void CURLHandle::finalize_transfer(Response& lresponse)
    {
        lresponse.fill_values(*this);
        if (!lresponse.ok())
        {
            spdlog::error("Received {}: {}", lresponse.http_status, lresponse.content.value_or(""));
        }
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        T val;
        CURLcode result = curl_easy_getinfo(m_handle, option, &val);
        if (result != CURLE_OK)
            return tl::unexpected(result);
        return val;
    }

    template tl::expected<long, CURLcode> CURLHandle::getinfo(CURLINFO option);
    template tl::expected<char*, CURLcode> CURLHandle::getinfo(CURLINFO option);

    template <>
    tl::expected<std::string, CURLcode> CURLHandle::getinfo(CURLINFO option)
    {
        auto res = getinfo<char*>(option);
        if (!res)
            return tl::unexpected(res.error());
        if (res.value() == nullptr)
            return std::string();
        return std::string(res.value());
    }

    CURL* CURLHandle::handle()
    {
        if (p_headers)
            setopt(CURLOPT_HTTPHEADER, p_headers);
        return m_handle;
    }

    const char* CURLHandle::errorbuffer() const
    {
        return m_errorbuffer;
    }

    CURLHandle& CURLHandle::add_header(const std::string& header)
    {
        p_headers = curl_slist_append(p_headers, header.c_str());
        if (!p_headers)
        {
            throw std::bad_alloc();
        }
        return *this;
    }

    CURLHandle& CURLHandle::add_headers(const std::vector<std::string>& headers)
    {
        for (auto& h : headers)
        {
            add_header(h);
        }
        return *this;
    }

    namespace
    {
        template <class T>
        std::size_t string_callback(char* buffer, std::size_t size, std::size_t nitems, T* string)
        {
            string->append(buffer, size * nitems);
            return size * nitems;
        }

        template <class T>
        std::size_t header_map_callback(char* buffer,
                                        std::size_t size,
                                        std::size_t nitems,
                                        T* header_map)
        {
            auto kv = parse_header(std::string_view(buffer, size * nitems));
            if (!kv.first.empty())
            {
                (*header_map)[kv.first] = kv.second;
            }
            return size * nitems;
        }
    }

    void CURLHandle::set_default_callbacks()
    {
        response.reset(new Response);
        setopt(CURLOPT_HEADERFUNCTION, header_map_callback<std::map<std::string, std::string>>);
        setopt(CURLOPT_HEADERDATA, &response->headers);

        setopt(CURLOPT_WRITEFUNCTION, string_callback<std::string>);
        response->content = std::string();
        setopt(CURLOPT_WRITEDATA, &response->content.value());
    }

    /************
     * Response *
     ************/

    bool Response::ok() const
    {
        return http_status / 100 == 2;
    }

    tl::expected<std::string, std::out_of_range> Response::get_header(
        const std::string& header) const
    {
        auto it = headers.find(to_lower(header));
        if (it != headers.end())
            return it->second;
        else
            return tl::unexpected(
                std::out_of_range(std::string("Could not find header ") + header));
    }

    nlohmann::json Response::json() const
    {
        try
        {
            return nlohmann::json::parse(content.value_or(""));
        }
        catch (const nlohmann::json::parse_error& e)
        {
            spdlog::error("Could not parse JSON\n{}", content.value_or(""));
            spdlog::error("Error message: {}", e.what());
            throw;
        }
    }

    void Response::fill_values(CURLHandle& handle)
    {
        http_status = handle.getinfo<long>(CURLINFO_RESPONSE_CODE).value_or(0);
        effective_url = handle.getinfo<std::string>(CURLINFO_EFFECTIVE_URL).value_or("");
    }

    namespace details
    {
        static std::atomic<bool> is_curl_setup_alive{ false };

        CURLSetup::CURLSetup()
        {
            {
                bool expected = false;
                if (!is_curl_setup_alive.compare_exchange_strong(expected, true))
                    throw std::runtime_error(
                        "modfetch::CURLSetup created more than once - instance must be unique");
            }

            if (curl_global_init(CURL_GLOBAL_ALL) != 0)
            {
                is_curl_setup_alive = false;
                throw curl_error("failed to initialize curl");
            }
        }

        CURLSetup::~CURLSetup()
        {
            curl_global_cleanup();
            is_curl_setup_alive = false;
        }
    }
}
