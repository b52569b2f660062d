#ifndef MODFETCH_SESSION_HPP
#define MODFETCH_SESSION_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <modfetch/export.hpp>
#include <modfetch/context.hpp>
#include <modfetch/curl.hpp>
#include <modfetch/enums.hpp>

namespace modfetch
{
    namespace fs = std::filesystem;

    class CURLHandle;

    // Receiver of a streamed GET. Returning false from either callback aborts the request.
    class StreamHandler
    {
    public:
        virtual ~StreamHandler() = default;

        // Called once, with the status and headers of the final response (after redirects).
        virtual bool on_response(const Response& response) = 0;
        virtual bool on_data(const char* buffer, std::size_t size) = 0;
    };

    /**
     * Assembles the header lines of a streamed GET into the final `Response`.
     *
     * Interim (1xx) responses, redirect hops and a proxy's "Connection established" reply
     * are skipped; the handler sees the last response only.
     */
    class MODFETCH_API ResponseHeaderReader
    {
    public:
        explicit ResponseHeaderReader(StreamHandler& handler);

        // Returns false when the handler refused the response.
        bool feed(std::string_view line);
        bool done() const noexcept;

        Response& response() noexcept;

    private:
        StreamHandler& m_handler;
        Response m_response;
        HeaderCbState m_state = HeaderCbState::kDEFAULT;
        bool m_proxy_connect = false;
    };

    // Status code of "HTTP/1.1 206 Partial Content" or "HTTP/2 200", 0 when there is none.
    MODFETCH_API long parse_status_line(std::string_view line);

    /**
     * Authenticated HTTP session shared by URL resolution and transfers.
     *
     * The cookie jar is sent with every request. Each request uses its own curl handle, so
     * a resolution and a transfer may run at the same time.
     */
    class MODFETCH_API Session
    {
    public:
        using cookie_jar = std::map<std::string, std::string>;

        explicit Session(const Context& ctx);
        virtual ~Session();

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;
        Session(Session&&) = delete;
        Session& operator=(Session&&) = delete;

        // Reads a JSON object of {name: value} as written by the login flow.
        void load_cookies(const fs::path& path);
        void set_cookie(const std::string& name, const std::string& value);
        cookie_jar cookies() const;
        bool is_authenticated() const;
        std::string cookie_header() const;

        virtual Response post_form(const std::string& url,
                                   const std::map<std::string, std::string>& fields);
        virtual Response head(const std::string& url);

        // GET `url` starting at byte `offset` (no Range header when 0), feeding the body to
        // `handler`. Transport failures throw curl_error; an abort requested by the handler
        // returns normally.
        virtual Response stream(const std::string& url,
                                std::uintmax_t offset,
                                StreamHandler& handler);

    protected:
        void prepare_handle(CURLHandle& handle) const;

    private:
        const Context& m_ctx;
        mutable std::mutex m_mutex;
        cookie_jar m_cookies;
    };

    // The front end's "is logged in" check: the login flow leaves a cookie file behind.
    MODFETCH_API bool cookies_file_present(const fs::path& path);
}

#endif
