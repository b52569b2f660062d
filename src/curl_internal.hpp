#ifndef MODFETCH_SRC_CURL_INTERNAL_HPP
#define MODFETCH_SRC_CURL_INTERNAL_HPP

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/core.h>

#include <modfetch/export.hpp>
#include <modfetch/utils.hpp>
#include <modfetch/enums.hpp>
#include <modfetch/curl.hpp>

namespace modfetch
{
    class Context;

    class MODFETCH_API curl_error : public std::runtime_error
    {
    public:
        curl_error(const std::string& what = "download error");
    };

    class MODFETCH_API CURLHandle
    {
    public:
        explicit CURLHandle(const Context& ctx);
        CURLHandle(const Context& ctx, const std::string& url);
        ~CURLHandle();

        CURLHandle& url(const std::string& url);
        CURLHandle& user_agent(const std::string& user_agent);

        // Encodes `fields` as application/x-www-form-urlencoded and turns the request into a POST.
        CURLHandle& post_fields(const std::map<std::string, std::string>& fields);

        Response perform();
        void finalize_transfer(Response& response);

        template <class T>
        tl::expected<T, CURLcode> getinfo(CURLINFO option);

        CURL* handle();
        const char* errorbuffer() const;

        CURLHandle& add_header(const std::string& header);
        CURLHandle& add_headers(const std::vector<std::string>& headers);

        template <class T>
        CURLHandle& setopt(CURLoption opt, const T& val);

        void set_default_callbacks();

        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;

    private:
        void init_handle(const Context& ctx);

        CURL* m_handle;
        curl_slist* p_headers = nullptr;
        char m_errorbuffer[CURL_ERROR_SIZE];

        // curl keeps a pointer to the POST body, it must outlive the transfer
        std::string m_post_body;
        std::unique_ptr<Response> response;
    };

    template <class T>
    CURLHandle& CURLHandle::setopt(CURLoption opt, const T& val)
    {
        CURLcode ok;
        if constexpr (std::is_same<T, std::string>())
        {
            ok = curl_easy_setopt(m_handle, opt, val.c_str());
        }
        else if constexpr (std::is_same<T, bool>())
        {
            ok = curl_easy_setopt(m_handle, opt, val ? 1L : 0L);
        }
        else
        {
            ok = curl_easy_setopt(m_handle, opt, val);
        }
        if (ok != CURLE_OK)
        {
            throw curl_error(
                fmt::format("curl: curl_easy_setopt failed {}", curl_easy_strerror(ok)));
        }
        return *this;
    }
}

namespace modfetch::details
{
    // Scoped initialization and termination of CURL.
    // This should never have more than one instance live at any time,
    // this object's constructor will throw an `std::runtime_error` if it's the case.
    class CURLSetup final
    {
    public:
        CURLSetup();
        ~CURLSetup();

        CURLSetup(CURLSetup&&) = delete;
        CURLSetup& operator=(CURLSetup&&) = delete;

        CURLSetup(const CURLSetup&) = delete;
        CURLSetup& operator=(const CURLSetup&) = delete;
    };
}
#endif
