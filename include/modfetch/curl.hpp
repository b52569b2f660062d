#ifndef MODFETCH_CURL_HPP
#define MODFETCH_CURL_HPP

#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

extern "C"
{
#include <curl/curl.h>
}

#include <modfetch/export.hpp>

namespace modfetch
{
    class CURLHandle;

    struct MODFETCH_API Response
    {
        std::map<std::string, std::string> headers;

        long http_status = 0;
        std::string effective_url;

        bool ok() const;

        tl::expected<std::string, std::out_of_range> get_header(const std::string& header) const;

        void fill_values(CURLHandle& handle);

        // Only filled for buffered requests (post_form / head), streamed bodies go to the
        // StreamHandler instead.
        std::optional<std::string> content;
        nlohmann::json json() const;
    };

}

#endif
