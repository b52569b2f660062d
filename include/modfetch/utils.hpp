#ifndef MODFETCH_UTILS_HPP
#define MODFETCH_UTILS_HPP

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <modfetch/export.hpp>

namespace modfetch
{
    namespace fs = std::filesystem;

    MODFETCH_API bool starts_with(const std::string_view& str, const std::string_view& prefix);

    // Standard (RFC 4648, padded) base64 of `size` bytes.
    MODFETCH_API std::string base64_encode(const unsigned char* data, std::size_t size);

    class MODFETCH_API download_error : public std::runtime_error
    {
    public:
        download_error(const std::string& what = "download error")
            : std::runtime_error(what)
        {
        }
    };

    MODFETCH_API std::string string_transform(const std::string_view& input, int (*functor)(int));
    MODFETCH_API std::string to_lower(const std::string_view& input);
    MODFETCH_API bool contains(const std::string_view& str, const std::string_view& sub_str);

    MODFETCH_API std::pair<std::string, std::string> parse_header(const std::string_view& header);
    MODFETCH_API std::string get_env(const char* var, const std::string& default_value);

    // Human readable size with two decimals and 1024 based units, e.g. "1.50MB".
    MODFETCH_API std::string format_byte_size(double size_in_bytes);

    // True when `name` can be used as-is as a file name inside a destination directory.
    MODFETCH_API bool is_plain_file_name(const std::string& name);
}

#endif
