#include <modfetch/utils.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <vector>

#include <fmt/core.h>

extern "C"
{
#include <openssl/evp.h>
}

namespace modfetch
{
    bool starts_with(const std::string_view& str, const std::string_view& prefix)
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    std::string base64_encode(const unsigned char* data, std::size_t size)
    {
        if (size == 0)
            return std::string();

        // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a terminating NUL
        std::vector<unsigned char> out(4 * ((size + 2) / 3) + 1);
        const int written = EVP_EncodeBlock(out.data(), data, static_cast<int>(size));
        if (written < 0)
        {
            throw std::runtime_error("base64 encoding failed");
        }
        return std::string(reinterpret_cast<const char*>(out.data()),
                           static_cast<std::size_t>(written));
    }

    std::string string_transform(const std::string_view& input, int (*functor)(int))
    {
        std::string res(input);
        std::transform(
            res.begin(), res.end(), res.begin(), [&](unsigned char c) { return functor(c); });
        return res;
    }

    std::string to_lower(const std::string_view& input)
    {
        return string_transform(input, std::tolower);
    }

    bool contains(const std::string_view& str, const std::string_view& sub_str)
    {
        return str.find(sub_str) != std::string::npos;
    }

    std::pair<std::string, std::string> parse_header(const std::string_view& header)
    {
        auto colon_idx = header.find(':');
        if (colon_idx != std::string_view::npos)
        {
            std::string_view key, value;
            key = header.substr(0, colon_idx);
            colon_idx++;
            // remove spaces
            while (colon_idx < header.size() && std::isspace(header[colon_idx]))
            {
                ++colon_idx;
            }

            // remove \r\n header ending
            value = header.substr(colon_idx);
            while (!value.empty() && (value.back() == '\n' || value.back() == '\r'))
            {
                value.remove_suffix(1);
            }
            // http headers are case insensitive!
            std::string lkey = to_lower(key);

            return std::make_pair(lkey, std::string(value));
        }
        return std::make_pair(std::string(), std::string(header));
    }

    std::string get_env(const char* var, const std::string& default_value)
    {
        const char* val = getenv(var);
        if (!val)
        {
            return default_value;
        }
        return val;
    }

    std::string format_byte_size(double size_in_bytes)
    {
        static constexpr std::array<const char*, 9> units
            = { "B", "KB", "MB", "GB", "TB", "PB", "EB", "ZB", "YB" };

        if (size_in_bytes <= 0)
            return "0B";

        const auto log_index = static_cast<int>(std::floor(std::log(size_in_bytes) / std::log(1024.0)));
        const std::size_t unit_index
            = std::min<std::size_t>(std::max(log_index, 0), units.size() - 1);
        const double size_in_unit = size_in_bytes / std::pow(1024.0, unit_index);
        return fmt::format("{:.2f}{}", size_in_unit, units[unit_index]);
    }

    bool is_plain_file_name(const std::string& name)
    {
        if (name.empty() || name == "." || name == "..")
            return false;
        return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
    }
}
