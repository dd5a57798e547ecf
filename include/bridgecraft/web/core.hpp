///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bridgecraft::web::core
{
    // status codes
    namespace response_code
    {
        inline constexpr int OK = 200;
        inline constexpr int CREATED = 201;
        inline constexpr int NO_CONTENT = 204;

        inline constexpr int MOVED_PERMANENTLY = 301;
        inline constexpr int FOUND = 302;
        inline constexpr int NOT_MODIFIED = 304;

        inline constexpr int BAD_REQUEST = 400;
        inline constexpr int UNAUTHORIZED = 401;
        inline constexpr int FORBIDDEN = 403;
        inline constexpr int NOT_FOUND = 404;
        inline constexpr int METHOD_NOT_ALLOWED = 405;
        inline constexpr int PAYLOAD_TOO_LARGE = 413;
        inline constexpr int UNPROCESSABLE_ENTITY = 422;

        inline constexpr int INTERNAL_SERVER_ERROR = 500;
        inline constexpr int NOT_IMPLEMENTED = 501;
        inline constexpr int BAD_GATEWAY = 502;
        inline constexpr int SERVICE_UNAVAILABLE = 503;
    }

    constexpr std::string_view status_text(int code) noexcept
    {
        switch (code)
        {
        case 200:
            return "OK";
        case 201:
            return "Created";
        case 204:
            return "No Content";
        case 301:
            return "Moved Permanently";
        case 302:
            return "Found";
        case 304:
            return "Not Modified";
        case 400:
            return "Bad Request";
        case 401:
            return "Unauthorized";
        case 403:
            return "Forbidden";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 413:
            return "Payload Too Large";
        case 422:
            return "Unprocessable Entity";
        case 500:
            return "Internal Server Error";
        case 501:
            return "Not Implemented";
        case 502:
            return "Bad Gateway";
        case 503:
            return "Service Unavailable";
        default:
            return "Unknown";
        }
    }

    constexpr bool is_valid_status(int code) noexcept { return code >= 100 && code <= 999; }

    // ASCII case-insensitive ordering, used for header names
    struct case_insensitive_less
    {
        using is_transparent = void;

        bool operator()(std::string_view lhs, std::string_view rhs) const noexcept;
    };

    /// @brief Header mapping with case-insensitive keys.
    /// @details The spelling of the first insertion of a key is what goes on the wire.
    using header_map = std::map<std::string, std::string, case_insensitive_less>;

    /// @brief Header list as it travels across the host boundary, order and duplicates preserved.
    using header_list = std::vector<std::pair<std::string, std::string>>;

    /// @brief Raw octets as they cross the host boundary.
    using bytes = std::vector<char>;

    using query_list = std::vector<std::pair<std::string, std::string>>;
    using query_dict = std::map<std::string, std::string>;

    /// @brief Decodes %XX escapes. When plus_as_space is set, '+' decodes to ' ' (form encoding).
    /// Malformed escapes are kept verbatim.
    std::string percent_decode(std::string_view input, bool plus_as_space = false);

    /// @brief Splits a raw query string into ordered key/value pairs.
    /// @details Fields are separated by '&'. Fields without '=' or with an empty
    /// value are dropped; keys and values are form-decoded.
    query_list parse_query(std::string_view query_string);

    /// @brief Collapses a query list into a mapping, the last value winning for duplicate keys.
    query_dict to_query_dict(const query_list &list);

    header_map to_header_map(const header_list &list);
    header_list to_header_list(const header_map &map);
}

namespace bridgecraft::web::headers
{
    constexpr std::string_view CONTENT_LENGTH = "content-length";
    constexpr std::string_view CONTENT_TYPE = "content-type";
    constexpr std::string_view HOST = "host";
}

namespace bridgecraft::web::content_types
{
    constexpr std::string_view TEXT_HTML = "text/html";
    constexpr std::string_view TEXT_PLAIN = "text/plain";
    constexpr std::string_view APPLICATION_JSON = "application/json";
}
