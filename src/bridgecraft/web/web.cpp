///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#include <algorithm>
#include <bridgecraft/web/core.hpp>

namespace bridgecraft::web::core
{
    namespace
    {
        constexpr char to_lower_ascii(char c) noexcept
        {
            return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
        }

        constexpr int hex_value(char c) noexcept
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }
    }

    bool case_insensitive_less::operator()(std::string_view lhs, std::string_view rhs) const noexcept
    {
        return std::lexicographical_compare(
            lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
            [](char a, char b)
            { return static_cast<unsigned char>(to_lower_ascii(a)) < static_cast<unsigned char>(to_lower_ascii(b)); });
    }

    std::string percent_decode(std::string_view input, bool plus_as_space)
    {
        std::string result;
        result.reserve(input.size());

        for (size_t i = 0; i < input.size(); ++i)
        {
            char c = input[i];
            if (c == '%' && i + 2 < input.size())
            {
                int hi = hex_value(input[i + 1]);
                int lo = hex_value(input[i + 2]);
                if (hi >= 0 && lo >= 0)
                {
                    result.push_back(static_cast<char>((hi << 4) | lo));
                    i += 2;
                    continue;
                }
            }
            if (c == '+' && plus_as_space)
            {
                result.push_back(' ');
                continue;
            }
            result.push_back(c);
        }

        return result;
    }

    query_list parse_query(std::string_view query_string)
    {
        query_list result;

        while (!query_string.empty())
        {
            auto amp = query_string.find('&');
            std::string_view field = query_string.substr(0, amp);
            query_string = amp == std::string_view::npos ? std::string_view{} : query_string.substr(amp + 1);

            auto eq = field.find('=');
            if (eq == std::string_view::npos)
                continue;

            std::string_view key = field.substr(0, eq);
            std::string_view value = field.substr(eq + 1);
            if (value.empty())
                continue;

            result.emplace_back(percent_decode(key, true), percent_decode(value, true));
        }

        return result;
    }

    query_dict to_query_dict(const query_list &list)
    {
        query_dict result;
        for (const auto &[key, value] : list)
            result[key] = value;
        return result;
    }

    header_map to_header_map(const header_list &list)
    {
        header_map result;
        for (const auto &[key, value] : list)
            result.insert_or_assign(key, value);
        return result;
    }

    header_list to_header_list(const header_map &map)
    {
        return header_list(map.begin(), map.end());
    }
}
