///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#include <fmt/format.h>
#include <bridgecraft/web/errors.hpp>
#include <bridgecraft/web/response.hpp>

namespace bridgecraft::web
{
    namespace
    {
        constexpr std::string_view part_name(const response_part &part) noexcept
        {
            switch (part.index())
            {
            case 0:
                return "an int";
            case 1:
                return "a header mapping";
            default:
                return "a body";
            }
        }

        int take_status(response_part &part)
        {
            if (auto *status = std::get_if<int>(&part))
                return *status;
            throw invalid_response_shape(fmt::format("Status code must be an int, not {}.", part_name(part)));
        }

        header_map take_headers(response_part &part)
        {
            if (auto *headers = std::get_if<header_map>(&part))
                return std::move(*headers);
            throw invalid_response_shape(fmt::format("Headers must be a mapping, not {}.", part_name(part)));
        }

        body_value take_body(response_part &part)
        {
            if (auto *body = std::get_if<body_value>(&part))
                return std::move(*body);
            throw invalid_response_shape(fmt::format("Body cannot be {}.", part_name(part)));
        }

        constexpr bool has_line_break(std::string_view text) noexcept
        {
            return text.find_first_of("\r\n") != std::string_view::npos;
        }
    }

    void validate_status(int status)
    {
        if (!core::is_valid_status(status))
            throw invalid_response_shape(fmt::format("Status code must be between 100 and 999, not {}.", status));
    }

    void validate_headers(const header_map &headers)
    {
        for (const auto &[name, value] : headers)
        {
            if (name.empty() || has_line_break(name) || name.find(':') != std::string::npos)
                throw invalid_response_shape(fmt::format("Header keys and values must be valid header tokens, got key '{}'.", name));
            if (has_line_break(value))
                throw invalid_response_shape(fmt::format("Header keys and values must be valid header tokens, got value for '{}'.", name));
        }
    }

    response normalize_response(handler_result &&result)
    {
        auto &parts = result.parts();
        response normalized;

        switch (parts.size())
        {
        case 0:
            throw invalid_response_shape("Handler returned no response. Return a body, or accept and send through the request.");
        case 1:
            normalized.body = take_body(parts[0]);
            break;
        case 2:
            if (std::holds_alternative<int>(parts[0]))
                normalized.status = take_status(parts[0]);
            else if (std::holds_alternative<header_map>(parts[0]))
                normalized.headers = take_headers(parts[0]);
            else
                throw invalid_response_shape("Handler returned 2-tuple that does not start with a status code or headers.");
            normalized.body = take_body(parts[1]);
            break;
        case 3:
            normalized.status = take_status(parts[0]);
            normalized.headers = take_headers(parts[1]);
            normalized.body = take_body(parts[2]);
            break;
        default:
            throw invalid_response_shape(fmt::format("Handler returned {}-tuple.", parts.size()));
        }

        validate_status(normalized.status);
        validate_headers(normalized.headers);
        return normalized;
    }
}
