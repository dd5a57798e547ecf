///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <variant>
#include <vector>
#include <bridgecraft/web/body.hpp>
#include <bridgecraft/web/core.hpp>

namespace bridgecraft::web
{
    using core::header_map;

    /// @brief One position of a returned response: a status, a header mapping or a body.
    using response_part = std::variant<int, header_map, body_value>;

    /// @brief The canonical response triple.
    struct response
    {
        int status = core::response_code::OK;
        header_map headers;
        body_value body;
    };

    /// @brief What a handler hands back.
    /// @details Either nothing (the handler already responded through the low-level path)
    /// or between one and three response parts, in the order the handler gave them.
    /// `co_return "hi";`, `co_return {404, "not found"};` and
    /// `co_return {200, headers, body};` all produce a handler_result.
    class handler_result
    {
    public:
        handler_result() = default;
        handler_result(std::nullopt_t) noexcept {}

        // Pass-through of an already normalized response
        handler_result(response r)
        {
            parts_.reserve(3);
            parts_.emplace_back(std::in_place_type<int>, r.status);
            parts_.emplace_back(std::in_place_type<header_map>, std::move(r.headers));
            parts_.emplace_back(std::in_place_type<body_value>, std::move(r.body));
        }

        template <typename... P>
            requires(sizeof...(P) >= 1 && (std::constructible_from<response_part, P &&> && ...))
        handler_result(P &&...parts)
        {
            parts_.reserve(sizeof...(P));
            (parts_.emplace_back(std::forward<P>(parts)), ...);
        }

        handler_result(handler_result &&) noexcept = default;
        handler_result &operator=(handler_result &&) noexcept = default;
        handler_result(const handler_result &) = delete;
        handler_result &operator=(const handler_result &) = delete;

        /// @brief True for the "no response" result.
        bool empty() const noexcept { return parts_.empty(); }

        std::size_t size() const noexcept { return parts_.size(); }

        std::vector<response_part> &parts() noexcept { return parts_; }
        const std::vector<response_part> &parts() const noexcept { return parts_; }

    private:
        std::vector<response_part> parts_;
    };

    /// @brief Validates a status code, 100..999.
    /// @throws invalid_response_shape
    void validate_status(int status);

    /// @brief Validates header names and values for the wire.
    /// @throws invalid_response_shape
    void validate_headers(const header_map &headers);

    /// @brief Turns a handler result into a (status, headers, body) triple.
    /// @details Accepted shapes are (body), (status, body), (headers, body) and
    /// (status, headers, body). Missing status defaults to 200 and missing headers to empty.
    /// Normalizing an already normalized response returns it unchanged.
    /// @throws invalid_response_shape for any other shape.
    response normalize_response(handler_result &&result);
}
