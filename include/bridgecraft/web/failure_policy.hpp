///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <bridgecraft/web/diagnostics.hpp>

namespace bridgecraft::web
{
    enum class failure_kind
    {
        // the peer went away, nothing to report
        disconnect,
        // http_error raised on purpose by the handler
        rejection,
        // the handler returned something that is not a valid response
        shape,
        unexpected
    };

    /// @brief How one caught failure is logged and, if still possible, answered.
    struct failure_report
    {
        failure_kind kind = failure_kind::unexpected;
        severity level = severity::error;
        // status for a response synthesized before anything was sent
        int status = 500;
        // "<kind> in <where>: <message>", followed by any nested causes
        std::string log_text;
        // body for a response synthesized before anything was sent
        std::string body_text;
        // the bare exception message
        std::string message;
    };

    /// @brief Classifies a captured exception thrown while `where` was happening.
    /// @details When `expose_details` is false, body_text for unexpected failures is only the status text.
    failure_report classify_failure(std::exception_ptr failure, std::string_view where, bool expose_details = true);
}
