///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cstddef>
#include <string>

namespace bridgecraft::web
{
    // 10 MiB
    inline constexpr std::size_t default_body_limit = 10 * (std::size_t{1} << 20);

    struct application_config
    {
        // limit for get_body()/get_json() when the caller passes none
        std::size_t body_limit = default_body_limit;

        // when false, synthesized error bodies only carry the status text
        bool expose_error_details = true;

        bool set_content_length = true;

        bool close_websocket_on_return = true;

        // logger used when no diagnostic sink is given
        std::string logger_name = "bridgecraft";
    };
}
