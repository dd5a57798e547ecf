///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#include <fmt/format.h>
#include <bridgecraft/web/core.hpp>
#include <bridgecraft/web/errors.hpp>
#include <bridgecraft/web/failure_policy.hpp>

namespace bridgecraft::web
{
    namespace
    {
        void append_causes(std::string &text, const std::exception &e)
        {
            try
            {
                std::rethrow_if_nested(e);
            }
            catch (const std::exception &inner)
            {
                text += fmt::format("\ncaused by: {}", inner.what());
                append_causes(text, inner);
            }
            catch (...)
            {
                text += "\ncaused by: unknown exception";
            }
        }

        failure_report make_report(failure_kind kind, severity level, std::string_view kind_name,
                                   std::string_view where, std::string message, bool expose_details)
        {
            failure_report report;
            report.kind = kind;
            report.level = level;
            report.log_text = fmt::format("{} in {}: {}", kind_name, where, message);
            report.body_text = expose_details ? report.log_text : std::string{core::status_text(report.status)};
            report.message = std::move(message);
            return report;
        }

        failure_report make_report(failure_kind kind, severity level, std::string_view kind_name,
                                   std::string_view where, const std::exception &e, bool expose_details)
        {
            auto report = make_report(kind, level, kind_name, where, std::string{e.what()}, expose_details);
            append_causes(report.log_text, e);
            return report;
        }
    }

    failure_report classify_failure(std::exception_ptr failure, std::string_view where, bool expose_details)
    {
        if (!failure)
            return make_report(failure_kind::unexpected, severity::error, "Error", where, "Unknown failure.", expose_details);

        try
        {
            std::rethrow_exception(failure);
        }
        catch (const peer_disconnected &e)
        {
            return make_report(failure_kind::disconnect, severity::debug, e.kind(), where, e, expose_details);
        }
        catch (const http_error &e)
        {
            auto report = make_report(failure_kind::rejection, severity::info, e.kind(), where, e, expose_details);
            if (core::is_valid_status(e.status()))
                report.status = e.status();
            report.body_text = report.message;
            return report;
        }
        catch (const invalid_response_shape &e)
        {
            return make_report(failure_kind::shape, severity::warning, e.kind(), where, e, expose_details);
        }
        catch (const encoding_error &e)
        {
            return make_report(failure_kind::shape, severity::warning, e.kind(), where, e, expose_details);
        }
        catch (const error &e)
        {
            return make_report(failure_kind::unexpected, severity::error, e.kind(), where, e, expose_details);
        }
        catch (const std::exception &e)
        {
            return make_report(failure_kind::unexpected, severity::error, "Error", where, e, expose_details);
        }
        catch (...)
        {
            return make_report(failure_kind::unexpected, severity::error, "Error", where, "Unknown exception.", expose_details);
        }
    }
}
