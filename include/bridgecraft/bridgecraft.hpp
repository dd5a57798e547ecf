///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#pragma once

#include <bridgecraft/async/async.hpp>
#include <bridgecraft/web/application.hpp>
#include <bridgecraft/web/body.hpp>
#include <bridgecraft/web/config.hpp>
#include <bridgecraft/web/connection.hpp>
#include <bridgecraft/web/core.hpp>
#include <bridgecraft/web/diagnostics.hpp>
#include <bridgecraft/web/errors.hpp>
#include <bridgecraft/web/events.hpp>
#include <bridgecraft/web/failure_policy.hpp>
#include <bridgecraft/web/request.hpp>
#include <bridgecraft/web/response.hpp>
