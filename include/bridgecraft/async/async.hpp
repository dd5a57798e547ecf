#pragma once

///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#include "async_generator.hpp"
#include "awaitable.hpp"
#include "event_signal.hpp"
#include "sync_wait.hpp"
#include "task.hpp"

#define co_async [&]() -> ::bridgecraft::async::task<void>
#define async_t(T) ::bridgecraft::async::task<T>
