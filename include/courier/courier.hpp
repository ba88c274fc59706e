#pragma once

/// courier - HTTP request pipeline
///
/// Include this file to get the whole library: the coroutine core, the run
/// loop, the HTTP model, the transport interface and the request pipeline.

#define COURIER_VERSION_MAJOR 1
#define COURIER_VERSION_MINOR 0
#define COURIER_VERSION_PATCH 0

#include <tuple>

// Coroutines and cancellation
#include "coro/promise_base.hpp"
#include "coro/task.hpp"
#include "coro/cancel_token.hpp"

// Runtime
#include "runtime/run_loop.hpp"
#include "runtime/blocking.hpp"
#include "runtime/run.hpp"

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"

// HTTP model and transport
#include "http/http_common.hpp"
#include "http/http_message.hpp"
#include "transport/transport.hpp"
#include "transport/blocking_transport.hpp"

// Pipeline
#include "pipeline/network_error.hpp"
#include "pipeline/validator.hpp"
#include "pipeline/modifier.hpp"
#include "pipeline/interceptor.hpp"
#include "pipeline/error_handler.hpp"
#include "pipeline/decoder.hpp"
#include "pipeline/request_logger.hpp"
#include "pipeline/network_service.hpp"
#include "pipeline/http_network_service.hpp"
#include "pipeline/typed_requests.hpp"

namespace courier {

inline const char* version() noexcept {
    return "1.0.0";
}

inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(COURIER_VERSION_MAJOR, COURIER_VERSION_MINOR, COURIER_VERSION_PATCH);
}

} // namespace courier
