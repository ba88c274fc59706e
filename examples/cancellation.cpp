/// @file cancellation.cpp
/// @brief Cancelling a slow request
///
/// A watchdog coroutine cancels the caller's token after a deadline. The
/// cancellation reaches the transport, which abandons the exchange, and the
/// request fails with operation_cancelled.
///
/// Usage: ./cancellation [deadline_ms]

#include <courier/courier.hpp>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

using namespace courier;
using namespace courier::pipeline;

/// Stands in for a server that takes two seconds to answer
transport::transport_result slow_endpoint(const http::request& req, const coro::cancel_token& token) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (token.is_cancelled()) {
            return {};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return transport::transport_result{
        std::string(R"({"report":"done"})"),
        http::http_response(req.target(), 200, http::headers{{"Content-Type", "application/json"}}),
    };
}

/// Cancels target once `delay` has passed, unless stop fires first
coro::task<void> watchdog(coro::cancel_source target, std::chrono::milliseconds delay, coro::cancel_token stop) {
    try {
        co_await runtime::spawn_blocking([delay] { std::this_thread::sleep_for(delay); }, stop);
    } catch (const coro::operation_cancelled&) {
        co_return;
    }
    COURIER_LOG_INFO("watchdog: deadline reached, cancelling");
    target.cancel();
}

coro::task<int> async_main(int argc, char* argv[]) {
    std::chrono::milliseconds deadline{argc > 1 ? std::atoi(argv[1]) : 300};

    auto slow = std::make_shared<transport::blocking_transport>(transport::transport_config{}, slow_endpoint);
    http_network_service service(slow);

    coro::cancel_source source;
    coro::cancel_source stop_watchdog;
    auto guard = watchdog(source, deadline, stop_watchdog.get_token()).spawn();

    int rc = 0;
    try {
        auto body = co_await request_string(service,
            http::request(http::method::GET, "https://reports.example.com/monthly"),
            string_encoding::utf8, default_validators(), true, source.get_token());
        COURIER_LOG_INFO("report arrived: {}", body);
    } catch (const coro::operation_cancelled& e) {
        COURIER_LOG_WARNING("request gave up: {}", e.what());
        rc = 1;
    }

    stop_watchdog.cancel();
    co_await guard;
    co_return rc;
}

COURIER_ASYNC_MAIN(async_main)
