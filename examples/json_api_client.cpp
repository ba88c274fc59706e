/// @file json_api_client.cpp
/// @brief Request pipeline walkthrough against an in-process API
///
/// The transport here answers from a small routing table instead of the
/// network, so the example runs anywhere. Swap the perform function for a
/// real HTTP client to talk to a live service.
///
/// Shows:
/// - bearer token modifier with a refresh handler on 401
/// - envelope unwrapping with an interceptor
/// - typed decoding, list decoding and multi-shape responses
/// - request logging
///
/// Usage: ./json_api_client

#include <courier/courier.hpp>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

using namespace courier;
using namespace courier::pipeline;

struct user {
    int id = 0;
    std::string name;
    std::string email;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(user, id, name, email)

struct maintenance_notice {
    std::string message;
    int retry_after = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(maintenance_notice, message, retry_after)

/// Describes "GET /users/{id}"
struct get_user {
    int id;

    http::request to_request() const {
        http::request req(http::method::GET, fmt::format("https://api.example.com/users/{}", id));
        req.set_header("Accept", "application/json");
        return req;
    }
};

/// Canned server that only accepts token "t-2"
transport::transport_result fake_api(const http::request& req, const coro::cancel_token&) {
    auto json = [&](uint16_t code, std::string body) {
        return transport::transport_result{
            std::move(body),
            http::http_response(req.target(), code, http::headers{{"Content-Type", "application/json"}}),
        };
    };

    std::string_view target = req.target();
    auto authority = target.find("://");
    if (authority == std::string_view::npos) {
        throw transport::transport_error(EINVAL, req.target());
    }
    auto slash = target.find('/', authority + 3);
    auto path = slash == std::string_view::npos ? std::string_view("/") : target.substr(slash);

    if (req.header("Authorization") != "Bearer t-2") {
        return json(401, R"({"error":"token expired"})");
    }
    if (path == "/users") {
        return json(200, R"({"data":[{"id":1,"name":"Ada","email":"ada@example.com"},)"
                         R"({"id":2,"name":"Linus","email":"linus@example.com"}]})");
    }
    if (path == "/users/1") {
        return json(200, R"({"data":{"id":1,"name":"Ada","email":"ada@example.com"}})");
    }
    if (path == "/status") {
        return json(200, R"({"message":"read-only until 02:00","retry_after":600})");
    }
    return json(404, "");
}

coro::task<int> async_main(int, char*[]) {
    auto current_token = std::make_shared<std::string>("t-1");

    transport::transport_config transport_cfg;
    transport_cfg.user_agent = "courier-example/1.0";
    auto api = std::make_shared<transport::blocking_transport>(transport_cfg, fake_api);

    http_network_service service(api, service_config{
        .request_modifiers = {bearer_token([current_token] { return *current_token; })},
        .error_handlers = {error_handler{
            handles(error_kind::unauthorized),
            [current_token](std::exception_ptr) -> coro::task<void> {
                COURIER_LOG_INFO("token {} rejected, refreshing", *current_token);
                *current_token = "t-2";
                co_return;
            },
        }},
        .response_interceptors = {json_envelope_interceptor("data")},
        .log_requests = true,
    });

    COURIER_LOG_INFO("=== courier {} ===", courier::version());

    // Typed object through a request description
    auto ada = co_await request_object<user>(service, get_user{1});
    COURIER_LOG_INFO("user {}: {} <{}>", ada.id, ada.name, ada.email);

    // List decoding
    auto everyone = co_await request_objects<user>(service,
        http::request(http::method::GET, "https://api.example.com/users"));
    for (const auto& u : everyone) {
        COURIER_LOG_INFO("  - {} ({})", u.name, u.id);
    }

    // Endpoint answering in more than one shape
    std::vector<response_shape> status_shapes{response_shape::object<user>("user"),
                                              response_shape::object<maintenance_notice>("maintenance"),
                                              response_shape::string("text")};
    auto status = co_await request_with_multiple_response_types(service,
        http::request(http::method::GET, "https://api.example.com/status"),
        std::move(status_shapes));
    if (status.holds<maintenance_notice>()) {
        const auto& notice = status.get<maintenance_notice>();
        COURIER_LOG_INFO("maintenance: {} (retry in {}s)", notice.message, notice.retry_after);
    }

    // Classified failure
    try {
        co_await request_object<user>(service, get_user{99});
    } catch (const network_error& e) {
        COURIER_LOG_WARNING("user 99: {}", e.what());
    }

    for (const auto& record : request_logger::instance().records()) {
        COURIER_LOG_INFO("log: {} {}", record.request.target(), record.is_success ? "ok" : "failed");
    }

    co_return 0;
}

COURIER_ASYNC_MAIN(async_main)
