#include <catch2/catch_test_macros.hpp>
#include <courier/pipeline/http_network_service.hpp>
#include <courier/pipeline/typed_requests.hpp>
#include <courier/runtime/run.hpp>
#include <nlohmann/json.hpp>
#include <exception>
#include <memory>
#include <string>
#include <vector>
#include "../test_main.cpp"

using namespace courier;
using namespace courier::pipeline;
using namespace courier::test;

namespace {

struct user {
    int id = 0;
    std::string name;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(user, id, name)

struct api_error {
    std::string error;
    int code = 0;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(api_error, error, code)

// Thrown by a decoder that does not use std::exception
struct legacy_parse_failure {
    int line;
};

struct checked_id {
    int id = 0;
};

void from_json(const nlohmann::json& j, checked_id& out) {
    out.id = j.at("id").get<int>();
    if (out.id < 0) {
        throw legacy_parse_failure{1};
    }
}

// A request description that is not an http::request
struct get_user {
    int id;

    http::request to_request() const {
        return http::request(http::method::GET, "https://api.example.com/users/" + std::to_string(id));
    }
};

// Resets the process-wide request history around each test
struct typed_fixture {
    typed_fixture() { request_logger::instance().clear(); }
    ~typed_fixture() { request_logger::instance().clear(); }
};

} // namespace

TEST_CASE("request_object decodes a description's response", "[typed][integration]") {
    auto transport = std::make_shared<scripted_transport>(http_result(200, R"({"id":7,"name":"ada"})"));
    http_network_service service(transport);

    auto u = courier::run(request_object<user>(service, get_user{7}));
    REQUIRE(u.id == 7);
    REQUIRE(u.name == "ada");
    REQUIRE(transport->last_request().target() == "https://api.example.com/users/7");
}

TEST_CASE("request_object maps decode failures", "[typed][integration]") {
    auto transport = std::make_shared<scripted_transport>(http_result(200, R"({"id":"seven"})"));
    int recoveries = 0;
    http_network_service service(transport, service_config{
        .error_handlers = {error_handler{
            [](const std::exception_ptr&) { return true; },
            [&recoveries](std::exception_ptr) -> coro::task<void> { ++recoveries; co_return; },
        }},
    });

    try {
        courier::run(request_object<user>(service, get_user{7}));
        FAIL("expected decoding");
    } catch (const network_error& e) {
        REQUIRE(e.kind() == error_kind::decoding);
        REQUIRE(e.cause() != nullptr);
        REQUIRE_THROWS_AS(std::rethrow_exception(e.cause()), nlohmann::json::exception);
    }
    // Decode failures never reach the handlers
    REQUIRE(recoveries == 0);
    REQUIRE(transport->calls() == 1);
}

TEST_CASE("request_objects decodes a list", "[typed][integration]") {
    auto transport = std::make_shared<scripted_transport>(
        http_result(200, R"([{"id":1,"name":"a"},{"id":2,"name":"b"}])"));
    http_network_service service(transport);

    auto users = courier::run(request_objects<user>(service, get_request()));
    REQUIRE(users.size() == 2);
    REQUIRE(users[1].name == "b");

    auto empty = std::make_shared<scripted_transport>(http_result(200, "[]"));
    http_network_service empty_service(empty);
    REQUIRE(courier::run(request_objects<user>(empty_service, get_request())).empty());
}

TEST_CASE("request_string honours the encoding", "[typed][integration]") {
    auto transport = std::make_shared<scripted_transport>(http_result(200, "caf\xE9", "text/plain"));
    http_network_service service(transport);

    REQUIRE(courier::run(request_string(service, get_request(), string_encoding::iso_latin1)) == "caf\xC3\xA9");

    try {
        courier::run(request_string(service, get_request()));
        FAIL("expected decoding_string");
    } catch (const network_error& e) {
        REQUIRE(e == network_error::decoding_string());
    }
}

TEST_CASE("request_string_with_response returns the metadata", "[typed][integration]") {
    auto transport = std::make_shared<scripted_transport>(http_result(202, "queued", "text/plain"));
    http_network_service service(transport);

    auto [text, metadata] = courier::run(request_string_with_response(service, get_request()));
    REQUIRE(text == "queued");
    REQUIRE(http::as_http_response(metadata)->status_code() == 202);
    REQUIRE(http::as_http_response(metadata)->mime_type() == "text/plain");
}

TEST_CASE("request_object_and_response returns both", "[typed][integration]") {
    auto transport = std::make_shared<scripted_transport>(http_result(201, R"({"id":9,"name":"new"})"));
    http_network_service service(transport);

    auto [u, response] = courier::run(request_object_and_response<user>(service, get_user{9}));
    REQUIRE(u.id == 9);
    REQUIRE(response.status_code() == 201);
    REQUIRE(response.url() == test_url);
}

TEST_CASE("request_object_and_response requires HTTP metadata", "[typed][integration]") {
    auto transport = std::make_shared<scripted_transport>(http_result(200, R"({"id":9,"name":"new"})"));
    // Interceptor rewriting the metadata to a non-HTTP form
    http_network_service service(transport, service_config{
        .response_interceptors = {response_interceptor{
            [](std::string_view, const http::http_response&, const http::request&) { return true; },
            [](std::string data, const http::http_response&, const http::request&) {
                return raw_response{std::move(data), http::url_response{"cache://users/9", "application/json", std::nullopt}};
            },
        }},
    });

    try {
        courier::run(request_object_and_response<user>(service, get_user{9}));
        FAIL("expected invalid_response_format");
    } catch (const network_error& e) {
        REQUIRE(e.kind() == error_kind::invalid_response_format);
    }
    // The plain object call does not care about the metadata form
    REQUIRE(courier::run(request_object<user>(service, get_user{9})).name == "new");
}

TEST_CASE("multiple response types: first decodable shape wins", "[typed][integration]") {
    auto transport = std::make_shared<scripted_transport>(http_result(200, R"({"error":"quota","code":429})"));
    http_network_service service(transport);

    auto matched = courier::run(request_with_multiple_response_types(
        service, get_request(),
        {response_shape::object<user>("user"), response_shape::object<api_error>("api_error"), response_shape::string()}));

    REQUIRE(matched.shape_index == 1);
    REQUIRE(matched.shape_name == "api_error");
    REQUIRE(matched.holds<api_error>());
    REQUIRE(matched.get<api_error>().code == 429);
}

TEST_CASE("multiple response types: string fallback", "[typed][integration]") {
    auto transport = std::make_shared<scripted_transport>(http_result(200, "maintenance", "text/plain"));
    http_network_service service(transport);

    auto matched = courier::run(request_with_multiple_response_types(
        service, get_request(), {response_shape::object<user>("user"), response_shape::string("text")}));

    REQUIRE(matched.shape_index == 1);
    REQUIRE(matched.get<std::string>() == "maintenance");
}

TEST_CASE("multiple response types: exhaustion is a decoding error", "[typed][integration]") {
    auto transport = std::make_shared<scripted_transport>(http_result(200, "[1,2]"));
    http_network_service service(transport);

    try {
        courier::run(request_with_multiple_response_types(
            service, get_request(), {response_shape::object<user>("user"), response_shape::object<api_error>("api_error")}));
        FAIL("expected decoding");
    } catch (const network_error& e) {
        REQUIRE(e.kind() == error_kind::decoding);
        REQUIRE(e.context() == "no response shape matched (tried: user, api_error)");
    }

    REQUIRE_THROWS_AS(courier::run(request_with_multiple_response_types(service, get_request(), {})), network_error);
}

TEST_CASE_METHOD(typed_fixture, "object calls write request logs", "[typed][integration][logging]") {
    auto transport = std::make_shared<scripted_transport>(
        [](const http::request& req, size_t) {
            if (req.target().ends_with("/users/1")) {
                return http_result(200, R"({"id":1,"name":"ok"})");
            }
            if (req.target().ends_with("/users/2")) {
                return http_result(200, R"({"broken":true})");
            }
            return http_result(500, "down");
        });
    http_network_service service(transport, service_config{.log_requests = true});

    courier::run(request_object<user>(service, get_user{1}));
    REQUIRE_THROWS_AS(courier::run(request_object<user>(service, get_user{2})), network_error);
    REQUIRE_THROWS_AS(courier::run(request_object_and_response<user>(service, get_user{3})), network_error);

    auto records = request_logger::instance().records();
    REQUIRE(records.size() == 3);

    REQUIRE(records[0].request == get_user{1}.to_request());
    REQUIRE(records[0].is_success);
    REQUIRE(records[0].response_data == R"({"id":1,"name":"ok"})");

    // Decoded badly: the bytes are kept
    REQUIRE_FALSE(records[1].is_success);
    REQUIRE(records[1].response_data == R"({"broken":true})");

    // Failed before any bytes arrived
    REQUIRE_FALSE(records[2].is_success);
    REQUIRE_FALSE(records[2].response_data.has_value());
}

TEST_CASE_METHOD(typed_fixture, "other calls and disabled services do not log", "[typed][integration][logging]") {
    auto transport = std::make_shared<scripted_transport>(http_result(200, R"([{"id":1,"name":"a"}])"));
    http_network_service logging(transport, service_config{.log_requests = true});

    courier::run(request_objects<user>(logging, get_request()));
    courier::run(request_string(logging, get_request()));
    courier::run(request_void(logging, get_request()));
    REQUIRE(request_logger::instance().size() == 0);

    http_network_service quiet(transport);
    REQUIRE_FALSE(quiet.log_requests());
    courier::run(request_object<std::vector<user>>(quiet, get_request()));
    REQUIRE(request_logger::instance().size() == 0);

    quiet.set_log_requests(true);
    courier::run(request_object<std::vector<user>>(quiet, get_request()));
    REQUIRE(request_logger::instance().size() == 1);
}

TEST_CASE_METHOD(typed_fixture, "decoder exceptions of any type become decoding errors",
                 "[typed][integration][logging]") {
    auto transport = std::make_shared<scripted_transport>(http_result(200, R"({"id":-1})"));
    http_network_service service(transport, service_config{.log_requests = true});

    try {
        courier::run(request_object<checked_id>(service, get_request()));
        FAIL("expected decoding");
    } catch (const network_error& e) {
        REQUIRE(e.kind() == error_kind::decoding);
        REQUIRE_THROWS_AS(std::rethrow_exception(e.cause()), legacy_parse_failure);
    }

    auto records = request_logger::instance().records();
    REQUIRE(records.size() == 1);
    REQUIRE_FALSE(records[0].is_success);
    REQUIRE(records[0].response_data == R"({"id":-1})");

    auto matched = courier::run(request_with_multiple_response_types(
        service, get_request(), {response_shape::object<checked_id>("checked"), response_shape::string("text")}));
    REQUIRE(matched.shape_name == "text");
}
