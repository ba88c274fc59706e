#include <catch2/catch_test_macros.hpp>
#include <courier/http/http_common.hpp>
#include <courier/http/http_message.hpp>
#include <string>

using namespace courier::http;

TEST_CASE("method string conversion", "[http]") {
    REQUIRE(method_to_string(method::GET) == "GET");
    REQUIRE(method_to_string(method::DELETE_) == "DELETE");
}

TEST_CASE("headers are case-insensitive", "[http][headers]") {
    headers h;
    h.set("Content-Type", "application/json");
    REQUIRE(h.get("content-type") == "application/json");
    REQUIRE(h.contains("CONTENT-TYPE"));

    h.set("content-type", "text/plain");
    REQUIRE(h.size() == 1);
    REQUIRE(h.content_type() == "text/plain");

    REQUIRE_FALSE(h.set_if_absent("Content-Type", "application/xml"));
    REQUIRE(h.content_type() == "text/plain");
    REQUIRE(h.set_if_absent("Accept", "*/*"));

    h.remove("ACCEPT");
    REQUIRE_FALSE(h.contains("Accept"));
    REQUIRE(h.get("Accept").empty());
}

TEST_CASE("json media types", "[http][mime]") {
    REQUIRE(mime::is_json(mime::application_json));
    REQUIRE(mime::is_json("APPLICATION/Json"));
    REQUIRE(mime::is_json("application/problem+json"));
    REQUIRE_FALSE(mime::is_json("text/plain"));
    REQUIRE_FALSE(mime::is_json("application/json-seq"));
    REQUIRE_FALSE(mime::is_json("+json"));
    REQUIRE_FALSE(mime::is_json(""));
}

TEST_CASE("request is its own description", "[http][request]") {
    request req(method::POST, "https://api.example.com/items");
    req.set_content_type(mime::application_json);
    req.set_body(std::string(R"({"name":"a"})"));

    STATIC_REQUIRE(request_convertible<request>);
    auto copy = req.to_request();
    REQUIRE(copy == req);
    REQUIRE(copy.header("content-type") == "application/json");
    REQUIRE_FALSE(copy.timeout().has_value());
}

TEST_CASE("http_response metadata", "[http][response]") {
    http_response resp("https://api.example.com/items", 201,
                       headers{{"Content-Type", "application/json; charset=utf-8"}});
    REQUIRE(resp.is_success());
    REQUIRE(resp.mime_type() == "application/json");

    response_metadata meta = resp;
    REQUIRE(as_http_response(meta) != nullptr);
    REQUIRE(as_http_response(meta)->status_code() == 201);

    response_metadata file_meta = url_response{"file:///tmp/a.json", "application/json", 12};
    REQUIRE(as_http_response(file_meta) == nullptr);
}
