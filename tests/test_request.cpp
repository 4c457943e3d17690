#include <catch2/catch_test_macros.hpp>
#include <streamgate/core/request.hpp>

using namespace streamgate;

TEST_CASE("Request head parsing", "[request]") {
    SECTION("request line and headers") {
        auto req = parse_request_head(
            "GET /api/stream/abc HTTP/1.1\r\n"
            "Host: localhost\r\n"
            "Range:   bytes=200-499  \r\n"
            "\r\n");
        REQUIRE(req.has_value());
        REQUIRE(req->method() == HttpMethod::GET);
        REQUIRE(req->path() == "/api/stream/abc");
        REQUIRE(req->http_version() == "HTTP/1.1");
        REQUIRE(req->header("Range") == "bytes=200-499");
    }

    SECTION("header lookup is case-insensitive") {
        auto req = parse_request_head("GET / HTTP/1.1\r\nrange: bytes=0-1\r\n\r\n");
        REQUIRE(req.has_value());
        REQUIRE(req->header("RANGE") == "bytes=0-1");
        REQUIRE(req->header("Range") == "bytes=0-1");
    }

    SECTION("query string") {
        auto req = parse_request_head("GET /search?q=hello+world&page=2&flag HTTP/1.1\r\n\r\n");
        REQUIRE(req.has_value());
        REQUIRE(req->path() == "/search");
        REQUIRE(req->query_string() == "q=hello+world&page=2&flag");
        REQUIRE(req->query_params().at("q") == "hello world");
        REQUIRE(req->query_params().at("page") == "2");
        REQUIRE(req->query_params().at("flag").empty());
    }

    SECTION("percent-encoded path") {
        auto req = parse_request_head("GET /api/library/m%6Fvies HTTP/1.1\r\n\r\n");
        REQUIRE(req.has_value());
        REQUIRE(req->path() == "/api/library/movies");
    }

    SECTION("HEAD and OPTIONS") {
        REQUIRE(parse_request_head("HEAD / HTTP/1.1\r\n\r\n")->method() == HttpMethod::HEAD);
        REQUIRE(parse_request_head("OPTIONS / HTTP/1.1\r\n\r\n")->method() == HttpMethod::OPTIONS);
    }
}

TEST_CASE("Malformed request heads", "[request]") {
    SECTION("missing version") {
        auto req = parse_request_head("GET /\r\n\r\n");
        REQUIRE_FALSE(req.has_value());
        REQUIRE(req.error().http_status() == 400);
    }

    SECTION("target without leading slash") {
        REQUIRE_FALSE(parse_request_head("GET api HTTP/1.1\r\n\r\n").has_value());
    }

    SECTION("bad version") {
        REQUIRE_FALSE(parse_request_head("GET / FTP/1.0\r\n\r\n").has_value());
    }

    SECTION("header without colon") {
        REQUIRE_FALSE(parse_request_head("GET / HTTP/1.1\r\nBroken header\r\n\r\n").has_value());
    }
}

TEST_CASE("Keep-alive negotiation", "[request]") {
    SECTION("HTTP/1.1 defaults to keep-alive") {
        REQUIRE(parse_request_head("GET / HTTP/1.1\r\n\r\n")->keep_alive());
    }

    SECTION("Connection: close") {
        REQUIRE_FALSE(parse_request_head("GET / HTTP/1.1\r\nConnection: Close\r\n\r\n")->keep_alive());
    }

    SECTION("HTTP/1.0 closes unless asked") {
        REQUIRE_FALSE(parse_request_head("GET / HTTP/1.0\r\n\r\n")->keep_alive());
        REQUIRE(parse_request_head("GET / HTTP/1.0\r\nConnection: keep-alive\r\n\r\n")->keep_alive());
    }
}

TEST_CASE("URL decoding", "[request]") {
    REQUIRE(url_decode("a%20b") == "a b");
    REQUIRE(url_decode("a+b") == "a+b");
    REQUIRE(url_decode("a+b", true) == "a b");
    REQUIRE(url_decode("100%") == "100%");
    REQUIRE(url_decode("%zz") == "%zz");
}

TEST_CASE("Case helpers", "[request]") {
    REQUIRE(to_lower("Content-Range") == "content-range");
    REQUIRE(iequals("BYTES", "bytes"));
    REQUIRE_FALSE(iequals("byte", "bytes"));
}
