#include <catch2/catch_test_macros.hpp>
#include <streamgate/core/logging.hpp>
#include <streamgate/core/json.hpp>

#include <sstream>

#include "support/fakes.hpp"

using namespace streamgate;
using streamgate::testing::CaptureSink;

TEST_CASE("Log level names", "[logging]") {
    REQUIRE(parse_log_level("debug") == LogLevel::Debug);
    REQUIRE(parse_log_level("WARN") == LogLevel::Warn);
    REQUIRE(parse_log_level("warning") == LogLevel::Warn);
    REQUIRE(parse_log_level("bogus") == LogLevel::Info);
    REQUIRE(log_level_name(LogLevel::Error) == "ERROR");
}

TEST_CASE("Logger filters by level", "[logging]") {
    Logger logger("test");
    auto sink = std::make_shared<CaptureSink>();
    logger.add_sink(sink);
    logger.set_level(LogLevel::Warn);

    logger.info("dropped");
    logger.warn("kept");
    logger.error("kept too");

    REQUIRE(sink->entries.size() == 2);
    REQUIRE(sink->entries[0].message == "kept");
    REQUIRE(sink->entries[0].logger_name == "test");
    REQUIRE(logger.is_enabled(LogLevel::Error));
    REQUIRE_FALSE(logger.is_enabled(LogLevel::Debug));
}

TEST_CASE("Structured fields", "[logging]") {
    Logger logger("test");
    auto sink = std::make_shared<CaptureSink>();
    logger.add_sink(sink);

    auto entry = logger.entry(LogLevel::Info, "Stream completed");
    entry.field("id", std::string("abc")).field("status", 206).field("bytes", int64_t{300});
    logger.log(entry);

    REQUIRE(sink->entries.size() == 1);
    const auto& fields = sink->entries[0].fields;
    REQUIRE(fields.size() == 3);
    REQUIRE(fields[0] == std::pair<std::string, std::string>{"id", "abc"});
    REQUIRE(fields[1].second == "206");
    REQUIRE(fields[2].second == "300");
}

TEST_CASE("JSON sink writes one object per line", "[logging]") {
    std::ostringstream out;
    Logger logger("json-test");
    logger.add_sink(std::make_shared<JsonSink>(out));

    logger.log(logger.entry(LogLevel::Warn, "Backend refused stream").field("id", "x1"));

    std::string line = out.str();
    REQUIRE(line.ends_with("\n"));
    auto doc = json::parse(std::string_view(line).substr(0, line.size() - 1));
    REQUIRE(doc.has_value());
    REQUIRE(doc->get("level")->as_string() == "WARN");
    REQUIRE(doc->get("message")->as_string() == "Backend refused stream");
    REQUIRE(doc->get("logger")->as_string() == "json-test");
    REQUIRE(doc->get("id")->as_string() == "x1");
}

TEST_CASE("Request logger middleware", "[logging]") {
    Logger logger("http");
    auto sink = std::make_shared<CaptureSink>();
    logger.add_sink(sink);

    auto middleware = request_logger(logger);
    Request req;
    req.set_method("GET");
    req.set_path("/api/library/movies");

    Next next = [](Request&) -> Task<Response> {
        co_return Response::error(400, "Invalid content type");
    };
    auto resp = middleware(req, next).sync_wait();

    REQUIRE(resp.status() == 400);
    REQUIRE(sink->entries.size() == 1);
    REQUIRE(sink->entries[0].message == "GET /api/library/movies");
    REQUIRE(sink->entries[0].fields[0] == std::pair<std::string, std::string>{"status", "400"});
}
