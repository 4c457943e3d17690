#include <catch2/catch_test_macros.hpp>
#include <streamgate/stream/proxy.hpp>

#include "support/fakes.hpp"

using namespace streamgate;
using namespace streamgate::stream;
using namespace streamgate::testing;

namespace {

struct ProxyFixture {
    FakeContentSource source;
    Logger logger{"proxy-test"};
    std::shared_ptr<CaptureSink> sink = std::make_shared<CaptureSink>();
    StreamingProxy proxy{source, logger};
    std::string payload = make_payload(1000);

    ProxyFixture() {
        logger.set_level(LogLevel::Trace);
        logger.add_sink(sink);
        source.add("file", {payload, "video/mp4", "file.mp4", std::nullopt});
    }

    StreamOutcome serve(const Request& req, RecordingWriter& writer, const std::string& id = "file") {
        return proxy.serve(req, id, writer).sync_wait();
    }
};

} // namespace

TEST_CASE("Ranged request streams exactly the range", "[proxy]") {
    ProxyFixture f;
    RecordingWriter writer;

    auto outcome = f.serve(make_request("GET", "bytes=200-499"), writer);

    CHECK(outcome.state == StreamState::Completed);
    CHECK(outcome.status == 206);
    CHECK(outcome.bytes_sent == 300);
    CHECK(writer.status == 206);
    CHECK(writer.header("Content-Length") == "300");
    CHECK(writer.header("Content-Range") == "bytes 200-499/1000");
    CHECK(writer.header("Accept-Ranges") == "bytes");
    CHECK(writer.body == f.payload.substr(200, 300));
    CHECK(writer.commits == 1);
    CHECK_FALSE(writer.aborted);

    REQUIRE(f.source.stats().last_range.has_value());
    CHECK(f.source.stats().last_range->start() == 200);
    CHECK(f.source.stats().open_calls == 1);
    CHECK(f.source.stats().live_handles == 0);
}

TEST_CASE("Range end past the resource is clamped", "[proxy]") {
    ProxyFixture f;
    RecordingWriter writer;

    auto outcome = f.serve(make_request("GET", "bytes=900-2000"), writer);

    CHECK(outcome.state == StreamState::Completed);
    CHECK(writer.status == 206);
    CHECK(writer.header("Content-Length") == "100");
    CHECK(writer.header("Content-Range") == "bytes 900-999/1000");
    CHECK(writer.body == f.payload.substr(900));
}

TEST_CASE("Unsatisfiable range never opens a stream", "[proxy]") {
    ProxyFixture f;
    RecordingWriter writer;

    auto outcome = f.serve(make_request("GET", "bytes=1000-1200"), writer);

    CHECK(outcome.state == StreamState::Unsatisfiable);
    CHECK(outcome.status == 416);
    CHECK(writer.status == 416);
    CHECK(writer.header("Content-Range") == "bytes */1000");
    CHECK(writer.body.empty());
    CHECK(f.source.stats().open_calls == 0);
}

TEST_CASE("Malformed Range header serves full content", "[proxy]") {
    ProxyFixture f;
    RecordingWriter writer;

    auto outcome = f.serve(make_request("GET", "bytes=abc"), writer);

    CHECK(outcome.state == StreamState::Completed);
    CHECK(writer.status == 200);
    CHECK(writer.header("Content-Length") == "1000");
    CHECK(writer.header("Content-Type") == "video/mp4");
    CHECK_FALSE(writer.header("Content-Range").has_value());
    CHECK(writer.body == f.payload);
    CHECK_FALSE(f.source.stats().last_range.has_value());
}

TEST_CASE("No Range header serves full content", "[proxy]") {
    ProxyFixture f;
    RecordingWriter writer;

    auto outcome = f.serve(make_request("GET"), writer);

    CHECK(outcome.status == 200);
    CHECK(outcome.bytes_sent == 1000);
    CHECK(writer.body == f.payload);
}

TEST_CASE("Client disconnect releases the stream", "[proxy]") {
    ProxyFixture f;
    f.source.chunk_size = 10;
    RecordingWriter writer;
    writer.disconnect_after = 50;

    auto outcome = f.serve(make_request("GET", "bytes=200-499"), writer);

    CHECK(outcome.state == StreamState::Aborted);
    CHECK(outcome.bytes_sent == 50);
    CHECK(writer.body.size() == 50);
    CHECK(writer.aborted);
    CHECK(f.source.stats().live_handles == 0);
    CHECK(f.source.stats().cancels == 1);

    // A disconnect is routine: informational only
    CHECK(f.sink->has_level_at_least(LogLevel::Info));
    CHECK_FALSE(f.sink->has_level_at_least(LogLevel::Warn));
}

TEST_CASE("Disconnect before headers releases the stream", "[proxy]") {
    ProxyFixture f;
    RecordingWriter writer;
    writer.fail_commit = true;

    auto outcome = f.serve(make_request("GET", "bytes=0-99"), writer);

    CHECK(outcome.state == StreamState::Aborted);
    CHECK(outcome.bytes_sent == 0);
    CHECK(f.source.stats().open_calls == 1);
    CHECK(f.source.stats().live_handles == 0);
    CHECK_FALSE(f.sink->has_level_at_least(LogLevel::Warn));
}

TEST_CASE("Unknown resource is a 404", "[proxy]") {
    ProxyFixture f;
    RecordingWriter writer;

    auto outcome = f.serve(make_request("GET"), writer, "missing");

    CHECK(outcome.state == StreamState::NotFound);
    CHECK(writer.status == 404);
    CHECK(writer.header("Content-Type") == "application/json");
    CHECK(writer.body == R"({"error":"Content not found"})");
    CHECK(f.source.stats().open_calls == 0);
}

TEST_CASE("Backend failures before headers are a 502", "[proxy]") {
    ProxyFixture f;
    RecordingWriter writer;

    SECTION("Metadata unavailable") {
        f.source.metadata_error = SourceError::Unavailable;
        auto outcome = f.serve(make_request("GET"), writer);
        CHECK(outcome.state == StreamState::BadGateway);
        CHECK(f.source.stats().open_calls == 0);
    }

    SECTION("Open refused") {
        f.source.open_error = SourceError::Unavailable;
        auto outcome = f.serve(make_request("GET", "bytes=0-9"), writer);
        CHECK(outcome.state == StreamState::BadGateway);
        CHECK(f.source.stats().live_handles == 0);
    }

    CHECK(writer.status == 502);
    CHECK(writer.body == R"({"error":"Failed to stream content"})");
    CHECK(writer.commits == 1);
    CHECK(f.sink->has_level_at_least(LogLevel::Warn));
}

TEST_CASE("Open reporting NotFound is a 404", "[proxy]") {
    ProxyFixture f;
    f.source.open_error = SourceError::NotFound;
    RecordingWriter writer;

    auto outcome = f.serve(make_request("GET"), writer);

    CHECK(outcome.state == StreamState::NotFound);
    CHECK(writer.status == 404);
}

TEST_CASE("Truncated backend stream aborts the response", "[proxy]") {
    ProxyFixture f;
    f.source.fail_after = 120;
    RecordingWriter writer;

    auto outcome = f.serve(make_request("GET", "bytes=0-299"), writer);

    CHECK(outcome.state == StreamState::Aborted);
    CHECK(outcome.bytes_sent == 120);
    CHECK(writer.status == 206);
    CHECK(writer.aborted);
    CHECK(f.source.stats().live_handles == 0);
    CHECK(f.sink->has_level_at_least(LogLevel::Warn));
}

TEST_CASE("HEAD sends headers without opening a stream", "[proxy]") {
    ProxyFixture f;
    RecordingWriter writer;

    auto outcome = f.serve(make_request("HEAD", "bytes=200-499"), writer);

    CHECK(outcome.state == StreamState::Completed);
    CHECK(writer.status == 206);
    CHECK(writer.header("Content-Length") == "300");
    CHECK(writer.body.empty());
    CHECK(f.source.stats().open_calls == 0);
}

TEST_CASE("HEAD of a failing resource gets error headers only", "[proxy]") {
    ProxyFixture f;
    RecordingWriter writer;

    SECTION("Unknown resource") {
        auto outcome = f.serve(make_request("HEAD"), writer, "missing");
        CHECK(outcome.state == StreamState::NotFound);
        CHECK(writer.status == 404);
        CHECK(writer.header("Content-Length") == "29");
    }

    SECTION("Backend unavailable") {
        f.source.metadata_error = SourceError::Unavailable;
        auto outcome = f.serve(make_request("HEAD"), writer);
        CHECK(outcome.state == StreamState::BadGateway);
        CHECK(writer.status == 502);
    }

    CHECK(writer.body.empty());
    CHECK(writer.commits == 1);
    CHECK_FALSE(writer.aborted);
    CHECK(f.source.stats().open_calls == 0);
}

TEST_CASE("Outcome is logged with structured fields", "[proxy]") {
    ProxyFixture f;
    RecordingWriter writer;

    (void)f.serve(make_request("GET", "bytes=0-9"), writer);

    REQUIRE_FALSE(f.sink->entries.empty());
    const auto& last = f.sink->entries.back();
    CHECK(last.level == LogLevel::Info);

    auto field = [&](std::string_view key) -> std::string {
        for (const auto& [k, v] : last.fields) {
            if (k == key) return v;
        }
        return {};
    };
    CHECK(field("id") == "file");
    CHECK(field("status") == "206");
    CHECK(field("bytes") == "10");
    CHECK(field("outcome") == "completed");
}
