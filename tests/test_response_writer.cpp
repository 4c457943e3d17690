#include <catch2/catch_test_macros.hpp>
#include <streamgate/stream/proxy.hpp>
#include <streamgate/stream/response_writer.hpp>

#include <system_error>

#include "support/fakes.hpp"

using namespace streamgate;
using namespace streamgate::stream;

namespace {

// Collects written bytes; can refuse writes to simulate a closed peer
class MockConnection : public net::Connection {
public:
    std::string written;
    bool open = true;
    bool fail_writes = false;

    Task<net::ReadResult> async_read(void*, size_t) override {
        co_return net::ReadResult(0);
    }

    Task<net::WriteResult> async_write(const void* buffer, size_t len) override {
        return async_write_all(buffer, len);
    }

    Task<net::WriteResult> async_write_all(const void* buffer, size_t len) override {
        if (fail_writes) {
            open = false;
            co_return unexpected(Error::io(IoError::ConnectionReset, "reset by peer"));
        }
        written.append(static_cast<const char*>(buffer), len);
        co_return net::WriteResult(len);
    }

    Task<net::TransmitResult> async_transmit_file(net::FileHandle, size_t, size_t) override {
        co_return unexpected(Error::io(IoError::InvalidArgument, "not supported"));
    }

    void close() override { open = false; }
    bool is_open() const noexcept override { return open; }
    void set_timeout(std::chrono::milliseconds) override {}
    std::string remote_address() const override { return "127.0.0.1"; }
    uint16_t remote_port() const noexcept override { return 0; }
    void set_cancellation_token(CancellationToken) override {}
};

} // namespace

TEST_CASE("Commit sends status line and headers", "[response_writer]") {
    MockConnection conn;
    ConnectionResponseWriter writer(conn, {{"Access-Control-Allow-Origin", "*"}}, true);

    auto result = writer.commit(206, {{"Content-Length", "3"}}).sync_wait();
    REQUIRE(result.has_value());
    CHECK(writer.committed());

    CHECK(conn.written.starts_with("HTTP/1.1 206 Partial Content\r\n"));
    CHECK(conn.written.find("Content-Length: 3\r\n") != std::string::npos);
    CHECK(conn.written.find("Access-Control-Allow-Origin: *\r\n") != std::string::npos);
    CHECK(conn.written.find("Connection: keep-alive\r\n") != std::string::npos);
    CHECK(conn.written.ends_with("\r\n\r\n"));
}

TEST_CASE("Second commit is a protocol error", "[response_writer]") {
    MockConnection conn;
    ConnectionResponseWriter writer(conn, {}, false);

    REQUIRE(writer.commit(200, {{"Content-Length", "0"}}).sync_wait().has_value());

    try {
        (void)writer.commit(200, {}).sync_wait();
        FAIL("second commit did not throw");
    } catch (const std::system_error& e) {
        CHECK(e.code() == make_error_code(ProtocolError::AlreadyCommitted));
    }
}

TEST_CASE("Body writes follow the commit", "[response_writer]") {
    MockConnection conn;
    ConnectionResponseWriter writer(conn, {}, true);

    SECTION("Write before commit is refused") {
        auto result = writer.write("abc").sync_wait();
        CHECK_FALSE(result.has_value());
        CHECK(conn.written.empty());
    }

    SECTION("Bytes are counted") {
        REQUIRE(writer.commit(200, {{"Content-Length", "6"}}).sync_wait().has_value());
        REQUIRE(writer.write("abc").sync_wait().has_value());
        REQUIRE(writer.write("def").sync_wait().has_value());
        CHECK(writer.body_bytes() == 6);
        CHECK(conn.written.ends_with("\r\n\r\nabcdef"));
        CHECK(writer.reusable());
    }
}

TEST_CASE("Failed writes make the connection unusable", "[response_writer]") {
    MockConnection conn;
    ConnectionResponseWriter writer(conn, {}, true);
    REQUIRE(writer.commit(200, {{"Content-Length", "10"}}).sync_wait().has_value());

    conn.fail_writes = true;
    auto result = writer.write("abc").sync_wait();

    CHECK_FALSE(result.has_value());
    CHECK(writer.aborted());
    CHECK_FALSE(writer.reusable());
}

TEST_CASE("Abort forbids reuse", "[response_writer]") {
    MockConnection conn;
    ConnectionResponseWriter writer(conn, {}, true);
    REQUIRE(writer.commit(200, {{"Content-Length", "10"}}).sync_wait().has_value());

    writer.abort();

    CHECK_FALSE(writer.reusable());
    CHECK_FALSE(writer.write("abc").sync_wait().has_value());
}

TEST_CASE("Connection close is announced", "[response_writer]") {
    MockConnection conn;
    ConnectionResponseWriter writer(conn, {}, false);

    auto sent = writer.send(Response::error(404, "Content not found")).sync_wait();

    REQUIRE(sent.has_value());
    CHECK(conn.written.find("Connection: close\r\n") != std::string::npos);
    CHECK(conn.written.ends_with(R"({"error":"Content not found"})"));
    CHECK_FALSE(writer.reusable());
}

TEST_CASE("Headers without a length get Content-Length: 0", "[response_writer]") {
    MockConnection conn;
    ConnectionResponseWriter writer(conn, {}, true);

    REQUIRE(writer.commit(416, {{"Content-Range", "bytes */1000"}}).sync_wait().has_value());

    CHECK(conn.written ==
          "HTTP/1.1 416 Range Not Satisfiable\r\n"
          "Content-Range: bytes */1000\r\n"
          "Content-Length: 0\r\n"
          "Connection: keep-alive\r\n\r\n");
    CHECK(writer.reusable());
}

TEST_CASE("HEAD writer never puts body bytes on the wire", "[response_writer]") {
    MockConnection conn;
    ConnectionResponseWriter writer(conn, {}, true, true);

    auto sent = writer.send(Response::error(404, "Content not found")).sync_wait();

    REQUIRE(sent.has_value());
    CHECK(conn.written.starts_with("HTTP/1.1 404 Not Found\r\n"));
    CHECK(conn.written.find("Content-Length: 29\r\n") != std::string::npos);
    CHECK(conn.written.ends_with("\r\n\r\n"));
    CHECK(writer.body_bytes() == 0);
    CHECK(writer.reusable());
}

TEST_CASE("Proxied responses are framed on a keep-alive connection", "[response_writer][proxy]") {
    testing::FakeContentSource source;
    source.add("file", {testing::make_payload(1000), "video/mp4", "file.mp4", std::nullopt});
    Logger logger("writer-test");
    StreamingProxy proxy(source, logger);
    MockConnection conn;

    SECTION("Unsatisfiable range") {
        ConnectionResponseWriter writer(conn, {}, true);
        auto req = testing::make_request("GET", "bytes=1000-1200");

        auto outcome = proxy.serve(req, "file", writer).sync_wait();

        CHECK(outcome.state == StreamState::Unsatisfiable);
        CHECK(conn.written ==
              "HTTP/1.1 416 Range Not Satisfiable\r\n"
              "Content-Range: bytes */1000\r\n"
              "Content-Length: 0\r\n"
              "Connection: keep-alive\r\n\r\n");
        CHECK(writer.reusable());
        CHECK(source.stats().open_calls == 0);
    }

    SECTION("HEAD of an unknown resource") {
        ConnectionResponseWriter writer(conn, {}, true, true);
        auto req = testing::make_request("HEAD");

        auto outcome = proxy.serve(req, "missing", writer).sync_wait();

        CHECK(outcome.state == StreamState::NotFound);
        CHECK(conn.written.starts_with("HTTP/1.1 404 Not Found\r\n"));
        CHECK(conn.written.find("Content-Length: 29\r\n") != std::string::npos);
        CHECK(conn.written.ends_with("Connection: keep-alive\r\n\r\n"));
        CHECK(writer.reusable());
    }

    SECTION("Ranged GET carries exactly the promised body") {
        ConnectionResponseWriter writer(conn, {}, true);
        auto req = testing::make_request("GET", "bytes=200-499");

        auto outcome = proxy.serve(req, "file", writer).sync_wait();

        CHECK(outcome.state == StreamState::Completed);
        auto head_end = conn.written.find("\r\n\r\n");
        REQUIRE(head_end != std::string::npos);
        CHECK(conn.written.substr(head_end + 4) == testing::make_payload(1000).substr(200, 300));
        CHECK(writer.reusable());
    }
}
