#include "streamgate/stream/response_writer.hpp"

#include <system_error>

namespace streamgate::stream {

Task<WriteStatus> ResponseWriter::send(const Response& response) {
    auto committed = co_await commit(response.status(), response.headers());
    if (!committed) {
        co_return committed;
    }
    if (!response.body().empty()) {
        co_return co_await write(response.body());
    }
    co_return WriteStatus{};
}

Task<WriteStatus> ConnectionResponseWriter::commit(int status, const Response::Headers& headers) {
    if (committed_) {
        throw std::system_error(make_error_code(ProtocolError::AlreadyCommitted),
                                "response headers already sent");
    }
    committed_ = true;

    Response head(status, headers, "");
    for (const auto& [key, value] : extra_headers_) {
        head.set_header(key, value);
    }
    // Without a length the body would run to connection close
    if (!head.header("Content-Length") && !head.header("Transfer-Encoding")) {
        head.set_header("Content-Length", "0");
    }
    if (keep_alive_) {
        head.set_header("Connection", "keep-alive");
    } else {
        head.set_header("Connection", "close");
    }

    std::string data = head.serialize_headers();
    auto result = co_await conn_.async_write_all(data.data(), data.size());
    if (!result) {
        aborted_ = true;
        co_return unexpected(result.error());
    }
    co_return WriteStatus{};
}

Task<WriteStatus> ConnectionResponseWriter::write(std::string_view chunk) {
    if (!committed_) {
        co_return unexpected(Error::io(IoError::InvalidArgument, "write before commit"));
    }
    if (aborted_) {
        co_return unexpected(Error::io(IoError::ConnectionAborted, "response aborted"));
    }
    if (head_) {
        co_return WriteStatus{};
    }

    auto result = co_await conn_.async_write_all(chunk.data(), chunk.size());
    if (!result) {
        aborted_ = true;
        co_return unexpected(result.error());
    }
    body_bytes_ += *result;
    co_return WriteStatus{};
}

} // namespace streamgate::stream
