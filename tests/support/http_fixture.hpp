#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include <streamgate/core/request.hpp>

namespace streamgate::testing {

// ============================================================================
// LoopbackHttpServer - One-connection-at-a-time HTTP/1.1 server on 127.0.0.1
// ============================================================================

class LoopbackHttpServer {
public:
    struct RecordedRequest {
        std::string method;
        std::string target;
        std::map<std::string, std::string> headers;  // lowercased names

        std::string header(std::string_view name) const {
            auto it = headers.find(to_lower(name));
            return it == headers.end() ? std::string() : it->second;
        }
    };

    // Writes the whole response on fd; the connection is closed afterwards
    using Responder = std::function<void(LoopbackHttpServer& server, int fd, const RecordedRequest& request)>;

    explicit LoopbackHttpServer(Responder responder) : responder_(std::move(responder)) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            throw std::system_error(errno, std::generic_category(), "socket");
        }
        int reuse = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 ||
            ::listen(listen_fd_, 16) < 0) {
            int err = errno;
            ::close(listen_fd_);
            throw std::system_error(err, std::generic_category(), "bind/listen");
        }
        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { accept_loop(); });
    }

    ~LoopbackHttpServer() {
        ::shutdown(listen_fd_, SHUT_RDWR);
        ::close(listen_fd_);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    LoopbackHttpServer(const LoopbackHttpServer&) = delete;
    LoopbackHttpServer& operator=(const LoopbackHttpServer&) = delete;

    std::string base_url() const { return "http://127.0.0.1:" + std::to_string(port_); }

    std::vector<RecordedRequest> requests() const {
        std::lock_guard lock(mutex_);
        return requests_;
    }

    // Bytes the responders managed to hand to the kernel
    size_t bytes_sent() const noexcept { return bytes_sent_.load(); }

    // Set once a responder saw the client go away mid-write
    bool client_closed() const noexcept { return client_closed_.load(); }

    // Set after a responder returned
    size_t responses_finished() const noexcept { return finished_.load(); }

    // Sends everything or stops at the first failed send
    bool send_all(int fd, std::string_view data) {
        while (!data.empty()) {
            ssize_t n = ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
            if (n <= 0) {
                client_closed_.store(true);
                return false;
            }
            data.remove_prefix(static_cast<size_t>(n));
            bytes_sent_.fetch_add(static_cast<size_t>(n));
        }
        return true;
    }

    // Status line and headers with a Content-Length
    static std::string head(int status, std::string_view reason, size_t content_length,
                            std::vector<std::string> extra = {}) {
        std::string out = "HTTP/1.1 " + std::to_string(status) + " " + std::string(reason) + "\r\n";
        out += "Content-Length: " + std::to_string(content_length) + "\r\n";
        for (const auto& line : extra) {
            out += line + "\r\n";
        }
        out += "Connection: close\r\n\r\n";
        return out;
    }

private:
    void accept_loop() {
        for (;;) {
            int fd = ::accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return;
            }
            RecordedRequest request;
            if (read_request(fd, request)) {
                {
                    std::lock_guard lock(mutex_);
                    requests_.push_back(request);
                }
                responder_(*this, fd, request);
            }
            ::close(fd);
            finished_.fetch_add(1);
        }
    }

    static bool read_request(int fd, RecordedRequest& request) {
        std::string data;
        char buffer[4096];
        while (data.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                return false;
            }
            data.append(buffer, static_cast<size_t>(n));
        }

        std::string_view head(data);
        head = head.substr(0, head.find("\r\n\r\n"));
        auto line_end = head.find("\r\n");
        std::string_view request_line = head.substr(0, line_end);
        auto first_space = request_line.find(' ');
        auto second_space = request_line.find(' ', first_space + 1);
        request.method = std::string(request_line.substr(0, first_space));
        request.target = std::string(request_line.substr(first_space + 1, second_space - first_space - 1));

        while (line_end != std::string_view::npos) {
            head.remove_prefix(line_end + 2);
            line_end = head.find("\r\n");
            std::string_view line = head.substr(0, line_end);
            auto colon = line.find(':');
            if (colon == std::string_view::npos) {
                continue;
            }
            std::string_view value = line.substr(colon + 1);
            while (!value.empty() && value.front() == ' ') {
                value.remove_prefix(1);
            }
            request.headers[to_lower(line.substr(0, colon))] = std::string(value);
        }
        return true;
    }

    Responder responder_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<RecordedRequest> requests_;
    std::atomic<size_t> bytes_sent_{0};
    std::atomic<bool> client_closed_{false};
    std::atomic<size_t> finished_{0};
};

} // namespace streamgate::testing
