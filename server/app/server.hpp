#pragma once

#include <memory>

#include "config.hpp"
#include "streamgate/core/app.hpp"

namespace streamgate::stream {
    class ContentSource;
    class StreamingProxy;
}

namespace mediahub::services {
    class LibraryService;
}

namespace mediahub {

class Server {
public:
    // Throws ConfigError when the Google credentials cannot be read
    explicit Server(const Config& config);

    // For tests: serve from an arbitrary backend
    Server(const Config& config, std::unique_ptr<streamgate::stream::ContentSource> source);

    ~Server();

    // Start the server (blocking)
    void run();

    // Stop the server
    void stop();

    // Access the underlying App (for testing)
    streamgate::App& app() { return app_; }

private:
    void setup_middleware();
    void setup_routes();

    Config config_;
    streamgate::App app_;

    // Order matters for initialization
    std::unique_ptr<streamgate::stream::ContentSource> source_;
    std::unique_ptr<streamgate::stream::StreamingProxy> proxy_;
    std::unique_ptr<services::LibraryService> library_;
};

} // namespace mediahub
