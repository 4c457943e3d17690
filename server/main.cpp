// Media library server: browses and streams Google Drive folders

#include "app/config.hpp"
#include "app/server.hpp"

#include <csignal>

#include "streamgate/core/logging.hpp"

namespace {
    mediahub::Server* g_server = nullptr;

    void signal_handler(int signal) {
        if (signal == SIGINT || signal == SIGTERM) {
            if (g_server) {
                g_server->stop();
            }
        }
    }
}

int main() {
    try {
        // Load configuration from environment
        auto config = mediahub::Config::from_env();
        streamgate::configure_default_logger(config.log_level, config.log_format);

        mediahub::Server server(config);
        g_server = &server;

        // Handle graceful shutdown
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        server.run();
        g_server = nullptr;
        return 0;
    } catch (const mediahub::ConfigError& e) {
        streamgate::log_error(std::string("Configuration error: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        streamgate::log_error(std::string("Fatal error: ") + e.what());
        return 1;
    }
}
