#include "server.hpp"

#include "handlers/library.hpp"
#include "handlers/manifest.hpp"
#include "handlers/stream.hpp"
#include "handlers/thumbnail.hpp"
#include "services/library.hpp"

#include "streamgate/core/cors.hpp"
#include "streamgate/core/logging.hpp"
#include "streamgate/drive/credentials.hpp"
#include "streamgate/drive/drive_source.hpp"
#include "streamgate/stream/proxy.hpp"

namespace mediahub {

namespace {

std::unique_ptr<streamgate::stream::ContentSource> make_drive_source(const Config& config) {
    auto secrets = streamgate::drive::parse_client_secrets(config.google_credentials);
    if (!secrets) {
        throw ConfigError("GOOGLE_CREDENTIALS: " + std::string(secrets.error().message()));
    }
    auto credentials = std::make_shared<streamgate::drive::RefreshTokenCredentials>(
        std::move(*secrets), config.refresh_token);

    streamgate::drive::DriveOptions options;
    options.api_base = config.drive_api_base;
    return std::make_unique<streamgate::drive::DriveContentSource>(std::move(credentials), std::move(options));
}

streamgate::CorsOptions cors_options(const Config& config) {
    streamgate::CorsOptions options;
    options.allow_origin = config.cors_origin;
    return options;
}

} // anonymous namespace

Server::Server(const Config& config)
    : Server(config, make_drive_source(config)) {}

Server::Server(const Config& config, std::unique_ptr<streamgate::stream::ContentSource> source)
    : config_(config)
    , source_(std::move(source))
    , proxy_(std::make_unique<streamgate::stream::StreamingProxy>(*source_))
    , library_(std::make_unique<services::LibraryService>(*source_, config_.folders))
{
    app_.threads(config_.threads);
    setup_middleware();
    setup_routes();
}

Server::~Server() = default;

void Server::setup_middleware() {
    // Request logging (outermost - runs first)
    app_.use(streamgate::request_logger());

    app_.use(streamgate::cors(cors_options(config_)));

    // Stream routes bypass the middleware chain
    app_.stream_headers(streamgate::cors_headers(cors_options(config_)));
}

void Server::setup_routes() {
    handlers::stream::register_routes(app_, *proxy_);
    handlers::library::register_routes(app_, *library_);
    handlers::thumbnail::register_routes(app_, *source_, config_.default_thumbnail);
    handlers::manifest::register_routes(app_);
}

void Server::run() {
    auto entry = streamgate::default_logger().entry(streamgate::LogLevel::Info, "Starting media server");
    entry.field("port", config_.port);
    entry.field("threads", config_.threads);
    entry.field("drive", config_.drive_api_base);
    streamgate::default_logger().log(entry);

    app_.run(config_.port);
}

void Server::stop() {
    app_.stop();
}

} // namespace mediahub
