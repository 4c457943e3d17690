#include "stream.hpp"

namespace mediahub::handlers::stream {

void register_routes(streamgate::App& app, streamgate::stream::StreamingProxy& proxy) {
    app.stream("/api/stream/{id}",
               [&proxy](streamgate::Request& req, streamgate::stream::ResponseWriter& writer)
                   -> streamgate::Task<void> {
        const std::string id = req.route_params().at(0);
        // The proxy logs the outcome itself
        co_await proxy.serve(req, id, writer);
    });
}

} // namespace mediahub::handlers::stream
