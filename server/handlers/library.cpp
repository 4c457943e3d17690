#include "library.hpp"
#include "services/library.hpp"

namespace mediahub::handlers::library {

using streamgate::Request;
using streamgate::Response;
using streamgate::Task;

void register_routes(streamgate::App& app, services::LibraryService& library) {
    app.get("/api/library/{type}", [&library](Request& req) -> Task<Response> {
        const std::string& type = req.route_params().at(0);
        auto kind = services::parse_library_kind(type);
        if (!kind) {
            co_return Response::error(400, "Invalid content type");
        }

        auto items = co_await library.list(*kind);
        if (!items) {
            auto entry = streamgate::default_logger().entry(streamgate::LogLevel::Warn, "Library listing failed");
            entry.field("type", type);
            entry.field("error", streamgate::to_string(items.error()));
            streamgate::default_logger().log(entry);
            co_return Response::error(500, "Failed to fetch content library");
        }

        co_return Response::json(services::LibraryService::to_json(*items).dump());
    });
}

} // namespace mediahub::handlers::library
