#include "thumbnail.hpp"

#include <system_error>

#include "streamgate/core/logging.hpp"
#include "streamgate/core/mime_types.hpp"

namespace mediahub::handlers::thumbnail {

using streamgate::Request;
using streamgate::Response;
using streamgate::Task;

Response default_thumbnail(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Response::error(404, "Thumbnail not found");
    }
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return Response::error(404, "Thumbnail not found");
    }
    return Response::file(path, streamgate::MimeTypes::from_path(path.string()), static_cast<size_t>(size));
}

void register_routes(streamgate::App& app, streamgate::stream::ContentSource& source,
                     std::filesystem::path default_path) {
    app.get("/api/thumbnail/{id}",
            [&source, default_path = std::move(default_path)](Request& req) -> Task<Response> {
        const std::string id = req.route_params().at(0);
        auto ref = co_await source.get_thumbnail_ref(id);
        if (!ref) {
            auto entry = streamgate::default_logger().entry(streamgate::LogLevel::Warn, "Thumbnail lookup failed");
            entry.field("id", id);
            entry.field("error", streamgate::to_string(ref.error()));
            streamgate::default_logger().log(entry);
            co_return Response::error(500, "Failed to fetch thumbnail");
        }
        if (*ref) {
            co_return Response::redirect(**ref);
        }
        co_return default_thumbnail(default_path);
    });
}

} // namespace mediahub::handlers::thumbnail
