#include "manifest.hpp"

namespace mediahub::handlers::manifest {

namespace {

streamgate::JsonValue category(std::string_view name, std::string_view endpoint) {
    auto entry = streamgate::JsonValue::object();
    entry["name"] = name;
    entry["endpoint"] = endpoint;
    return entry;
}

} // anonymous namespace

streamgate::JsonValue manifest() {
    auto doc = streamgate::JsonValue::object();
    doc["name"] = "Thư viện cá nhân";
    doc["version"] = "1.0";
    doc["description"] = "Kho nội dung cá nhân từ Google Drive";

    auto categories = streamgate::JsonValue::array();
    categories.push_back(category("Phim", "/api/library/movies"));
    categories.push_back(category("TV Shows", "/api/library/tv"));
    categories.push_back(category("Nhạc", "/api/library/music"));
    doc["categories"] = std::move(categories);
    return doc;
}

void register_routes(streamgate::App& app) {
    app.get("/api/manifest", [body = manifest().dump()](streamgate::Request&) -> streamgate::Task<streamgate::Response> {
        co_return streamgate::Response::json(body);
    });
}

} // namespace mediahub::handlers::manifest
