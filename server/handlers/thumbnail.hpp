#pragma once

#include <filesystem>

#include "streamgate/core/app.hpp"
#include "streamgate/core/response.hpp"
#include "streamgate/stream/content_source.hpp"

namespace mediahub::handlers::thumbnail {

// The fallback image, or 404 when it is missing
streamgate::Response default_thumbnail(const std::filesystem::path& path);

// GET /api/thumbnail/{id}
void register_routes(streamgate::App& app, streamgate::stream::ContentSource& source,
                     std::filesystem::path default_path);

} // namespace mediahub::handlers::thumbnail
