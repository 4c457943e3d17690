#pragma once

#include "streamgate/core/app.hpp"

namespace mediahub::services {
    class LibraryService;
}

namespace mediahub::handlers::library {

// GET /api/library/{type}
void register_routes(streamgate::App& app, services::LibraryService& library);

} // namespace mediahub::handlers::library
