#pragma once

#include "streamgate/core/app.hpp"
#include "streamgate/core/json.hpp"

namespace mediahub::handlers::manifest {

// Catalog descriptor advertising the library endpoints
streamgate::JsonValue manifest();

// GET /api/manifest
void register_routes(streamgate::App& app);

} // namespace mediahub::handlers::manifest
