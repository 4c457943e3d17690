#pragma once

#include "streamgate/core/app.hpp"
#include "streamgate/stream/proxy.hpp"

namespace mediahub::handlers::stream {

// GET/HEAD /api/stream/{id}
void register_routes(streamgate::App& app, streamgate::stream::StreamingProxy& proxy);

} // namespace mediahub::handlers::stream
