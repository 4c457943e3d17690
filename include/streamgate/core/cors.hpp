#pragma once

#include <string>

#include "streamgate/core/middleware.hpp"
#include "streamgate/core/response.hpp"

namespace streamgate {

// ============================================================================
// CORS
// ============================================================================

struct CorsOptions {
    std::string allow_origin = "*";
    std::string allow_methods = "GET, HEAD, OPTIONS";
    // Used when a preflight names no Access-Control-Request-Headers
    std::string allow_headers = "Range";
    std::string expose_headers = "Content-Range, Accept-Ranges, Content-Length";
    int max_age_seconds = 86400;
};

// Headers every cross-origin response carries
Response::Headers cors_headers(const CorsOptions& options);

// Decorates routed responses and answers OPTIONS preflights with 204
Middleware cors(CorsOptions options = {});

} // namespace streamgate
