#include "streamgate/core/cors.hpp"

namespace streamgate {

Response::Headers cors_headers(const CorsOptions& options) {
    Response::Headers headers;
    headers.emplace_back("Access-Control-Allow-Origin", options.allow_origin);
    headers.emplace_back("Access-Control-Expose-Headers", options.expose_headers);
    if (options.allow_origin != "*") {
        headers.emplace_back("Vary", "Origin");
    }
    return headers;
}

Middleware cors(CorsOptions options) {
    return [options = std::move(options)](Request& req, Next next) -> Task<Response> {
        if (req.method() == HttpMethod::OPTIONS) {
            Response resp = Response::no_content();
            for (auto& [key, value] : cors_headers(options)) {
                resp.set_header(std::move(key), std::move(value));
            }
            resp.set_header("Access-Control-Allow-Methods", options.allow_methods);
            auto requested = req.header("Access-Control-Request-Headers");
            resp.set_header("Access-Control-Allow-Headers",
                            requested ? std::string(*requested) : options.allow_headers);
            resp.set_header("Access-Control-Max-Age", std::to_string(options.max_age_seconds));
            co_return resp;
        }

        Response resp = co_await next(req);
        for (auto& [key, value] : cors_headers(options)) {
            resp.set_header(std::move(key), std::move(value));
        }
        co_return resp;
    };
}

} // namespace streamgate
