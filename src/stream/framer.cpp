#include "streamgate/stream/framer.hpp"
#include "streamgate/core/request.hpp"

namespace streamgate::stream {

int64_t ResponsePlan::body_length() const {
    if (status == 416) {
        return 0;
    }
    auto length = header("Content-Length");
    if (!length) {
        return 0;
    }
    return parse_optional<int64_t>(*length).value_or(0);
}

std::optional<std::string_view> ResponsePlan::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (iequals(key, name)) {
            return std::string_view(value);
        }
    }
    return std::nullopt;
}

ResponsePlan frame(const ResourceMetadata& metadata, const RangeResult& range) {
    ResponsePlan plan;

    if (!range && range.error() == RangeError::Unsatisfiable) {
        plan.status = 416;
        plan.headers.emplace_back("Content-Range", "bytes */" + std::to_string(metadata.size));
        return plan;
    }

    // Malformed ranges are served as full content
    if (!range || !range->has_value()) {
        plan.status = 200;
        plan.headers.emplace_back("Content-Length", std::to_string(metadata.size));
        plan.headers.emplace_back("Content-Type", metadata.media_type);
        return plan;
    }

    const ByteRange& r = **range;
    plan.status = 206;
    plan.headers.emplace_back("Content-Range", r.content_range());
    plan.headers.emplace_back("Accept-Ranges", "bytes");
    plan.headers.emplace_back("Content-Length", std::to_string(r.length()));
    plan.headers.emplace_back("Content-Type", metadata.media_type);
    plan.range = r;
    return plan;
}

} // namespace streamgate::stream
