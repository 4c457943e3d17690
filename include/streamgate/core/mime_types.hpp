#pragma once

#include <string_view>

namespace streamgate {

// ============================================================================
// MIME Types
// ============================================================================

class MimeTypes {
public:
    // Extension without the dot, case-insensitive
    static std::string_view get(std::string_view extension) noexcept;

    // application/octet-stream when the name has no known extension
    static std::string_view from_path(std::string_view path) noexcept;
};

} // namespace streamgate
