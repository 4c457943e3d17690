#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "app/config.hpp"
#include "streamgate/core/json.hpp"
#include "streamgate/stream/content_source.hpp"

namespace mediahub::services {

enum class LibraryKind { Movies, Tv, Music };

// "movies", "tv" or "music"
std::optional<LibraryKind> parse_library_kind(std::string_view name);

// Drops the last extension: "a.b.mkv" -> "a.b". Dotfiles and names ending
// in a dot are kept whole.
std::string strip_extension(std::string_view name);

struct LibraryItem {
    std::string id;
    std::string title;
    std::string source;
    std::string poster;
    std::string type;
};

class LibraryService {
public:
    LibraryService(streamgate::stream::ContentSource& source, LibraryFolders folders);

    streamgate::Task<streamgate::stream::SourceResult<std::vector<LibraryItem>>> list(LibraryKind kind);

    static streamgate::JsonValue to_json(const std::vector<LibraryItem>& items);

private:
    const std::string& folder_for(LibraryKind kind) const;

    streamgate::stream::ContentSource& source_;
    LibraryFolders folders_;
};

} // namespace mediahub::services
