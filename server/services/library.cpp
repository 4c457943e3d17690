#include "library.hpp"

namespace mediahub::services {

using streamgate::JsonValue;
using streamgate::SourceError;
using streamgate::stream::ChildEntry;
using streamgate::stream::SourceResult;

std::optional<LibraryKind> parse_library_kind(std::string_view name) {
    if (name == "movies") return LibraryKind::Movies;
    if (name == "tv") return LibraryKind::Tv;
    if (name == "music") return LibraryKind::Music;
    return std::nullopt;
}

std::string strip_extension(std::string_view name) {
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size()) {
        return std::string(name);
    }
    if (name.find('/', dot) != std::string_view::npos) {
        return std::string(name);
    }
    return std::string(name.substr(0, dot));
}

LibraryService::LibraryService(streamgate::stream::ContentSource& source, LibraryFolders folders)
    : source_(source), folders_(std::move(folders)) {}

const std::string& LibraryService::folder_for(LibraryKind kind) const {
    switch (kind) {
        case LibraryKind::Movies: return folders_.movies;
        case LibraryKind::Tv: return folders_.tv;
        case LibraryKind::Music: return folders_.music;
    }
    return folders_.movies;
}

streamgate::Task<SourceResult<std::vector<LibraryItem>>> LibraryService::list(LibraryKind kind) {
    const std::string& folder = folder_for(kind);
    if (folder.empty()) {
        co_return streamgate::unexpected(SourceError::Unavailable);
    }

    auto children = co_await source_.list_children(folder);
    if (!children) {
        co_return streamgate::unexpected(children.error());
    }

    std::vector<LibraryItem> items;
    items.reserve(children->size());
    for (const ChildEntry& child : *children) {
        LibraryItem item;
        item.id = child.id;
        item.title = strip_extension(child.name);
        item.source = "/api/stream/" + child.id;
        item.poster = "/api/thumbnail/" + child.id;
        item.type = child.media_type;
        items.push_back(std::move(item));
    }
    co_return items;
}

JsonValue LibraryService::to_json(const std::vector<LibraryItem>& items) {
    JsonValue array = JsonValue::array();
    for (const auto& item : items) {
        JsonValue entry = JsonValue::object();
        entry["id"] = item.id;
        entry["title"] = item.title;
        entry["source"] = item.source;
        entry["poster"] = item.poster;
        entry["type"] = item.type;
        array.push_back(std::move(entry));
    }
    return array;
}

} // namespace mediahub::services
