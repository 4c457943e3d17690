#include <catch2/catch_test_macros.hpp>
#include <streamgate/drive/drive_source.hpp>

using namespace streamgate;
using namespace streamgate::drive;

constexpr std::string_view base = "https://drive.example/v3";

TEST_CASE("Percent-encoding", "[drive][http]") {
    CHECK(url_encode("abcXYZ019-_.~") == "abcXYZ019-_.~");
    CHECK(url_encode("a b") == "a%20b");
    CHECK(url_encode("x=y&z") == "x%3Dy%26z");
    CHECK(url_encode("'folder'") == "%27folder%27");
    CHECK(url_encode("\xc3\xa9") == "%C3%A9");
    CHECK(url_encode("") == "");
}

TEST_CASE("Query strings", "[drive][http]") {
    CHECK(build_query({}) == "");
    CHECK(build_query({{"alt", "media"}}) == "alt=media");
    CHECK(build_query({{"a", "1"}, {"b c", "d/e"}}) == "a=1&b%20c=d%2Fe");
}

TEST_CASE("Drive URLs", "[drive]") {
    SECTION("Metadata") {
        CHECK(metadata_url(base, "abc123", "size,mimeType") ==
              "https://drive.example/v3/files/abc123?fields=size%2CmimeType");
    }

    SECTION("Media download") {
        CHECK(media_url(base, "abc123") == "https://drive.example/v3/files/abc123?alt=media");
    }

    SECTION("File ids are encoded") {
        CHECK(media_url(base, "../x") == "https://drive.example/v3/files/..%2Fx?alt=media");
    }

    SECTION("Folder listing") {
        auto url = list_url(base, "folder1", "");
        CHECK(url.starts_with("https://drive.example/v3/files?q=%27folder1%27%20in%20parents%20and%20trashed%3Dfalse&"));
        CHECK(url.find("orderBy=name") != std::string::npos);
        CHECK(url.find("pageSize=1000") != std::string::npos);
        CHECK(url.find("nextPageToken") != std::string::npos);
        CHECK(url.find("pageToken=") == std::string::npos);
    }

    SECTION("Folder listing continues from a page token") {
        auto url = list_url(base, "folder1", "tok/2");
        CHECK(url.ends_with("&pageToken=tok%2F2"));
    }

    SECTION("Quotes in folder ids are escaped") {
        auto url = list_url(base, "it's", "");
        CHECK(url.find("q=%27it%5C%27s%27") != std::string::npos);
    }
}

TEST_CASE("Status mapping", "[drive]") {
    CHECK(map_status(404) == SourceError::NotFound);
    CHECK(map_status(403) == SourceError::Unavailable);
    CHECK(map_status(401) == SourceError::Unavailable);
    CHECK(map_status(500) == SourceError::Unavailable);
}

TEST_CASE("File metadata", "[drive]") {
    SECTION("Size as a decimal string") {
        auto metadata = parse_metadata(R"({"size":"104857600","mimeType":"video/x-matroska","name":"Film.mkv"})");
        REQUIRE(metadata.has_value());
        CHECK(metadata->size == 104857600);
        CHECK(metadata->media_type == "video/x-matroska");
        CHECK(metadata->name == "Film.mkv");
    }

    SECTION("Size as a number") {
        auto metadata = parse_metadata(R"({"size":1000,"mimeType":"audio/mpeg"})");
        REQUIRE(metadata.has_value());
        CHECK(metadata->size == 1000);
    }

    SECTION("Empty file") {
        auto metadata = parse_metadata(R"({"size":"0","mimeType":"text/plain"})");
        REQUIRE(metadata.has_value());
        CHECK(metadata->size == 0);
    }

    SECTION("Missing mimeType falls back to octet-stream") {
        auto metadata = parse_metadata(R"({"size":"10"})");
        REQUIRE(metadata.has_value());
        CHECK(metadata->media_type == "application/octet-stream");
    }

    SECTION("Native documents have no size") {
        auto metadata = parse_metadata(R"({"mimeType":"application/vnd.google-apps.document"})");
        REQUIRE_FALSE(metadata.has_value());
        CHECK(metadata.error() == SourceError::Unavailable);
    }

    SECTION("Garbage size") {
        CHECK_FALSE(parse_metadata(R"({"size":"lots"})").has_value());
        CHECK_FALSE(parse_metadata(R"({"size":"-5"})").has_value());
    }

    SECTION("Body that is not an object") {
        CHECK_FALSE(parse_metadata("[]").has_value());
        CHECK_FALSE(parse_metadata("<html>").has_value());
    }
}

TEST_CASE("Folder listing pages", "[drive]") {
    SECTION("Entries and continuation token") {
        auto page = parse_list_page(R"({
            "nextPageToken": "next",
            "files": [
                {"id": "1", "name": "b.mp4", "mimeType": "video/mp4", "size": "300"},
                {"name": "no id"},
                {"id": "2", "name": "a.mp3", "mimeType": "audio/mpeg"}
            ]
        })");
        REQUIRE(page.has_value());
        CHECK(page->next_page_token == "next");
        REQUIRE(page->entries.size() == 2);
        CHECK(page->entries[0].id == "1");
        CHECK(page->entries[0].size == 300);
        CHECK(page->entries[1].name == "a.mp3");
        CHECK(page->entries[1].size == 0);
    }

    SECTION("Empty folder") {
        auto page = parse_list_page(R"({"files":[]})");
        REQUIRE(page.has_value());
        CHECK(page->entries.empty());
        CHECK(page->next_page_token.empty());
    }

    SECTION("Files that is not an array") {
        CHECK_FALSE(parse_list_page(R"({"files":{}})").has_value());
    }
}

TEST_CASE("Thumbnail links", "[drive]") {
    auto link = parse_thumbnail_link(R"({"thumbnailLink":"https://lh3.example/thumb=s220"})");
    REQUIRE(link.has_value());
    REQUIRE(link->has_value());
    CHECK(**link == "https://lh3.example/thumb=s220");

    auto none = parse_thumbnail_link(R"({"id":"x"})");
    REQUIRE(none.has_value());
    CHECK_FALSE(none->has_value());

    CHECK_FALSE(parse_thumbnail_link("not json").has_value());
}

TEST_CASE("Children are sorted by name", "[drive]") {
    std::vector<stream::ChildEntry> entries{
        {"3", "b.mkv", "video/x-matroska", 1},
        {"1", "B.mkv", "video/x-matroska", 1},
        {"4", "a.mkv", "video/x-matroska", 1},
        {"2", "a.mkv", "video/x-matroska", 1},
    };
    sort_children(entries);

    REQUIRE(entries.size() == 4);
    CHECK(entries[0].id == "1");
    CHECK(entries[1].id == "4");
    CHECK(entries[2].id == "2");
    CHECK(entries[3].id == "3");
}
