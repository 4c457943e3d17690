#include <catch2/catch_test_macros.hpp>
#include <streamgate/core/json.hpp>

using namespace streamgate;

TEST_CASE("JSON serialization", "[json]") {
    SECTION("object keeps insertion order") {
        JsonValue doc = JsonValue::object();
        doc["name"] = "Nhạc";
        doc["endpoint"] = "/api/library/music";
        REQUIRE(doc.dump() == R"({"name":"Nhạc","endpoint":"/api/library/music"})");
    }

    SECTION("assigning an existing key replaces it") {
        JsonValue doc = JsonValue::object();
        doc["a"] = 1;
        doc["a"] = 2;
        REQUIRE(doc.size() == 1);
        REQUIRE(doc.dump() == R"({"a":2})");
    }

    SECTION("arrays and scalars") {
        JsonValue arr = JsonValue::array();
        arr.push_back(true);
        arr.push_back(nullptr);
        arr.push_back(int64_t{5368709120});
        arr.push_back(1.5);
        REQUIRE(arr.dump() == "[true,null,5368709120,1.5]");
    }

    SECTION("control characters are escaped") {
        JsonValue s = std::string("line\n\t\"end\"");
        REQUIRE(s.dump() == R"("line\n\t\"end\"")");
    }

    SECTION("pretty printing") {
        JsonValue doc = JsonValue::object();
        doc["k"] = "v";
        REQUIRE(doc.dump(2) == "{\n  \"k\": \"v\"\n}");
    }
}

TEST_CASE("JSON parsing", "[json]") {
    SECTION("Drive file listing") {
        auto doc = json::parse(R"({
            "nextPageToken": "abc",
            "files": [
                {"id": "1", "name": "b.mkv", "mimeType": "video/x-matroska", "size": "1024"},
                {"id": "2", "name": "a.mp3", "mimeType": "audio/mpeg"}
            ]
        })");
        REQUIRE(doc.has_value());
        REQUIRE(doc->is_object());

        const JsonValue* files = doc->get("files");
        REQUIRE(files != nullptr);
        REQUIRE(files->is_array());
        REQUIRE(files->size() == 2);
        REQUIRE((*files)[0].get("size")->as_string() == "1024");
        REQUIRE_FALSE((*files)[1].contains("size"));
    }

    SECTION("numbers") {
        auto doc = json::parse(R"({"expires_in": 3599, "ratio": -0.25})");
        REQUIRE(doc.has_value());
        REQUIRE(doc->get("expires_in")->as_int() == 3599);
        REQUIRE(doc->get("ratio")->as_number() == -0.25);
    }

    SECTION("unicode escapes") {
        auto doc = json::parse(R"(["Nh\u1ea1c", "\ud83c\udfac"])");
        REQUIRE(doc.has_value());
        REQUIRE(doc->as_array()[0].as_string() == "Nhạc");
        REQUIRE((*doc)[1].as_string() == "\xF0\x9F\x8E\xAC");
    }

    SECTION("round trip keeps values") {
        auto doc = json::parse(R"({"a":[1,2,{"b":null}],"c":false})");
        REQUIRE(doc.has_value());
        REQUIRE(doc->dump() == R"({"a":[1,2,{"b":null}],"c":false})");
    }
}

TEST_CASE("JSON parse errors", "[json]") {
    SECTION("truncated input") {
        auto doc = json::parse(R"({"a": )");
        REQUIRE_FALSE(doc.has_value());
        REQUIRE(doc.error().http_status() == 400);
    }

    SECTION("trailing garbage") {
        REQUIRE_FALSE(json::parse("{} x").has_value());
    }

    SECTION("empty input") {
        REQUIRE_FALSE(json::parse("").has_value());
    }
}
