#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "streamgate/core/logging.hpp"
#include "streamgate/drive/credentials.hpp"
#include "streamgate/drive/http.hpp"
#include "streamgate/stream/content_source.hpp"
#include "streamgate/util/worker_pool.hpp"

namespace streamgate::drive {

inline constexpr std::string_view default_api_base = "https://www.googleapis.com/drive/v3";

struct DriveOptions {
    std::string api_base{default_api_base};
    HttpOptions http;

    // Producer side of an open stream: at most queue_depth chunks of
    // chunk_size bytes are buffered before the transfer pauses
    size_t chunk_size = 64 * 1024;
    size_t queue_depth = 4;

    // A stream making no progress for this long is dropped as Unavailable
    std::chrono::seconds stall_timeout{60};

    // Threads for metadata, listing and thumbnail calls
    size_t request_threads = 4;
    // Concurrent downloads; further opens wait for a free thread
    size_t stream_threads = 16;
};

// ============================================================================
// Drive v3 wire helpers
// ============================================================================

std::string metadata_url(std::string_view api_base, std::string_view file_id, std::string_view fields);
std::string media_url(std::string_view api_base, std::string_view file_id);
std::string list_url(std::string_view api_base, std::string_view folder_id, std::string_view page_token);

// 404 is NotFound; any other failure status is Unavailable
SourceError map_status(long status) noexcept;

// Drive reports size as a decimal string; files without one (Docs, folders)
// cannot be streamed and yield Unavailable
expected<stream::ResourceMetadata, SourceError> parse_metadata(std::string_view body);

struct ListPage {
    std::vector<stream::ChildEntry> entries;
    std::string next_page_token;
};

expected<ListPage, SourceError> parse_list_page(std::string_view body);

// nullopt when the file has no thumbnail
expected<std::optional<std::string>, SourceError> parse_thumbnail_link(std::string_view body);

// Stable, case-sensitive byte order of name
void sort_children(std::vector<stream::ChildEntry>& entries);

// ============================================================================
// DriveContentSource - ContentSource over the Google Drive v3 REST API
// ============================================================================

class DriveContentSource : public stream::ContentSource {
public:
    DriveContentSource(std::shared_ptr<CredentialProvider> credentials, DriveOptions options = {},
                       Logger& logger = default_logger());

    Task<stream::SourceResult<stream::ResourceMetadata>> get_metadata(const stream::ResourceId& id) override;

    Task<stream::SourceResult<std::unique_ptr<stream::StreamHandle>>> open_stream(
        const stream::ResourceId& id, std::optional<stream::ByteRange> range) override;

    Task<stream::SourceResult<std::vector<stream::ChildEntry>>> list_children(
        const stream::ResourceId& container_id) override;

    Task<stream::SourceResult<std::optional<std::string>>> get_thumbnail_ref(const stream::ResourceId& id) override;

private:
    // Blocking; runs on an offload thread
    expected<HttpResponse, SourceError> authorized_get(const std::string& url) const;

    std::shared_ptr<CredentialProvider> credentials_;
    DriveOptions options_;
    Logger& logger_;

    // Joined on destruction, downloads first
    WorkerPool requests_;
    WorkerPool streams_;
};

} // namespace streamgate::drive
