#include "streamgate/drive/drive_source.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <coroutine>
#include <deque>
#include <iterator>
#include <mutex>
#include <utility>

#include "streamgate/core/json.hpp"
#include "streamgate/net/io_context.hpp"
#include "streamgate/util/from_string.hpp"
#include "streamgate/util/offload.hpp"

namespace streamgate::drive {

using stream::ByteRange;
using stream::ChildEntry;
using stream::ResourceId;
using stream::ResourceMetadata;
using stream::SourceResult;
using stream::StreamHandle;

namespace {

constexpr std::string_view list_fields = "files(id,name,mimeType,size),nextPageToken";
constexpr std::string_view fallback_media_type = "application/octet-stream";

std::string json_string(const JsonValue& object, std::string_view key) {
    const JsonValue* value = object.get(key);
    if (value && value->is_string()) {
        return value->as_string();
    }
    return {};
}

// Drive encodes int64 fields as JSON strings
std::optional<int64_t> json_size(const JsonValue& object) {
    const JsonValue* value = object.get("size");
    if (!value) {
        return std::nullopt;
    }
    if (value->is_string()) {
        auto parsed = from_string<int64_t>(value->as_string());
        if (parsed && *parsed >= 0) {
            return *parsed;
        }
        return std::nullopt;
    }
    if (value->is_number() && value->as_number() >= 0) {
        return value->as_int();
    }
    return std::nullopt;
}

expected<JsonValue, SourceError> parse_object(std::string_view body) {
    auto doc = streamgate::json::parse(body);
    if (!doc || !doc->is_object()) {
        return unexpected(SourceError::Unavailable);
    }
    return std::move(*doc);
}

// Drive query literals are single-quoted with backslash escapes
std::string quote_literal(std::string_view value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '\'';
    return out;
}

std::string file_url(std::string_view api_base, std::string_view file_id) {
    std::string url(api_base);
    url += "/files/";
    url += url_encode(file_id);
    return url;
}

// ============================================================================
// Transfer state shared by a DriveStreamHandle and its producer thread
// ============================================================================

struct TransferState {
    std::mutex mutex;
    std::condition_variable space;
    std::deque<std::string> chunks;
    bool finished = false;
    std::optional<SourceError> error;

    // Consumer parked in DataAwaiter, resumed on the loop it suspended on
    std::coroutine_handle<> waiter;
    net::Dispatcher waiter_dispatch;

    std::atomic<bool> cancelled{false};

    // Hands the parked consumer, if any, back to its loop. Releases the lock.
    void wake(std::unique_lock<std::mutex>& lock) {
        auto handle = std::exchange(waiter, nullptr);
        auto dispatch = std::move(waiter_dispatch);
        lock.unlock();
        if (handle) {
            dispatch([handle] { handle.resume(); });
        }
    }
};

// Suspends until a chunk is queued or the transfer has finished
class DataAwaiter {
    TransferState& state_;

    bool ready() const { return !state_.chunks.empty() || state_.finished; }

public:
    explicit DataAwaiter(TransferState& state) : state_(state) {}

    bool await_ready() {
        std::lock_guard lock(state_.mutex);
        return ready();
    }

    bool await_suspend(std::coroutine_handle<> h) {
        std::lock_guard lock(state_.mutex);
        if (ready()) {
            return false;
        }
        state_.waiter = h;
        state_.waiter_dispatch = net::current_dispatcher();
        return true;
    }

    void await_resume() noexcept {}
};

// ============================================================================
// Producer - Runs one alt=media download on its own thread
// ============================================================================

class Producer {
public:
    Producer(std::shared_ptr<TransferState> state, std::string url, std::string authorization,
             std::optional<ByteRange> range, const DriveOptions& options)
        : state_(std::move(state)),
          url_(std::move(url)),
          authorization_(std::move(authorization)),
          range_(std::move(range)),
          chunk_size_(std::max<size_t>(options.chunk_size, 1)),
          queue_depth_(std::max<size_t>(options.queue_depth, 1)),
          connect_timeout_(options.http.connect_timeout),
          stall_timeout_(options.stall_timeout) {}

    void run() {
        std::optional<SourceError> error;
        try {
            // Handle dropped while this download waited for a thread
            if (!state_->cancelled.load()) {
                error = transfer();
            }
        } catch (const std::exception&) {
            error = SourceError::Unavailable;
        }
        std::unique_lock lock(state_->mutex);
        state_->finished = true;
        state_->error = error;
        state_->wake(lock);
    }

private:
    std::optional<SourceError> transfer() {
        auto curl = make_easy();
        curl_ = curl.get();

        std::vector<std::string> headers{"Authorization: " + authorization_};
        if (range_) {
            headers.push_back("Range: " + range_->request_header());
        }
        auto header_list = make_header_list(headers);

        curl_easy_setopt(curl_, CURLOPT_URL, url_.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout_.count()));
        curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_TIME, static_cast<long>(stall_timeout_.count()));
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, on_data);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, this);
        curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, on_progress);
        curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, this);
        curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);

        CURLcode rc = curl_easy_perform(curl_);

        if (state_->cancelled.load()) {
            return std::nullopt;
        }
        if (error_) {
            return error_;
        }
        if (complete_) {
            return std::nullopt;
        }
        if (rc != CURLE_OK) {
            return started_ ? SourceError::Truncated : SourceError::Unavailable;
        }
        if (!started_) {
            long status = 0;
            curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
            if (status >= 400) {
                return map_status(status);
            }
            return range_ ? std::optional(SourceError::Truncated) : std::nullopt;
        }
        if (remaining_ && *remaining_ > 0) {
            return SourceError::Truncated;
        }
        return std::nullopt;
    }

    static size_t on_data(char* ptr, size_t size, size_t nmemb, void* userdata) {
        return static_cast<Producer*>(userdata)->consume(ptr, size * nmemb);
    }

    static int on_progress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
        return static_cast<Producer*>(userdata)->state_->cancelled.load() ? 1 : 0;
    }

    // Returning less than size aborts the transfer
    size_t consume(const char* data, size_t size) {
        if (state_->cancelled.load()) {
            return 0;
        }
        if (!started_) {
            started_ = true;
            long status = 0;
            curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
            if (status >= 400) {
                error_ = map_status(status);
                return 0;
            }
            if (range_) {
                remaining_ = range_->length();
                // Backend ignored the Range header and is sending the whole object
                if (status == 200) {
                    skip_ = range_->start();
                }
            } else {
                curl_off_t length = -1;
                curl_easy_getinfo(curl_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
                if (length >= 0) {
                    remaining_ = static_cast<int64_t>(length);
                }
            }
        }

        std::string_view view(data, size);
        if (skip_ > 0) {
            auto n = static_cast<size_t>(std::min<int64_t>(skip_, static_cast<int64_t>(view.size())));
            view.remove_prefix(n);
            skip_ -= static_cast<int64_t>(n);
        }
        if (remaining_ && static_cast<int64_t>(view.size()) > *remaining_) {
            view = view.substr(0, static_cast<size_t>(*remaining_));
        }

        while (!view.empty()) {
            auto piece = view.substr(0, chunk_size_);
            if (!push(piece)) {
                return 0;
            }
            view.remove_prefix(piece.size());
            if (remaining_) {
                *remaining_ -= static_cast<int64_t>(piece.size());
            }
        }

        if (remaining_ && *remaining_ == 0) {
            complete_ = true;
            return 0;
        }
        return size;
    }

    // Blocks while the queue is full, which stalls the download
    bool push(std::string_view piece) {
        std::unique_lock lock(state_->mutex);
        state_->space.wait(lock, [this] {
            return state_->cancelled.load() || state_->chunks.size() < queue_depth_;
        });
        if (state_->cancelled.load()) {
            return false;
        }
        state_->chunks.emplace_back(piece);
        state_->wake(lock);
        return true;
    }

    std::shared_ptr<TransferState> state_;
    std::string url_;
    std::string authorization_;
    std::optional<ByteRange> range_;
    size_t chunk_size_;
    size_t queue_depth_;
    std::chrono::milliseconds connect_timeout_;
    std::chrono::seconds stall_timeout_;

    CURL* curl_ = nullptr;
    bool started_ = false;
    bool complete_ = false;
    std::optional<SourceError> error_;
    int64_t skip_ = 0;
    std::optional<int64_t> remaining_;  // unknown for unranged replies without Content-Length
};

// ============================================================================
// DriveStreamHandle
// ============================================================================

class DriveStreamHandle : public StreamHandle {
    std::shared_ptr<TransferState> state_;
    std::string current_;

public:
    explicit DriveStreamHandle(std::shared_ptr<TransferState> state) : state_(std::move(state)) {}

    ~DriveStreamHandle() override { cancel(); }

    Task<SourceResult<std::string_view>> read_chunk() override {
        co_await DataAwaiter(*state_);

        std::lock_guard lock(state_->mutex);
        if (!state_->chunks.empty()) {
            current_ = std::move(state_->chunks.front());
            state_->chunks.pop_front();
            state_->space.notify_one();
            co_return std::string_view(current_);
        }
        if (state_->error) {
            co_return unexpected(*state_->error);
        }
        co_return std::string_view{};
    }

    void cancel() noexcept override {
        state_->cancelled.store(true);
        std::lock_guard lock(state_->mutex);
        state_->space.notify_all();
    }
};

} // anonymous namespace

// ============================================================================
// Wire helpers
// ============================================================================

std::string metadata_url(std::string_view api_base, std::string_view file_id, std::string_view fields) {
    return file_url(api_base, file_id) + "?" + build_query({{"fields", std::string(fields)}});
}

std::string media_url(std::string_view api_base, std::string_view file_id) {
    return file_url(api_base, file_id) + "?alt=media";
}

std::string list_url(std::string_view api_base, std::string_view folder_id, std::string_view page_token) {
    std::vector<std::pair<std::string, std::string>> params{
        {"q", quote_literal(folder_id) + " in parents and trashed=false"},
        {"fields", std::string(list_fields)},
        {"orderBy", "name"},
        {"pageSize", "1000"},
    };
    if (!page_token.empty()) {
        params.emplace_back("pageToken", std::string(page_token));
    }
    return std::string(api_base) + "/files?" + build_query(params);
}

SourceError map_status(long status) noexcept {
    return status == 404 ? SourceError::NotFound : SourceError::Unavailable;
}

expected<ResourceMetadata, SourceError> parse_metadata(std::string_view body) {
    auto doc = parse_object(body);
    if (!doc) {
        return unexpected(doc.error());
    }
    auto size = json_size(*doc);
    if (!size) {
        return unexpected(SourceError::Unavailable);
    }

    ResourceMetadata metadata;
    metadata.size = *size;
    metadata.name = json_string(*doc, "name");
    metadata.media_type = json_string(*doc, "mimeType");
    if (metadata.media_type.empty()) {
        metadata.media_type = fallback_media_type;
    }
    return metadata;
}

expected<ListPage, SourceError> parse_list_page(std::string_view body) {
    auto doc = parse_object(body);
    if (!doc) {
        return unexpected(doc.error());
    }

    ListPage page;
    page.next_page_token = json_string(*doc, "nextPageToken");

    const JsonValue* files = doc->get("files");
    if (!files) {
        return page;
    }
    if (!files->is_array()) {
        return unexpected(SourceError::Unavailable);
    }
    for (const auto& file : files->as_array()) {
        if (!file.is_object()) {
            continue;
        }
        ChildEntry entry;
        entry.id = json_string(file, "id");
        if (entry.id.empty()) {
            continue;
        }
        entry.name = json_string(file, "name");
        entry.media_type = json_string(file, "mimeType");
        entry.size = json_size(file).value_or(0);
        page.entries.push_back(std::move(entry));
    }
    return page;
}

expected<std::optional<std::string>, SourceError> parse_thumbnail_link(std::string_view body) {
    auto doc = parse_object(body);
    if (!doc) {
        return unexpected(doc.error());
    }
    std::string link = json_string(*doc, "thumbnailLink");
    if (link.empty()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>(std::move(link));
}

void sort_children(std::vector<ChildEntry>& entries) {
    std::stable_sort(entries.begin(), entries.end(), [](const ChildEntry& a, const ChildEntry& b) {
        return a.name < b.name;
    });
}

// ============================================================================
// DriveContentSource
// ============================================================================

DriveContentSource::DriveContentSource(std::shared_ptr<CredentialProvider> credentials, DriveOptions options,
                                       Logger& logger)
    : credentials_(std::move(credentials)),
      options_(std::move(options)),
      logger_(logger),
      requests_(options_.request_threads),
      streams_(options_.stream_threads) {}

expected<HttpResponse, SourceError> DriveContentSource::authorized_get(const std::string& url) const {
    auto authorization = credentials_->authorization();
    if (!authorization) {
        logger_.log(logger_.entry(LogLevel::Warn, "Drive credentials unavailable")
                        .field("error", authorization.error().message()));
        return unexpected(SourceError::Unavailable);
    }

    auto response = http_get(url, {"Authorization: " + *authorization}, options_.http);
    if (!response) {
        logger_.log(logger_.entry(LogLevel::Warn, "Drive request failed")
                        .field("error", response.error().message()));
        return unexpected(SourceError::Unavailable);
    }
    if (!response->ok()) {
        SourceError error = map_status(response->status);
        auto level = error == SourceError::NotFound ? LogLevel::Debug : LogLevel::Warn;
        logger_.log(logger_.entry(level, "Drive request refused").field("status", response->status));
        return unexpected(error);
    }
    return std::move(*response);
}

Task<SourceResult<ResourceMetadata>> DriveContentSource::get_metadata(const ResourceId& id) {
    auto url = metadata_url(options_.api_base, id, "name,mimeType,size");
    auto response = co_await offload(requests_, [this, url] { return authorized_get(url); });
    if (!response) {
        co_return unexpected(response.error());
    }
    co_return parse_metadata(response->body);
}

Task<SourceResult<std::unique_ptr<StreamHandle>>> DriveContentSource::open_stream(
    const ResourceId& id, std::optional<ByteRange> range) {
    auto authorization = co_await offload(requests_, [credentials = credentials_] {
        return credentials->authorization();
    });
    if (!authorization) {
        logger_.log(logger_.entry(LogLevel::Warn, "Drive credentials unavailable")
                        .field("error", authorization.error().message()));
        co_return unexpected(SourceError::Unavailable);
    }

    auto state = std::make_shared<TransferState>();
    auto producer = std::make_shared<Producer>(state, media_url(options_.api_base, id), std::move(*authorization),
                                               range, options_);
    auto handle = std::make_unique<DriveStreamHandle>(state);
    streams_.post([producer] { producer->run(); });

    // Refusals (404, 403, ...) surface here, before any response is committed
    co_await DataAwaiter(*state);
    std::optional<SourceError> refused;
    {
        std::lock_guard lock(state->mutex);
        if (state->chunks.empty() && state->error) {
            refused = state->error;
        }
    }
    if (refused) {
        co_return unexpected(*refused);
    }
    co_return std::unique_ptr<StreamHandle>(std::move(handle));
}

Task<SourceResult<std::vector<ChildEntry>>> DriveContentSource::list_children(const ResourceId& container_id) {
    std::vector<ChildEntry> children;
    std::string page_token;
    do {
        auto url = list_url(options_.api_base, container_id, page_token);
        auto response = co_await offload(requests_, [this, url] { return authorized_get(url); });
        if (!response) {
            co_return unexpected(response.error());
        }
        auto page = parse_list_page(response->body);
        if (!page) {
            co_return unexpected(page.error());
        }
        std::move(page->entries.begin(), page->entries.end(), std::back_inserter(children));
        page_token = std::move(page->next_page_token);
    } while (!page_token.empty());

    sort_children(children);
    co_return children;
}

Task<SourceResult<std::optional<std::string>>> DriveContentSource::get_thumbnail_ref(const ResourceId& id) {
    auto url = metadata_url(options_.api_base, id, "thumbnailLink");
    auto response = co_await offload(requests_, [this, url] { return authorized_get(url); });
    if (!response) {
        co_return unexpected(response.error());
    }
    co_return parse_thumbnail_link(response->body);
}

} // namespace streamgate::drive
