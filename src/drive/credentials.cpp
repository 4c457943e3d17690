#include "streamgate/drive/credentials.hpp"

#include <system_error>

#include "streamgate/core/json.hpp"

namespace streamgate::drive {

namespace {

// Tokens this close to expiry are refreshed rather than handed out
constexpr auto refresh_margin = std::chrono::minutes(5);
constexpr int64_t default_expires_in = 3600;

Error unavailable(std::string message) {
    return Error::source(SourceError::Unavailable, std::move(message));
}

// A malformed secrets file is a configuration problem, not a request error
Error invalid_secrets(std::string message) {
    return Error(std::make_error_code(std::errc::invalid_argument), std::move(message));
}

std::string string_field(const JsonValue& object, std::string_view key) {
    const JsonValue* value = object.get(key);
    if (value && value->is_string()) {
        return value->as_string();
    }
    return {};
}

} // anonymous namespace

expected<ClientSecrets, Error> parse_client_secrets(std::string_view json) {
    auto doc = streamgate::json::parse(json);
    if (!doc) {
        return unexpected(invalid_secrets("Invalid client secrets: " + std::string(doc.error().message())));
    }
    if (!doc->is_object()) {
        return unexpected(invalid_secrets("Invalid client secrets: not an object"));
    }

    const JsonValue* section = doc->get("installed");
    if (!section) {
        section = doc->get("web");
    }
    if (!section || !section->is_object()) {
        return unexpected(invalid_secrets("Client secrets have no installed or web section"));
    }

    ClientSecrets secrets;
    secrets.client_id = string_field(*section, "client_id");
    secrets.client_secret = string_field(*section, "client_secret");
    if (auto uri = string_field(*section, "token_uri"); !uri.empty()) {
        secrets.token_uri = std::move(uri);
    }
    if (secrets.client_id.empty() || secrets.client_secret.empty()) {
        return unexpected(invalid_secrets("Client secrets lack client_id or client_secret"));
    }
    return secrets;
}

RefreshTokenCredentials::RefreshTokenCredentials(ClientSecrets secrets, std::string refresh_token)
    : RefreshTokenCredentials(std::move(secrets), std::move(refresh_token),
                              [](const std::string& url, const std::string& body) {
                                  return http_post(url, body, "application/x-www-form-urlencoded");
                              }) {}

RefreshTokenCredentials::RefreshTokenCredentials(ClientSecrets secrets, std::string refresh_token,
                                                 TokenEndpoint endpoint)
    : secrets_(std::move(secrets)),
      refresh_token_(std::move(refresh_token)),
      endpoint_(std::move(endpoint)) {}

expected<std::string, Error> RefreshTokenCredentials::authorization() {
    std::lock_guard lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    if (access_token_.empty() || now >= expiry_ - refresh_margin) {
        auto refreshed = refresh();
        if (!refreshed) {
            return unexpected(refreshed.error());
        }
    }
    return "Bearer " + access_token_;
}

expected<void, Error> RefreshTokenCredentials::refresh() {
    std::string body = build_query({
        {"client_id", secrets_.client_id},
        {"client_secret", secrets_.client_secret},
        {"refresh_token", refresh_token_},
        {"grant_type", "refresh_token"},
    });

    auto response = endpoint_(secrets_.token_uri, body);
    if (!response) {
        return unexpected(unavailable("Token refresh failed: " + std::string(response.error().message())));
    }
    if (!response->ok()) {
        return unexpected(unavailable("Token endpoint answered " + std::to_string(response->status)));
    }

    auto doc = streamgate::json::parse(response->body);
    if (!doc || !doc->is_object()) {
        return unexpected(unavailable("Token endpoint returned invalid JSON"));
    }
    std::string token = string_field(*doc, "access_token");
    if (token.empty()) {
        return unexpected(unavailable("Token response has no access_token"));
    }

    int64_t expires_in = default_expires_in;
    if (const JsonValue* value = doc->get("expires_in"); value && value->is_number()) {
        expires_in = value->as_int();
    }

    access_token_ = std::move(token);
    expiry_ = std::chrono::steady_clock::now() + std::chrono::seconds(expires_in);
    return {};
}

} // namespace streamgate::drive
