#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

#include "streamgate/core/error.hpp"
#include "streamgate/drive/http.hpp"
#include "streamgate/util/expected.hpp"

namespace streamgate::drive {

inline constexpr std::string_view default_token_uri = "https://oauth2.googleapis.com/token";

// OAuth client fields of a Google client secrets document
struct ClientSecrets {
    std::string client_id;
    std::string client_secret;
    std::string token_uri{default_token_uri};
};

// Reads the "installed" section, or "web" when there is none
expected<ClientSecrets, Error> parse_client_secrets(std::string_view json);

// ============================================================================
// CredentialProvider - Supplies the Authorization header for Drive calls
// ============================================================================

class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    // "Bearer <token>". May block on a token refresh.
    virtual expected<std::string, Error> authorization() = 0;
};

// ============================================================================
// RefreshTokenCredentials - OAuth refresh-token grant with a cached token
// ============================================================================

class RefreshTokenCredentials : public CredentialProvider {
public:
    // POSTs a form body to a URL
    using TokenEndpoint = std::function<HttpResult(const std::string& url, const std::string& body)>;

    RefreshTokenCredentials(ClientSecrets secrets, std::string refresh_token);
    RefreshTokenCredentials(ClientSecrets secrets, std::string refresh_token, TokenEndpoint endpoint);

    expected<std::string, Error> authorization() override;

private:
    expected<void, Error> refresh();

    ClientSecrets secrets_;
    std::string refresh_token_;
    TokenEndpoint endpoint_;

    std::mutex mutex_;
    std::string access_token_;
    std::chrono::steady_clock::time_point expiry_{};
};

} // namespace streamgate::drive
