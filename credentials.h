#ifndef CREDENTIALS_H
#define CREDENTIALS_H

#include <ctime>
#include <optional>
#include <string>

// Tokens expiring within this window are reported as Expiring.
static constexpr int kTokenExpiringSeconds = 5 * 60;

enum class CredentialStatus {
    Ok,
    Expiring,
    Expired,
    Missing,    // file absent or no accessToken
    Malformed,  // file is not valid JSON
};

// The access token is only held for a single fetch; never log or store it.
struct Credential {
    CredentialStatus status = CredentialStatus::Missing;
    std::string access_token;
    std::optional<time_t> expires_at;
};

// ~/.claude/.credentials.json, or $PINCH_CREDENTIALS when set
std::string default_credentials_path();

// Read the OAuth access token and classify its health at time now
Credential read_credential(const std::string& path, time_t now);

// Whether a fetch should be attempted with this credential
bool credential_usable(const Credential& c);

const char* credential_status_name(CredentialStatus status);

#endif // CREDENTIALS_H
