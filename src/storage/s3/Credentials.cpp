#include "storage/s3/Credentials.hpp"

#include <cstdlib>
#include <utility>

namespace sk::storage::s3 {

Credentials::Credentials(std::string accessKey, std::string secretAccessKey, std::string sessionToken)
    : access_key(std::move(accessKey)),
      secret_access_key(std::move(secretAccessKey)),
      session_token(std::move(sessionToken)) {}

std::optional<Credentials> Credentials::fromEnvironment() {
    const char* access = std::getenv("AWS_ACCESS_KEY_ID");
    const char* secret = std::getenv("AWS_SECRET_ACCESS_KEY");
    if (!access || !secret || !*access || !*secret) return std::nullopt;

    const char* token = std::getenv("AWS_SESSION_TOKEN");
    return Credentials{access, secret, token ? token : ""};
}

}
