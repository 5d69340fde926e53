#pragma once

#include <optional>
#include <string>

namespace sk::storage::s3 {

struct Credentials {
    std::string access_key;
    std::string secret_access_key;
    std::string session_token;   // empty unless temporary credentials are in use

    Credentials() = default;
    Credentials(std::string accessKey, std::string secretAccessKey, std::string sessionToken = {});

    // AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY / AWS_SESSION_TOKEN
    [[nodiscard]] static std::optional<Credentials> fromEnvironment();
};

}
