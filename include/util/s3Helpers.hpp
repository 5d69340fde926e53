#pragma once

#include <map>
#include <optional>
#include <string>
#include <curl/curl.h>

namespace sk::storage::s3 {
struct Credentials;
}

namespace sk::util {

std::string sha256Hex(const std::string& data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data);

// Percent-encodes every segment of an object key, keeping '/' separators, empty
// segments and a trailing '/' exactly as given.
std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key);

size_t writeToString(char* ptr, size_t size, size_t nmemb, void* userdata);

// <Error><Code>NoSuchKey</Code>...</Error> -> "NoSuchKey"
[[nodiscard]] std::optional<std::string> extractErrorCode(const std::string& responseBody);

std::string buildAuthorizationHeader(const storage::s3::Credentials& creds,
                                     const std::string& region,
                                     const std::string& method, const std::string& fullPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash, const std::string& canonicalQuery = "");

void ensureCurlGlobalInit();

}
