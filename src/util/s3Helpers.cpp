#include "util/s3Helpers.hpp"
#include "storage/s3/Credentials.hpp"

#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <sstream>
#include <iomanip>
#include <regex>
#include <mutex>
#include <stdexcept>

namespace sk::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            throw std::runtime_error("curl_global_init failed");
    });
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    std::ostringstream oss;
    for (const unsigned char c : hash) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, nullptr);
    return {reinterpret_cast<char*>(digest), SHA256_DIGEST_LENGTH};
}

std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data) {
    const auto raw = hmacSha256Raw(rawKey, data);
    std::ostringstream oss;
    for (const char c : raw) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(static_cast<unsigned char>(c));
    return oss.str();
}

std::string escapeKeyPreserveSlashes(CURL* curl, const std::string& key) {
    std::ostringstream out;
    size_t start = 0;
    while (true) {
        const auto slash = key.find('/', start);
        const auto seg = key.substr(start, slash == std::string::npos ? std::string::npos : slash - start);

        if (!seg.empty()) {
            char* esc = curl_easy_escape(curl, seg.c_str(), static_cast<int>(seg.length()));
            if (!esc) throw std::runtime_error("Failed to URL-escape S3 key segment: " + seg);
            out << esc;
            curl_free(esc);
        }

        if (slash == std::string::npos) break;
        out << '/';
        start = slash + 1;
    }
    return out.str();
}

size_t writeToString(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::optional<std::string> extractErrorCode(const std::string& responseBody) {
    static const std::regex codeRe("<Code>([^<]+)</Code>");
    std::smatch m;
    if (std::regex_search(responseBody, m, codeRe)) return m[1].str();
    return std::nullopt;
}

std::string buildAuthorizationHeader(const storage::s3::Credentials& creds,
                                     const std::string& region,
                                     const std::string& method,
                                     const std::string& fullPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     const std::string& canonicalQuery /* = "" */) {
    std::string canonicalPath;
    std::string effectiveQuery;

    // Parse fullPath only if canonicalQuery is not explicitly given
    if (canonicalQuery.empty()) {
        const auto qpos = fullPath.find('?');
        if (qpos == std::string::npos) {
            canonicalPath = fullPath;
        } else {
            canonicalPath = fullPath.substr(0, qpos);
            effectiveQuery = fullPath.substr(qpos + 1);
            if (effectiveQuery.find('=') == std::string::npos)
                effectiveQuery += "=";  // handle case like ?flag
        }
    } else {
        canonicalPath = fullPath;
        effectiveQuery = canonicalQuery;
    }

    const std::string service = "s3";
    const std::string algorithm = "AWS4-HMAC-SHA256";
    const std::string amzDate = headers.at("x-amz-date");
    const std::string dateStamp = amzDate.substr(0, 8); // YYYYMMDD

    // Header names are already lowercase; std::map keeps them sorted
    std::string canonicalHeaders, signedHeaders;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        canonicalHeaders += it->first + ":" + it->second + "\n";
        signedHeaders += it->first;
        if (std::next(it) != headers.end())
            signedHeaders += ";";
    }

    std::ostringstream canonicalRequestStream;
    canonicalRequestStream << method << "\n"
                           << canonicalPath << "\n"
                           << effectiveQuery << "\n"
                           << canonicalHeaders << "\n"
                           << signedHeaders << "\n"
                           << payloadHash;
    const std::string hashedCanonicalRequest = sha256Hex(canonicalRequestStream.str());

    const std::string credentialScope = dateStamp + "/" + region + "/" + service + "/aws4_request";
    std::ostringstream stringToSignStream;
    stringToSignStream << algorithm << "\n"
                       << amzDate << "\n"
                       << credentialScope << "\n"
                       << hashedCanonicalRequest;

    const std::string kDate    = hmacSha256Raw("AWS4" + creds.secret_access_key, dateStamp);
    const std::string kRegion  = hmacSha256Raw(kDate, region);
    const std::string kService = hmacSha256Raw(kRegion, service);
    const std::string kSigning = hmacSha256Raw(kService, "aws4_request");

    const std::string signature = hmacSha256HexFromRaw(kSigning, stringToSignStream.str());

    std::ostringstream authHeader;
    authHeader << algorithm << " "
               << "Credential=" << creds.access_key << "/" << credentialScope << ", "
               << "SignedHeaders=" << signedHeaders << ", "
               << "Signature=" << signature;

    return authHeader.str();
}

}
