#pragma once

#include "storage/s3/Client.hpp"
#include "storage/s3/Credentials.hpp"
#include "util/curlWrappers.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <string>

namespace sk::config { struct Config; }

namespace sk::storage::s3 {

struct ControllerOptions {
    std::string region = "us-east-1";
    std::string endpoint;                 // empty -> https://s3.<region>.amazonaws.com

    unsigned int connect_timeout_s = 140;
    unsigned int read_timeout_s = 140;    // abort when no bytes move for this long
    unsigned int transfer_timeout_s = 0;  // whole-download limit, 0 disables

    unsigned int retries = 3;
    unsigned int retry_delay_s = 4;
    unsigned int retry_backoff = 5;

    [[nodiscard]] static ControllerOptions fromConfig(const config::Config& cfg);
};

// libcurl-backed S3 client. Requests are path-style and signed with SigV4.
// Every call uses its own easy handle, so one instance may be shared across threads.
// There is no connection pool; client_config.max_pool_connections is not used here.
class S3Controller final : public Client {
public:
    S3Controller(Credentials creds, ControllerOptions options);
    ~S3Controller() override;

    void headObject(const std::string& bucket, const std::string& key) const override;

    void putObject(const std::string& bucket, const std::string& key,
                   const std::vector<uint8_t>& body) const override;

    void uploadFile(const std::filesystem::path& filename,
                    const std::string& bucket, const std::string& key) const override;

    void downloadFile(const std::string& bucket, const std::string& key,
                      const std::filesystem::path& filename) const override;

    [[nodiscard]] std::vector<uint8_t> getObject(const std::string& bucket, const std::string& key,
                                                 const std::optional<ByteRange>& range = std::nullopt) const override;

    [[nodiscard]] const ControllerOptions& options() const { return opts_; }
    [[nodiscard]] const std::string& endpoint() const { return endpoint_; }

    // Delay before retry number `attempt` (0-based): retry_delay_s * retry_backoff^attempt
    [[nodiscard]] std::chrono::seconds retryDelay(unsigned int attempt) const;

    // Connection failures, 429 and 5xx. Any other 4xx is final.
    [[nodiscard]] static bool isRetryable(const util::HttpResponse& resp);

    /// Maps a failed response to the error raised for it. The code comes from the
    /// <Code> element of the body, or is the status number for body-less responses
    /// such as HEAD. Connection failures get ClientError::REQUEST_ERROR and status 0.
    [[nodiscard]] static ClientError toClientError(const util::HttpResponse& resp, const char* op,
                                                   const std::string& bucket, const std::string& key);

private:
    Credentials creds_;
    ControllerOptions opts_;
    std::string endpoint_;
    std::string host_;

    [[nodiscard]] std::map<std::string, std::string> buildHeaderMap(const std::string& payloadHash) const;

    struct RequestPaths {
        std::string canonical;   // signed path, "/bucket/escaped/key"
        std::string url;
    };

    [[nodiscard]] RequestPaths constructPaths(const std::string& bucket, const std::string& key) const;

    [[nodiscard]] util::SList makeSigHeaders(const std::string& method,
                                             const std::string& canonical,
                                             const std::string& payloadHash) const;

    void applyConnectionOptions(CURL* h) const;

    // Re-runs `attempt` on connection failures, 429 and 5xx, up to opts_.retries extra times
    util::HttpResponse withRetries(const char* op, const std::string& bucket, const std::string& key,
                                   const std::function<util::HttpResponse()>& attempt) const;

    [[noreturn]] void raise(const util::HttpResponse& resp, const char* op,
                            const std::string& bucket, const std::string& key) const;
};

}
