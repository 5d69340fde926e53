#include "storage/s3/S3Controller.hpp"
#include "config/Config.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <algorithm>
#include <thread>
#include <utility>

using namespace sk::storage::s3;
using namespace sk::util;

ControllerOptions ControllerOptions::fromConfig(const config::Config& cfg) {
    ControllerOptions o;
    o.region = cfg.aws_s3.region;
    o.endpoint = cfg.aws_s3.endpoint;
    o.connect_timeout_s = cfg.aws_s3.client.connect_timeout_s;
    o.read_timeout_s = cfg.aws_s3.client.read_timeout_s;
    o.transfer_timeout_s = cfg.storage_download.timeout;
    o.retries = cfg.storage_download.retries;
    o.retry_delay_s = cfg.storage_download.retry_delay_s;
    o.retry_backoff = cfg.storage_download.retry_backoff;
    return o;
}

S3Controller::S3Controller(Credentials creds, ControllerOptions options)
    : creds_(std::move(creds)), opts_(std::move(options)) {
    if (creds_.access_key.empty() || creds_.secret_access_key.empty())
        throw std::invalid_argument("S3Controller requires an access key and a secret access key");
    if (opts_.region.empty()) throw std::invalid_argument("S3Controller requires a region");

    endpoint_ = opts_.endpoint.empty() ? fmt::format("https://s3.{}.amazonaws.com", opts_.region) : opts_.endpoint;
    while (endpoint_.ends_with('/')) endpoint_.pop_back();

    const auto schemeEnd = endpoint_.find("//");
    host_ = schemeEnd == std::string::npos ? endpoint_ : endpoint_.substr(schemeEnd + 2);

    ensureCurlGlobalInit();
}

S3Controller::~S3Controller() = default;

std::chrono::seconds S3Controller::retryDelay(const unsigned int attempt) const {
    uint64_t delay = opts_.retry_delay_s;
    for (unsigned int i = 0; i < attempt; ++i) delay *= std::max(1u, opts_.retry_backoff);
    return std::chrono::seconds(delay);
}

std::map<std::string, std::string> S3Controller::buildHeaderMap(const std::string& payloadHash) const {
    std::map<std::string, std::string> hdrs{
        {"host", host_},
        {"x-amz-content-sha256", payloadHash},
        {"x-amz-date", getCurrentTimestamp()}
    };
    if (!creds_.session_token.empty()) hdrs.emplace("x-amz-security-token", creds_.session_token);
    return hdrs;
}

SList S3Controller::makeSigHeaders(const std::string& method,
                                   const std::string& canonical,
                                   const std::string& payloadHash) const {
    const auto base = buildHeaderMap(payloadHash);
    const auto auth = buildAuthorizationHeader(creds_, opts_.region, method, canonical, base, payloadHash);

    SList out;
    out.add("Authorization: " + auth);
    for (const auto& [k, v] : base) out.add(k + ": " + v);
    return out;
}

S3Controller::RequestPaths S3Controller::constructPaths(const std::string& bucket, const std::string& key) const {
    const CurlEasy escaper;
    auto canonicalPath = "/" + bucket + "/" + escapeKeyPreserveSlashes(escaper, key);
    auto url = endpoint_ + canonicalPath;
    return {std::move(canonicalPath), std::move(url)};
}

void S3Controller::applyConnectionOptions(CURL* h) const {
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(opts_.connect_timeout_s));
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, static_cast<long>(opts_.read_timeout_s));
}

HttpResponse S3Controller::withRetries(const char* op, const std::string& bucket, const std::string& key,
                                       const std::function<HttpResponse()>& attempt) const {
    for (unsigned int n = 0;; ++n) {
        HttpResponse resp = attempt();
        if (resp.ok()) return resp;

        if (!isRetryable(resp) || n >= opts_.retries) return resp;

        const auto delay = retryDelay(n);
        log::Registry::cloud()->warn("[S3Controller] {} s3://{}/{} failed (CURL={} HTTP={}), retry {}/{} in {}s",
                                     op, bucket, key, static_cast<int>(resp.curl), resp.http,
                                     n + 1, opts_.retries, delay.count());
        std::this_thread::sleep_for(delay);
    }
}

bool S3Controller::isRetryable(const HttpResponse& resp) {
    if (resp.ok()) return false;
    return resp.curl != CURLE_OK || resp.http == 429 || resp.http / 100 == 5;
}

ClientError S3Controller::toClientError(const HttpResponse& resp, const char* op,
                                        const std::string& bucket, const std::string& key) {
    if (resp.curl != CURLE_OK)
        return {ClientError::REQUEST_ERROR, 0,
                fmt::format("{} s3://{}/{}: {}", op, bucket, key, curl_easy_strerror(resp.curl))};

    auto code = extractErrorCode(resp.body).value_or(std::to_string(resp.http));
    return {std::move(code), resp.http, fmt::format("{} s3://{}/{}", op, bucket, key)};
}

void S3Controller::raise(const HttpResponse& resp, const char* op,
                         const std::string& bucket, const std::string& key) const {
    const auto err = toClientError(resp, op, bucket, key);

    if (resp.curl != CURLE_OK)
        log::Registry::cloud()->error("[S3Controller] {} s3://{}/{} failed: CURL={} ({})",
                                      op, bucket, key, static_cast<int>(resp.curl), curl_easy_strerror(resp.curl));
    else if (err.notFound())
        log::Registry::cloud()->debug("[S3Controller] {} s3://{}/{}: not found", op, bucket, key);
    else
        log::Registry::cloud()->error("[S3Controller] {} s3://{}/{} failed: HTTP={} Code={} Response:\n{}",
                                      op, bucket, key, resp.http, err.code(), resp.body);
    throw err;
}
