#include "storage/s3/S3Controller.hpp"
#include "util/s3Helpers.hpp"
#include "log/Registry.hpp"

#include <cstring>
#include <fmt/format.h>

using namespace sk::storage::s3;
using namespace sk::util;

void S3Controller::putObject(const std::string& bucket, const std::string& key,
                             const std::vector<uint8_t>& body) const {
    log::Registry::cloud()->debug("[S3Controller] Uploading buffer to s3://{}/{}, buffer_size: {}",
                                  bucket, key, body.size());

    // Hash the raw bytes for SigV4
    const std::string payloadHash = sha256Hex(std::string(body.begin(), body.end()));

    struct ReadCtx {
        const uint8_t* data{nullptr};
        size_t size{0};
        size_t off{0};
    } ctx{ body.data(), body.size(), 0 };

    const auto paths = constructPaths(bucket, key);
    const HttpResponse resp = withRetries("PUT", bucket, key, [&] {
        ctx.off = 0;


        SList hdrs = makeSigHeaders("PUT", paths.canonical, payloadHash);
        hdrs.add("Content-Type: application/octet-stream");
        // avoid Expect: 100-continue stalls on small uploads
        hdrs.add("Expect:");

        return performCurl([&](CURL* h) {
            applyConnectionOptions(h);
            curl_easy_setopt(h, CURLOPT_URL, paths.url.c_str());
            curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
            curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(ctx.size));
            curl_easy_setopt(h, CURLOPT_READDATA, &ctx);
            curl_easy_setopt(h, CURLOPT_READFUNCTION,
                +[](char* out, size_t size, size_t nmemb, void* userdata) -> size_t {
                    auto* c = static_cast<ReadCtx*>(userdata);
                    if (!c || !c->data) return 0;

                    const size_t max_bytes = size * nmemb;
                    const size_t remaining = (c->off < c->size) ? (c->size - c->off) : 0;
                    const size_t to_copy = (remaining < max_bytes) ? remaining : max_bytes;

                    if (to_copy) {
                        std::memcpy(out, c->data + c->off, to_copy);
                        c->off += to_copy;
                    }
                    return to_copy; // 0 signals EOF
                });

            // Support rewinds (auth retries, redirects)
            curl_easy_setopt(h, CURLOPT_SEEKDATA, &ctx);
            curl_easy_setopt(h, CURLOPT_SEEKFUNCTION,
                +[](void* userdata, curl_off_t offset, int origin) -> int {
                    auto* c = static_cast<ReadCtx*>(userdata);
                    if (!c || origin != SEEK_SET || offset < 0) return CURL_SEEKFUNC_CANTSEEK;
                    const auto off = static_cast<size_t>(offset);
                    if (off > c->size) return CURL_SEEKFUNC_CANTSEEK;
                    c->off = off;
                    return CURL_SEEKFUNC_OK;
                });
        });
    });

    if (!resp.ok()) raise(resp, "PUT", bucket, key);
}

std::vector<uint8_t> S3Controller::getObject(const std::string& bucket, const std::string& key,
                                             const std::optional<ByteRange>& range) const {
    const auto paths = constructPaths(bucket, key);
    const HttpResponse resp = withRetries("GET", bucket, key, [&] {

        SList hdrs = makeSigHeaders("GET", paths.canonical, "UNSIGNED-PAYLOAD");
        if (range) hdrs.add(fmt::format("Range: bytes={}-{}", range->first, range->last));

        return performCurl([&](CURL* h) {
            applyConnectionOptions(h);
            if (opts_.transfer_timeout_s > 0)
                curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(opts_.transfer_timeout_s));
            curl_easy_setopt(h, CURLOPT_URL, paths.url.c_str());
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        });
    });

    if (!resp.ok()) raise(resp, "GET", bucket, key);

    return {resp.body.begin(), resp.body.end()};
}
