#include "storage/s3/S3Controller.hpp"

using namespace sk::storage::s3;
using namespace sk::util;

void S3Controller::headObject(const std::string& bucket, const std::string& key) const {
    const auto paths = constructPaths(bucket, key);
    const HttpResponse resp = withRetries("HEAD", bucket, key, [&] {
        const SList hdrs = makeSigHeaders("HEAD", paths.canonical, "UNSIGNED-PAYLOAD");

        return performCurl([&](CURL* h) {
            applyConnectionOptions(h);
            curl_easy_setopt(h, CURLOPT_URL, paths.url.c_str());
            curl_easy_setopt(h, CURLOPT_NOBODY, 1L);            // HEAD request
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        });
    });

    if (!resp.ok()) raise(resp, "HEAD", bucket, key);
}
