#include "storage/s3/S3Controller.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <system_error>

using namespace sk::storage::s3;
using namespace sk::util;

namespace fs = std::filesystem;

void S3Controller::uploadFile(const fs::path& filename, const std::string& bucket, const std::string& key) const {
    std::ifstream fin(filename, std::ios::binary);
    if (!fin) throw std::runtime_error("Failed to open file for upload: " + filename.string());

    const auto sz = static_cast<curl_off_t>(fs::file_size(filename));

    const auto paths = constructPaths(bucket, key);
    const HttpResponse resp = withRetries("PUT", bucket, key, [&] {
        fin.clear();
        fin.seekg(0);

        // Streamed body, so the payload is not hashed up front
        SList hdrs = makeSigHeaders("PUT", paths.canonical, "UNSIGNED-PAYLOAD");
        hdrs.add("Content-Type: application/octet-stream");
        hdrs.add("Expect:");

        return performCurl([&](CURL* h) {
            applyConnectionOptions(h);
            curl_easy_setopt(h, CURLOPT_URL, paths.url.c_str());
            curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
            curl_easy_setopt(h, CURLOPT_READDATA, &fin);
            curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, sz);
            curl_easy_setopt(h, CURLOPT_READFUNCTION,
                +[](char* buf, const size_t size, const size_t nm, void* ud) -> size_t {
                    auto* fp = static_cast<std::ifstream*>(ud);
                    fp->read(buf, static_cast<std::streamsize>(size * nm));
                    return static_cast<size_t>(fp->gcount());
                });
        });
    });

    if (!resp.ok()) raise(resp, "PUT", bucket, key);

    log::Registry::cloud()->debug("[S3Controller] Uploaded {} ({} bytes) to s3://{}/{}",
                                  filename.string(), static_cast<int64_t>(sz), bucket, key);
}

namespace {

struct DownloadCtx {
    CURL* handle{nullptr};
    std::ofstream* out{nullptr};
    std::string errorBody;
};

size_t writeDownloadChunk(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* ctx = static_cast<DownloadCtx*>(userdata);
    const size_t n = size * nmemb;

    long http = 0;
    curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &http);

    // Error responses carry an XML body that must not end up in the target file
    if (http / 100 != 2) {
        ctx->errorBody.append(ptr, n);
        return n;
    }

    ctx->out->write(ptr, static_cast<std::streamsize>(n));
    return ctx->out->good() ? n : 0;
}

}

void S3Controller::downloadFile(const std::string& bucket, const std::string& key, const fs::path& filename) const {
    const auto paths = constructPaths(bucket, key);
    const HttpResponse resp = withRetries("GET", bucket, key, [&] {
        std::ofstream file(filename, std::ios::binary | std::ios::trunc);
        if (!file) throw std::runtime_error("Failed to open output file for S3 download: " + filename.string());

        const SList hdrs = makeSigHeaders("GET", paths.canonical, "UNSIGNED-PAYLOAD");

        DownloadCtx ctx;
        ctx.out = &file;

        HttpResponse r = performCurl([&](CURL* h) {
            ctx.handle = h;
            applyConnectionOptions(h);
            if (opts_.transfer_timeout_s > 0)
                curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(opts_.transfer_timeout_s));
            curl_easy_setopt(h, CURLOPT_URL, paths.url.c_str());
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
            curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, writeDownloadChunk);
            curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
        });

        file.close();
        if (r.ok() && file.fail())
            throw std::runtime_error("Failed to write S3 download to: " + filename.string());

        r.body = std::move(ctx.errorBody);
        return r;
    });

    if (!resp.ok()) {
        std::error_code ec;
        fs::remove(filename, ec);
        if (ec) log::Registry::cloud()->warn("[S3Controller] Could not remove partial download {}: {}",
                                             filename.string(), ec.message());
        raise(resp, "GET", bucket, key);
    }
}
