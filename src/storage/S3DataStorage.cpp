#include "storage/S3DataStorage.hpp"
#include "storage/s3/S3Controller.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <stdexcept>
#include <system_error>

using namespace sk::storage;
using namespace sk::storage::s3;

namespace fs = std::filesystem;

namespace {

std::shared_ptr<const Client> makeConfiguredClient() {
    auto creds = Credentials::fromEnvironment();
    if (!creds) throw std::runtime_error("[S3DataStorage] AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY are not set");
    return std::make_shared<S3Controller>(std::move(*creds),
                                          ControllerOptions::fromConfig(sk::config::ConfigRegistry::get()));
}

// Maps an object key onto a file below localPrefix. Leading '/' are dropped; keys that
// name no file or resolve outside localPrefix are rejected.
fs::path localDestination(const fs::path& localPrefix, const std::string& key) {
    if (key.empty() || key.ends_with('/'))
        throw std::invalid_argument("Key '" + key + "' does not name a file");

    const auto first = key.find_first_not_of('/');
    const auto rel = fs::path(key.substr(first)).lexically_normal();

    if (rel.empty() || rel == "." || !rel.has_filename() || *rel.begin() == "..")
        throw std::invalid_argument("Key '" + key + "' resolves outside of " + localPrefix.string());

    return localPrefix / rel;
}

fs::path temporarySibling(const fs::path& dst) {
    thread_local boost::uuids::random_generator gen;
    auto tmp = dst;
    tmp += ".tmp-" + boost::uuids::to_string(gen());
    return tmp;
}

}

S3DataStorage::S3DataStorage() : S3DataStorage(makeConfiguredClient()) {}

S3DataStorage::S3DataStorage(std::shared_ptr<const Client> client) : client_(std::move(client)) {
    if (!client_) throw std::invalid_argument("S3DataStorage requires a client");
}

bool S3DataStorage::checkExists(const std::string& s3Path) const {
    const auto [bucket, key] = bucketKeyFromS3Path(s3Path);
    try {
        client_->headObject(bucket, key);
        return true;
    } catch (const ClientError& e) {
        if (e.notFound()) return false;
        log::Registry::cloud()->error("[S3DataStorage] checkExists failed for {}: {}", s3Path, e.what());
        throw;
    }
}

std::vector<uint8_t> S3DataStorage::fetchObject(const std::string& s3Path) const {
    const auto [bucket, key] = bucketKeyFromS3Path(s3Path);
    return client_->getObject(bucket, key);
}

std::vector<uint8_t> S3DataStorage::fetchPartialObject(const std::string& s3Path,
                                                       const uint64_t offset,
                                                       const uint64_t size) const {
    if (size == 0) throw std::invalid_argument("fetchPartialObject requires a non-zero size");
    const auto [bucket, key] = bucketKeyFromS3Path(s3Path);
    return client_->getObject(bucket, key, ByteRange{offset, offset + size - 1});
}

fs::path S3DataStorage::fetchFile(const std::string& s3Path, const fs::path& localPrefix) const {
    const auto [bucket, key] = bucketKeyFromS3Path(s3Path);
    const auto dst = localDestination(localPrefix, key);

    fs::create_directories(dst.parent_path());

    if (fs::is_regular_file(dst)) {
        log::Registry::cloud()->debug("[S3DataStorage] {} already present at {}", s3Path, dst.string());
        return dst;
    }

    // Download beside the target and rename, so a reader never sees a partial file
    const auto tmp = temporarySibling(dst);
    try {
        client_->downloadFile(bucket, key, tmp);
        fs::rename(tmp, dst);
    } catch (const std::exception& e) {
        std::error_code ec;
        fs::remove(tmp, ec);
        log::Registry::cloud()->error("[S3DataStorage] fetchFile failed for {}: {}", s3Path, e.what());
        throw;
    }

    return dst;
}

void S3DataStorage::putObject(const std::vector<uint8_t>& objectBytes, const std::string& s3Path) const {
    const auto [bucket, key] = bucketKeyFromS3Path(s3Path);
    client_->putObject(bucket, key, objectBytes);
}

void S3DataStorage::putFile(const fs::path& localPath, const std::string& s3Path) const {
    if (!fs::is_regular_file(localPath))
        throw fs::filesystem_error("Local file does not exist", localPath,
                                   std::make_error_code(std::errc::no_such_file_or_directory));

    const auto [bucket, key] = bucketKeyFromS3Path(s3Path);
    client_->uploadFile(localPath, bucket, key);
}
