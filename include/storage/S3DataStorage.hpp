#pragma once

#include "storage/DataStorage.hpp"
#include "storage/s3/Address.hpp"
#include "storage/s3/Client.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace sk::storage {

class S3DataStorage final : public DataStorage {
public:
    // Builds an S3Controller from ConfigRegistry and AWS_* credentials in the environment
    S3DataStorage();
    explicit S3DataStorage(std::shared_ptr<const s3::Client> client);
    ~S3DataStorage() override = default;

    [[nodiscard]] static s3::BucketKey bucketKeyFromS3Path(const std::string& s3Path) {
        return s3::bucketKeyFromS3Path(s3Path);
    }

    /// True if the object exists, false if the store reports it missing.
    /// Any other transport failure is rethrown.
    [[nodiscard]] bool checkExists(const std::string& s3Path) const;

    [[nodiscard]] std::vector<uint8_t> fetchObject(const std::string& s3Path) const;

    // Bytes [offset, offset + size) of the object
    [[nodiscard]] std::vector<uint8_t> fetchPartialObject(const std::string& s3Path, uint64_t offset, uint64_t size) const;

    /// Downloads the object to `localPrefix / key`, keeping the key's directory layout.
    /// An already present file is returned as-is since objects never change once written.
    /// A missing object surfaces as s3::ClientError, it is not turned into a sentinel.
    [[nodiscard]] std::filesystem::path fetchFile(const std::string& s3Path,
                                                  const std::filesystem::path& localPrefix) const override;

    void putObject(const std::vector<uint8_t>& objectBytes, const std::string& s3Path) const;
    void putFile(const std::filesystem::path& localPath, const std::string& s3Path) const;

    [[nodiscard]] StorageType type() const override { return StorageType::Cloud; }

    [[nodiscard]] const std::shared_ptr<const s3::Client>& client() const { return client_; }

private:
    std::shared_ptr<const s3::Client> client_;
};

}
