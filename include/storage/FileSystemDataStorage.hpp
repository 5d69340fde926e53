#pragma once

#include "storage/DataStorage.hpp"

namespace sk::storage {

// Backend for a local or mounted filesystem (including a mounted cache of the object store).
class FileSystemDataStorage final : public DataStorage {
public:
    FileSystemDataStorage() = default;
    ~FileSystemDataStorage() override = default;

    /// Copies `inputPath` to `localPrefix / inputPath.filename()`, creating `localPrefix` as needed.
    /// Throws std::filesystem::filesystem_error (no_such_file_or_directory) if the source is missing.
    [[nodiscard]] std::filesystem::path fetchFile(const std::string& inputPath,
                                                  const std::filesystem::path& localPrefix) const override;

    [[nodiscard]] StorageType type() const override { return StorageType::Local; }
};

}
