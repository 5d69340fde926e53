#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace sk::storage {

enum class StorageType { Local, Cloud };

std::string to_string(StorageType type);

// Common contract of every storage backend. Upstream code holds a reference to
// this type and never to a concrete backend.
class DataStorage {
public:
    virtual ~DataStorage() = default;

    /// Materializes `inputPath` as a local file somewhere under `localPrefix` and
    /// returns the resulting path. Errors propagate; nothing is retried here.
    [[nodiscard]] virtual std::filesystem::path fetchFile(const std::string& inputPath,
                                                          const std::filesystem::path& localPrefix) const = 0;

    [[nodiscard]] virtual StorageType type() const = 0;
};

// Builds the backend for `type`; Cloud reads config::ConfigRegistry and the AWS_* environment.
std::shared_ptr<DataStorage> makeDataStorage(StorageType type);

}
