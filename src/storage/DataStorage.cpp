#include "storage/DataStorage.hpp"
#include "storage/FileSystemDataStorage.hpp"
#include "storage/S3DataStorage.hpp"
#include "log/Registry.hpp"

#include <stdexcept>

namespace sk::storage {

std::string to_string(const StorageType type) {
    switch (type) {
        case StorageType::Local: return "local";
        case StorageType::Cloud: return "cloud";
    }
    return "unknown";
}

std::shared_ptr<DataStorage> makeDataStorage(const StorageType type) {
    log::Registry::skein()->debug("[DataStorage] Creating {} storage backend", to_string(type));
    switch (type) {
        case StorageType::Local: return std::make_shared<FileSystemDataStorage>();
        case StorageType::Cloud: return std::make_shared<S3DataStorage>();
    }
    throw std::invalid_argument("Unknown StorageType");
}

}
