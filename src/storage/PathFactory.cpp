#include "storage/PathFactory.hpp"
#include "storage/s3/Address.hpp"
#include "config/ConfigRegistry.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <algorithm>
#include <stdexcept>

using namespace sk::storage;
using namespace sk::util;

S3PathFactory::S3PathFactory(const config::AwsS3Config& cfg, std::string prefixReplacePath)
    : S3PathFactory(cfg.s3_datasets_path, cfg.store_concatenated_bytes_files_in_dataset,
                    std::move(prefixReplacePath)) {}

S3PathFactory::S3PathFactory(std::string prefixReplacePath)
    : S3PathFactory(config::ConfigRegistry::get().aws_s3,
                    prefixReplacePath.empty() ? config::ConfigRegistry::get().filesystem.prefix_replace_path
                                              : std::move(prefixReplacePath)) {}

S3PathFactory::S3PathFactory(std::string s3RootPath, const bool datasetScoped, std::string prefixReplacePath)
    : rootPath_(std::move(s3RootPath)),
      datasetScoped_(datasetScoped),
      prefixReplacePath_(std::move(prefixReplacePath)) {}

std::string S3PathFactory::getColumnConcatenatedBytesFilesPath(const std::optional<std::string>& datasetName,
                                                               const bool s3Prefix,
                                                               const std::optional<std::string>& cutPrefixOverride) const {
    if (datasetScoped_ && !datasetName)
        throw std::invalid_argument("dataset name required when dataset-scoped storage is enabled");

    const auto path = datasetScoped_
                          ? joinPath(rootPath_, *datasetName, COLUMN_CONCATENATED_FILES_DIR)
                          : joinPath(rootPath_, COLUMN_CONCATENATED_FILES_DIR);

    return finalize(path, s3Prefix, cutPrefixOverride);
}

std::string S3PathFactory::getColumnConcatenatedBytesS3PathFromUuid(const std::vector<uint8_t>& uuidBytes,
                                                                    const std::optional<std::string>& datasetName) const {
    boost::uuids::uuid id{};
    if (uuidBytes.size() != id.size())
        throw std::invalid_argument("column concatenated file id must be 16 bytes, got " +
                                    std::to_string(uuidBytes.size()));

    std::ranges::copy(uuidBytes, id.begin());
    return joinPath(getColumnConcatenatedBytesFilesPath(datasetName), boost::uuids::to_string(id));
}

std::string S3PathFactory::getDatasetAssetsPath(const model::DatasetID& id, const bool s3Prefix) const {
    return finalize(joinPath(datasetVersionRoot(id), "assets"), s3Prefix);
}

std::string S3PathFactory::getDatasetPartitionPath(const model::DatasetPartition& partition, const bool s3Prefix) const {
    return finalize(joinPath(datasetVersionRoot(partition.dataset_id), partition.partition + ".parquet"), s3Prefix);
}

std::string S3PathFactory::getDatasetPartitionMetadataPath(const model::DatasetPartition& partition,
                                                           const bool s3Prefix) const {
    return joinPath(getDatasetPartitionPath(partition, s3Prefix), "_metadata.json");
}

std::string S3PathFactory::getTemporaryRowFilesPath(const model::DatasetID& id, const bool s3Prefix) const {
    return finalize(joinPath(rootPath_, TEMP_FILES_DIR, joinPath(id.name, id.version)), s3Prefix);
}

std::string S3PathFactory::datasetVersionRoot(const model::DatasetID& id) const {
    return joinPath(rootPath_, id.name, id.version);
}

std::string S3PathFactory::finalize(const std::string& path, const bool s3Prefix,
                                    const std::optional<std::string>& cutPrefixOverride) const {
    if (s3Prefix && !cutPrefixOverride) return path;

    const std::string cut = cutPrefixOverride.value_or(std::string(s3::SCHEME));
    auto out = replacePrefix(path, cut, prefixReplacePath_);

    log::Registry::storage()->debug("[S3PathFactory] {} -> {} (cut '{}', replace '{}')",
                                    path, out, cut, prefixReplacePath_);
    return out;
}
