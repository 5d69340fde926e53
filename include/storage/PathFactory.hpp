#pragma once

#include "storage/model/Dataset.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sk::config { struct AwsS3Config; }

namespace sk::storage {

/// Resolves the canonical object paths of dataset artifacts under the configured root.
/// Paths come back in URL form ("s3://bucket/...") unless s3Prefix is false, in which
/// case the scheme (or the cut prefix override) is replaced by the prefix replace path,
/// turning the address into a path on a locally mounted copy of the bucket.
/// No call performs I/O.
class S3PathFactory {
public:
    static constexpr const auto* COLUMN_CONCATENATED_FILES_DIR = "__COLUMN_CONCATENATED_FILES__";
    static constexpr const auto* TEMP_FILES_DIR = "__TEMP_FILES__";

    S3PathFactory(const config::AwsS3Config& cfg, std::string prefixReplacePath = {});

    // Reads aws_s3_config from the ConfigRegistry. An empty prefixReplacePath falls back
    // to filesystem_config.prefix_replace_path.
    explicit S3PathFactory(std::string prefixReplacePath = {});

    S3PathFactory(std::string s3RootPath, bool datasetScoped, std::string prefixReplacePath = {});

    /// <root>[/<datasetName>]/__COLUMN_CONCATENATED_FILES__
    /// datasetName is required when concatenated files are stored per dataset.
    /// cutPrefixOverride replaces the default "s3://" as the prefix stripped before the
    /// prefix replace path is joined on, and forces the rewrite even when s3Prefix is true.
    [[nodiscard]] std::string getColumnConcatenatedBytesFilesPath(
        const std::optional<std::string>& datasetName = std::nullopt,
        bool s3Prefix = true,
        const std::optional<std::string>& cutPrefixOverride = std::nullopt) const;

    [[nodiscard]] std::string getColumnConcatenatedBytesS3PathFromUuid(
        const std::vector<uint8_t>& uuidBytes,
        const std::optional<std::string>& datasetName = std::nullopt) const;

    [[nodiscard]] std::string getDatasetAssetsPath(const model::DatasetID& id, bool s3Prefix = true) const;
    [[nodiscard]] std::string getDatasetPartitionPath(const model::DatasetPartition& partition, bool s3Prefix = true) const;
    [[nodiscard]] std::string getDatasetPartitionMetadataPath(const model::DatasetPartition& partition, bool s3Prefix = true) const;
    [[nodiscard]] std::string getTemporaryRowFilesPath(const model::DatasetID& id, bool s3Prefix = true) const;

    [[nodiscard]] const std::string& rootPath() const { return rootPath_; }
    [[nodiscard]] const std::string& prefixReplacePath() const { return prefixReplacePath_; }
    [[nodiscard]] bool datasetScoped() const { return datasetScoped_; }

    bool operator==(const S3PathFactory&) const = default;

private:
    std::string rootPath_;
    bool datasetScoped_;
    std::string prefixReplacePath_;

    [[nodiscard]] std::string datasetVersionRoot(const model::DatasetID& id) const;

    [[nodiscard]] std::string finalize(const std::string& path, bool s3Prefix,
                                       const std::optional<std::string>& cutPrefixOverride = std::nullopt) const;
};

}
