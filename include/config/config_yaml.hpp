#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sk::config;

inline std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<S3ClientConfig> {
    static Node encode(const S3ClientConfig& rhs) {
        Node node;
        node["max_pool_connections"] = rhs.max_pool_connections;
        node["read_timeout_s"] = rhs.read_timeout_s;
        node["connect_timeout_s"] = rhs.connect_timeout_s;
        return node;
    }

    static bool decode(const Node& node, S3ClientConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_pool_connections = node["max_pool_connections"].as<unsigned int>(10);
        rhs.read_timeout_s = node["read_timeout_s"].as<unsigned int>(140);
        rhs.connect_timeout_s = node["connect_timeout_s"].as<unsigned int>(140);
        return true;
    }
};

template<>
struct convert<AwsS3Config> {
    static Node encode(const AwsS3Config& rhs) {
        Node node;
        node["s3_datasets_path"] = rhs.s3_datasets_path;
        node["region"] = rhs.region;
        node["endpoint"] = rhs.endpoint;
        node["store_concatenated_bytes_files_in_dataset"] = rhs.store_concatenated_bytes_files_in_dataset;
        node["client_config"] = rhs.client;
        return node;
    }

    static bool decode(const Node& node, AwsS3Config& rhs) {
        if (!node.IsMap()) return false;
        rhs.s3_datasets_path = node["s3_datasets_path"].as<std::string>();
        rhs.region = node["region"].as<std::string>("us-east-1");
        rhs.endpoint = node["endpoint"].as<std::string>("");
        rhs.store_concatenated_bytes_files_in_dataset =
            node["store_concatenated_bytes_files_in_dataset"].as<bool>(false);
        if (node["client_config"]) rhs.client = node["client_config"].as<S3ClientConfig>();
        return true;
    }
};

template<>
struct convert<DynamoDBConfig> {
    static Node encode(const DynamoDBConfig& rhs) {
        Node node;
        node["table_name"] = rhs.table_name;
        node["region"] = rhs.region;
        return node;
    }

    static bool decode(const Node& node, DynamoDBConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.table_name = node["table_name"].as<std::string>("");
        rhs.region = node["region"].as<std::string>("us-west-2");
        return true;
    }
};

template<>
struct convert<StorageDownloadConfig> {
    static Node encode(const StorageDownloadConfig& rhs) {
        Node node;
        node["retries"] = rhs.retries;
        node["timeout"] = rhs.timeout;
        node["retry_backoff"] = rhs.retry_backoff;
        node["retry_delay_s"] = rhs.retry_delay_s;
        return node;
    }

    static bool decode(const Node& node, StorageDownloadConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.retries = node["retries"].as<unsigned int>(3);
        rhs.timeout = node["timeout"].as<unsigned int>(150);
        rhs.retry_backoff = node["retry_backoff"].as<unsigned int>(5);
        rhs.retry_delay_s = node["retry_delay_s"].as<unsigned int>(4);
        return true;
    }
};

template<>
struct convert<FilesystemConfig> {
    static Node encode(const FilesystemConfig& rhs) {
        Node node;
        node["prefix_replace_path"] = rhs.prefix_replace_path;
        return node;
    }

    static bool decode(const Node& node, FilesystemConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.prefix_replace_path = node["prefix_replace_path"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["skein"]   = to_std_string(spdlog::level::to_string_view(rhs.skein));
        node["storage"] = to_std_string(spdlog::level::to_string_view(rhs.storage));
        node["cloud"]   = to_std_string(spdlog::level::to_string_view(rhs.cloud));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.skein = spdlog::level::from_str(node["skein"].as<std::string>("info"));
        rhs.storage = spdlog::level::from_str(node["storage"].as<std::string>("warn"));
        rhs.cloud = spdlog::level::from_str(node["cloud"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

} // namespace YAML
