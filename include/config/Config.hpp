#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace sk::config {

struct S3ClientConfig {
    unsigned int max_pool_connections = 10;   // accepted for compatibility, S3Controller opens a handle per request
    unsigned int read_timeout_s = 140;
    unsigned int connect_timeout_s = 140;
};

struct AwsS3Config {
    std::string s3_datasets_path;
    std::string region = "us-east-1";
    std::string endpoint;  // empty -> https://s3.<region>.amazonaws.com
    bool store_concatenated_bytes_files_in_dataset = false;
    S3ClientConfig client;
};

// Carried for downstream consumers, not read by the storage layer
struct DynamoDBConfig {
    std::string table_name;
    std::string region = "us-west-2";
};

struct StorageDownloadConfig {
    unsigned int retries = 3;
    unsigned int timeout = 150;
    unsigned int retry_backoff = 5;
    unsigned int retry_delay_s = 4;
};

struct FilesystemConfig {
    std::string prefix_replace_path;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum skein   = spdlog::level::info;   // Startup, registry init
    spdlog::level::level_enum storage = spdlog::level::warn;   // Local copies, path rewrites
    spdlog::level::level_enum cloud   = spdlog::level::warn;   // S3 transport failures, not routine transfers
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
};

struct Config {
    AwsS3Config aws_s3;
    DynamoDBConfig dynamodb;
    StorageDownloadConfig storage_download;
    FilesystemConfig filesystem;

    LoggingConfig logging;
};

// Loads YAML, or JSON when the file extension is .json
Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromYaml(const std::string& yaml);
Config loadConfigFromJson(const std::string& json);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);
void to_json(nlohmann::json& j, const S3ClientConfig& c);
void from_json(const nlohmann::json& j, S3ClientConfig& c);
void to_json(nlohmann::json& j, const AwsS3Config& c);
void from_json(const nlohmann::json& j, AwsS3Config& c);
void to_json(nlohmann::json& j, const DynamoDBConfig& c);
void from_json(const nlohmann::json& j, DynamoDBConfig& c);
void to_json(nlohmann::json& j, const StorageDownloadConfig& c);
void from_json(const nlohmann::json& j, StorageDownloadConfig& c);
void to_json(nlohmann::json& j, const FilesystemConfig& c);
void from_json(const nlohmann::json& j, FilesystemConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void from_json(const nlohmann::json& j, LogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);

} // namespace sk::config
