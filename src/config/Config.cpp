#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace sk::config {

namespace {

template <typename T>
void decodeSection(const YAML::Node& root, const std::string& key, T& out, const bool required = false) {
    const auto node = root[key];
    if (!node) {
        if (required) throw std::runtime_error("Missing required config section: " + key);
        return;
    }
    if (!YAML::convert<T>::decode(node, out))
        throw std::runtime_error("Config section '" + key + "' must be a map");
}

Config fromYamlRoot(const YAML::Node& root) {
    Config cfg;
    decodeSection(root, "aws_s3_config", cfg.aws_s3, true);
    decodeSection(root, "dynamodb_config", cfg.dynamodb);
    decodeSection(root, "storage_download_config", cfg.storage_download);
    decodeSection(root, "filesystem_config", cfg.filesystem);
    decodeSection(root, "logging", cfg.logging);
    return cfg;
}

spdlog::level::level_enum levelOr(const nlohmann::json& j, const char* key, const spdlog::level::level_enum def) {
    if (!j.contains(key)) return def;
    return spdlog::level::from_str(j.at(key).get<std::string>());
}

std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

}

Config loadConfig(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("Failed to open config file: " + path.string());

    std::stringstream buffer;
    buffer << in.rdbuf();

    if (path.extension() == ".json") return loadConfigFromJson(buffer.str());
    return loadConfigFromYaml(buffer.str());
}

Config loadConfigFromYaml(const std::string& yaml) {
    return fromYamlRoot(YAML::Load(yaml));
}

Config loadConfigFromJson(const std::string& json) {
    return nlohmann::json::parse(json).get<Config>();
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"aws_s3_config", c.aws_s3},
        {"dynamodb_config", c.dynamodb},
        {"storage_download_config", c.storage_download},
        {"filesystem_config", c.filesystem},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    j.at("aws_s3_config").get_to(c.aws_s3);
    if (j.contains("dynamodb_config")) j.at("dynamodb_config").get_to(c.dynamodb);
    if (j.contains("storage_download_config")) j.at("storage_download_config").get_to(c.storage_download);
    if (j.contains("filesystem_config")) j.at("filesystem_config").get_to(c.filesystem);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

void to_json(nlohmann::json& j, const S3ClientConfig& c) {
    j = {
        {"max_pool_connections", c.max_pool_connections},
        {"read_timeout_s", c.read_timeout_s},
        {"connect_timeout_s", c.connect_timeout_s}
    };
}

void from_json(const nlohmann::json& j, S3ClientConfig& c) {
    c.max_pool_connections = j.value("max_pool_connections", 10u);
    c.read_timeout_s = j.value("read_timeout_s", 140u);
    c.connect_timeout_s = j.value("connect_timeout_s", 140u);
}

void to_json(nlohmann::json& j, const AwsS3Config& c) {
    j = {
        {"s3_datasets_path", c.s3_datasets_path},
        {"region", c.region},
        {"endpoint", c.endpoint},
        {"store_concatenated_bytes_files_in_dataset", c.store_concatenated_bytes_files_in_dataset},
        {"client_config", c.client}
    };
}

void from_json(const nlohmann::json& j, AwsS3Config& c) {
    j.at("s3_datasets_path").get_to(c.s3_datasets_path);
    c.region = j.value("region", "us-east-1");
    c.endpoint = j.value("endpoint", "");
    c.store_concatenated_bytes_files_in_dataset = j.value("store_concatenated_bytes_files_in_dataset", false);
    if (j.contains("client_config")) j.at("client_config").get_to(c.client);
}

void to_json(nlohmann::json& j, const DynamoDBConfig& c) {
    j = {
        {"table_name", c.table_name},
        {"region", c.region}
    };
}

void from_json(const nlohmann::json& j, DynamoDBConfig& c) {
    c.table_name = j.value("table_name", "");
    c.region = j.value("region", "us-west-2");
}

void to_json(nlohmann::json& j, const StorageDownloadConfig& c) {
    j = {
        {"retries", c.retries},
        {"timeout", c.timeout},
        {"retry_backoff", c.retry_backoff},
        {"retry_delay_s", c.retry_delay_s}
    };
}

void from_json(const nlohmann::json& j, StorageDownloadConfig& c) {
    c.retries = j.value("retries", 3u);
    c.timeout = j.value("timeout", 150u);
    c.retry_backoff = j.value("retry_backoff", 5u);
    c.retry_delay_s = j.value("retry_delay_s", 4u);
}

void to_json(nlohmann::json& j, const FilesystemConfig& c) {
    j = {{"prefix_replace_path", c.prefix_replace_path}};
}

void from_json(const nlohmann::json& j, FilesystemConfig& c) {
    c.prefix_replace_path = j.value("prefix_replace_path", "");
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"skein", levelName(c.skein)},
        {"storage", levelName(c.storage)},
        {"cloud", levelName(c.cloud)}
    };
}

void from_json(const nlohmann::json& j, SubsystemLogLevelsConfig& c) {
    c.skein = levelOr(j, "skein", spdlog::level::info);
    c.storage = levelOr(j, "storage", spdlog::level::warn);
    c.cloud = levelOr(j, "cloud", spdlog::level::warn);
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void from_json(const nlohmann::json& j, LogLevelsConfig& c) {
    c.console_log_level = levelOr(j, "console_log_level", spdlog::level::info);
    c.file_log_level = levelOr(j, "file_log_level", spdlog::level::warn);
    if (j.contains("subsystem_levels")) j.at("subsystem_levels").get_to(c.subsystem_levels);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {{"log_levels", c.levels}};
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_levels")) j.at("log_levels").get_to(c.levels);
}

} // namespace sk::config
