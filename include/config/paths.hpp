#pragma once

#include <filesystem>

namespace sk::paths {

// SKEIN_CONFIG_PATH, else /etc/skein/config.yaml
std::filesystem::path getConfigPath();

// SKEIN_LOG_PATH, else /var/log/skein
std::filesystem::path getLogPath();

void setConfigPathForTesting(const std::filesystem::path& path);
void setLogPathForTesting();

}
