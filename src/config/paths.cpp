#include "config/paths.hpp"

#include <cstdlib>
#include <optional>

namespace sk::paths {

namespace {

std::optional<std::filesystem::path> configOverride;
std::optional<std::filesystem::path> logOverride;

std::filesystem::path fromEnvOr(const char* var, const std::filesystem::path& def) {
    if (const char* v = std::getenv(var); v && *v) return {v};
    return def;
}

}

std::filesystem::path getConfigPath() {
    if (configOverride) return *configOverride;
    return fromEnvOr("SKEIN_CONFIG_PATH", "/etc/skein/config.yaml");
}

std::filesystem::path getLogPath() {
    if (logOverride) return *logOverride;
    return fromEnvOr("SKEIN_LOG_PATH", "/var/log/skein");
}

void setConfigPathForTesting(const std::filesystem::path& path) { configOverride = path; }

void setLogPathForTesting() { logOverride = std::filesystem::temp_directory_path() / "skein_test_logs"; }

}
