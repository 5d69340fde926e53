#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"

#include <filesystem>
#include <stdexcept>

namespace sk::log {

void Registry::init() {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = paths::getLogPath();
    main_log_path_ = log_dir_ / "skein.log";

    namespace fs = std::filesystem;
    if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

    const auto& cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        main_log_path_.string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(
            name, spdlog::sinks_init_list{console_sink_, main_file_sink_});
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("skein",   sub_levels.skein);
    makeLogger("storage", sub_levels.storage);
    makeLogger("cloud",   sub_levels.cloud);

    initialized_ = true;
    skein()->info("[log::Registry] Initialized, writing to {}", main_log_path_.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    // Library code may run in a host that never calls init()
    if (!initialized_) return spdlog::default_logger();

    auto logger = spdlog::get(name);
    if (!logger) throw std::runtime_error("[log::Registry] Logger not found: " + name);
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}
