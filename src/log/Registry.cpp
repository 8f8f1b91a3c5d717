#include "log/Registry.hpp"
#include "config/Config.hpp"

#include <vector>

namespace tf::log {

void Registry::init(const config::LoggingConfig& cfg) {
    std::scoped_lock lock(mutex_);

    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cfg.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (cfg.file_enabled) {
        namespace fs = std::filesystem;
        log_dir_ = cfg.log_dir;
        main_log_path_ = log_dir_ / "thumbforge.log";
        if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cfg.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        // replace any logger handed out lazily before init
        spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub = cfg.levels.subsystem_levels;
    makeLogger("thumbforge", sub.thumbforge);
    makeLogger("thumb",      sub.thumb);
    makeLogger("scheduler",  sub.scheduler);
    makeLogger("cache",      sub.cache);
    makeLogger("db",         sub.db);
    makeLogger("http",       sub.http);
    makeLogger("preview",    sub.preview);

    initialized_ = true;
    spdlog::get("thumbforge")->info("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    if (auto logger = spdlog::get(name)) return logger;
    std::scoped_lock lock(mutex_);
    if (auto logger = spdlog::get(name)) return logger;
    return makeDefault_(name);
}

std::shared_ptr<spdlog::logger> Registry::makeDefault_(const std::string& name) {
    if (!console_sink_) {
        console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink_->set_level(spdlog::level::warn);
        console_sink_->set_pattern(LOG_FORMAT);
    }

    auto logger = std::make_shared<spdlog::logger>(name, console_sink_);
    logger->set_level(spdlog::level::warn);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

bool Registry::isInitialized() {
    std::scoped_lock lock(mutex_);
    return initialized_;
}

void Registry::shutdown() {
    std::scoped_lock lock(mutex_);
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::drop_all();
    console_sink_.reset();
    main_file_sink_.reset();
    initialized_ = false;
}

}
