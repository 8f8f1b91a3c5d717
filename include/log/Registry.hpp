#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace tf::config { struct LoggingConfig; }

namespace tf::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cfg);

    // Generic access by name; unknown subsystems get a console logger on first use
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> thumbforge() { return get("thumbforge"); }
    static std::shared_ptr<spdlog::logger> thumb()      { return get("thumb"); }
    static std::shared_ptr<spdlog::logger> scheduler()  { return get("scheduler"); }
    static std::shared_ptr<spdlog::logger> cache()      { return get("cache"); }
    static std::shared_ptr<spdlog::logger> db()         { return get("db"); }
    static std::shared_ptr<spdlog::logger> http()       { return get("http"); }
    static std::shared_ptr<spdlog::logger> preview()    { return get("preview"); }

    [[nodiscard]] static bool isInitialized();

    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline std::mutex mutex_;
    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static std::shared_ptr<spdlog::logger> makeDefault_(const std::string& name);
};

}
